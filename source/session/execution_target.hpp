#ifndef WDSESSION_EXECUTION_TARGET_HPP
#define WDSESSION_EXECUTION_TARGET_HPP

// Where a new session is created: a remote endpoint or a local driver
// service. At most one of the two is ever chosen.

#include <memory>
#include <string>
#include <variant>

#include "protocol/endpoint_url.hpp"
#include "session/driver_service.hpp"

namespace execution_target {

struct RemoteEndpoint {
    endpoint_url::EndpointUrl url;
};

struct LocalService {
    std::shared_ptr<driver_service::DriverService> service;
};

// std::monostate means no target was chosen.
using ExecutionTarget = std::variant<std::monostate, RemoteEndpoint, LocalService>;

inline bool has_target(const ExecutionTarget &target) {
    return !std::holds_alternative<std::monostate>(target);
}

// Short description for logs and error messages.
inline std::string describe(const ExecutionTarget &target) {
    if (const auto *remote = std::get_if<RemoteEndpoint>(&target)) {
        return "remote endpoint " + remote->url.original;
    }
    if (const auto *local = std::get_if<LocalService>(&target)) {
        return "local driver service at " + local->service->get_url().to_string();
    }
    return "no target";
}

} // namespace execution_target

#endif // WDSESSION_EXECUTION_TARGET_HPP
