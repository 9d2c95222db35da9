#ifndef WDSESSION_SESSION_PLAN_HPP
#define WDSESSION_SESSION_PLAN_HPP

// The immutable result of SessionBuilder::get_plan(): the execution target
// plus the capabilities and metadata of the new-session request.
//
// Payload shape:
//   { "capabilities": { "alwaysMatch": {...}, "firstMatch": [{...}, ...] },
//     <metadata keys> }
// alwaysMatch and firstMatch stay separate; the remote end merges them.

#include <nlohmann/json.hpp>
#include <memory>
#include <ostream>
#include <vector>

#include "capabilities/capability_map.hpp"
#include "protocol/endpoint_url.hpp"
#include "session/driver_service.hpp"
#include "session/execution_target.hpp"

namespace session_plan {

using json = nlohmann::json;

class Plan {
public:
    Plan(execution_target::ExecutionTarget target,
         capabilities::Capabilities always_match,
         std::vector<capabilities::CapabilityMap> first_match,
         json metadata);

    bool has_execution_target() const;

    bool is_using_driver_service() const;

    // Throws std::logic_error unless is_using_driver_service().
    std::shared_ptr<driver_service::DriverService> get_driver_service() const;

    // Throws std::logic_error unless a remote endpoint was chosen.
    const endpoint_url::EndpointUrl &get_remote_host() const;

    const execution_target::ExecutionTarget &target() const { return target_; }
    const capabilities::Capabilities &always_match() const { return always_match_; }
    const std::vector<capabilities::CapabilityMap> &first_match() const { return first_match_; }
    const json &metadata() const { return metadata_; }

    // alwaysMatch merged into each firstMatch entry, alwaysMatch winning.
    // With no entries, a single element equal to alwaysMatch.
    std::vector<capabilities::Capabilities> effective_capabilities() const;

    json build_payload() const;

    // Write build_payload() to sink. Throws w3c_errors::SerializationError
    // when the sink fails.
    void write_payload(std::ostream &sink) const;

private:
    execution_target::ExecutionTarget target_;
    capabilities::Capabilities always_match_;
    std::vector<capabilities::CapabilityMap> first_match_;
    json metadata_;
};

} // namespace session_plan

#endif // WDSESSION_SESSION_PLAN_HPP
