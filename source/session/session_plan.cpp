#include "session/session_plan.hpp"
#include "protocol/w3c_errors.hpp"
#include "utils/debug_log.hpp"

#include <stdexcept>
#include <utility>

namespace session_plan {

Plan::Plan(execution_target::ExecutionTarget target,
           capabilities::Capabilities always_match,
           std::vector<capabilities::CapabilityMap> first_match,
           json metadata)
    : target_(std::move(target)),
      always_match_(std::move(always_match)),
      first_match_(std::move(first_match)),
      metadata_(std::move(metadata)) {
    if (!metadata_.is_object()) {
        metadata_ = json::object();
    }
}

bool Plan::has_execution_target() const {
    return execution_target::has_target(target_);
}

bool Plan::is_using_driver_service() const {
    return std::holds_alternative<execution_target::LocalService>(target_);
}

std::shared_ptr<driver_service::DriverService> Plan::get_driver_service() const {
    const auto *local = std::get_if<execution_target::LocalService>(&target_);
    if (local == nullptr) {
        throw std::logic_error("Plan does not use a driver service (" +
                               execution_target::describe(target_) + ")");
    }
    return local->service;
}

const endpoint_url::EndpointUrl &Plan::get_remote_host() const {
    const auto *remote = std::get_if<execution_target::RemoteEndpoint>(&target_);
    if (remote == nullptr) {
        throw std::logic_error("Plan does not use a remote endpoint (" +
                               execution_target::describe(target_) + ")");
    }
    return remote->url;
}

std::vector<capabilities::Capabilities> Plan::effective_capabilities() const {
    std::vector<capabilities::Capabilities> effective;
    if (first_match_.empty()) {
        effective.push_back(always_match_);
        return effective;
    }
    effective.reserve(first_match_.size());
    for (const auto &entry : first_match_) {
        effective.push_back(always_match_.merge(capabilities::Capabilities(entry)));
    }
    return effective;
}

json Plan::build_payload() const {
    json payload = json::object();
    for (auto it = metadata_.begin(); it != metadata_.end(); ++it) {
        payload[it.key()] = it.value();
    }

    json first_match = json::array();
    for (const auto &entry : first_match_) {
        first_match.push_back(entry);
    }
    if (first_match.empty()) {
        first_match.push_back(json::object());
    }

    payload["capabilities"]["alwaysMatch"] = always_match_.to_capability_map();
    payload["capabilities"]["firstMatch"] = first_match;
    return payload;
}

void Plan::write_payload(std::ostream &sink) const {
    if (!sink.good()) {
        throw w3c_errors::SerializationError("Payload sink is not writable");
    }
    std::string encoded;
    try {
        encoded = build_payload().dump();
    } catch (const json::type_error &error) {
        // Invalid UTF-8 in a string value.
        throw w3c_errors::SerializationError("Failed to encode new-session payload: " +
                                             std::string(error.what()));
    }
    sink.write(encoded.data(), static_cast<std::streamsize>(encoded.size()));
    sink.flush();
    if (!sink.good()) {
        throw w3c_errors::SerializationError("Failed to write new-session payload (" +
                                             std::to_string(encoded.size()) + " bytes)");
    }
    debug_log::log("session_plan", "wrote payload, " + std::to_string(encoded.size()) + " bytes");
}

} // namespace session_plan
