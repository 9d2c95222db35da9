#include "session/session_builder.hpp"
#include "capabilities/capability_validator.hpp"
#include "protocol/endpoint_url.hpp"
#include "protocol/w3c_errors.hpp"
#include "utils/debug_log.hpp"

#include <stdexcept>
#include <utility>

namespace session_builder {

// Keys that would collide with the "capabilities" object of the payload.
static const char *const RESERVED_METADATA_KEYS[] = {"alwaysMatch", "firstMatch", "capabilities"};

SessionBuilder::SessionBuilder() : metadata_(json::object()) {}

void SessionBuilder::ensure_configurable(const char *operation) const {
    if (finalized_) {
        throw w3c_errors::ConfigurationConflictError(
            std::string(operation) + " called after the session plan was built");
    }
}

SessionBuilder &SessionBuilder::add_options(const capabilities::CapabilitySet &options) {
    return add_options(options.to_capability_map());
}

SessionBuilder &SessionBuilder::add_options(const capabilities::CapabilityMap &options) {
    ensure_configurable("add_options");

    capability_validator::ValidationResult validation = capability_validator::validate(options);
    if (!validation.success) {
        debug_log::log("session_builder", "add_options rejected: " + validation.error_message);
        throw w3c_errors::InvalidCapabilityError(validation.invalid_key, validation.error_message);
    }

    options_.push_back(options);
    debug_log::log("session_builder", "add_options: entry #" + std::to_string(options_.size()) +
                                          " with " + std::to_string(options.size()) + " capabilities");
    return *this;
}

SessionBuilder &SessionBuilder::set_capability(const std::string &key, const json &value) {
    ensure_configurable("set_capability");

    capability_validator::ValidationResult validation = capability_validator::validate_key(key);
    if (!validation.success) {
        debug_log::log("session_builder", "set_capability rejected: " + validation.error_message);
        throw w3c_errors::InvalidCapabilityError(validation.invalid_key, validation.error_message);
    }

    global_capabilities_.set_capability(key, value);
    debug_log::log("session_builder", "set_capability: " + key);
    return *this;
}

SessionBuilder &SessionBuilder::add_metadata(const std::string &key, const json &value) {
    ensure_configurable("add_metadata");

    for (const char *reserved : RESERVED_METADATA_KEYS) {
        if (key == reserved) {
            throw w3c_errors::ConfigurationConflictError(
                "Cannot use '" + key + "' as a metadata key; it is part of the capabilities object");
        }
    }

    metadata_[key] = value;
    debug_log::log("session_builder", "add_metadata: " + key);
    return *this;
}

void SessionBuilder::choose_target(execution_target::ExecutionTarget target) {
    if (execution_target::has_target(target_)) {
        throw w3c_errors::ConfigurationConflictError(
            "Execution target already chosen (" + execution_target::describe(target_) +
            "); cannot also use " + execution_target::describe(target));
    }
    target_ = std::move(target);
    debug_log::log("session_builder", "target: " + execution_target::describe(target_));
}

SessionBuilder &SessionBuilder::url(const std::string &remote_url) {
    ensure_configurable("url");

    execution_target::RemoteEndpoint remote;
    remote.url = endpoint_url::parse_endpoint_url(remote_url);
    choose_target(remote);
    return *this;
}

SessionBuilder &SessionBuilder::with_driver_service(std::shared_ptr<driver_service::DriverService> service) {
    ensure_configurable("with_driver_service");

    if (!service) {
        throw std::invalid_argument("Driver service must not be null");
    }
    choose_target(execution_target::LocalService{std::move(service)});
    return *this;
}

session_plan::Plan SessionBuilder::get_plan() {
    if (options_.empty()) {
        throw w3c_errors::SessionNotCreatedError(
            "At least one set of options must be added before building a session request");
    }

    finalized_ = true;
    debug_log::log("session_builder", "plan: " + std::to_string(options_.size()) + " firstMatch entries, " +
                                          std::to_string(global_capabilities_.size()) + " alwaysMatch capabilities, " +
                                          execution_target::describe(target_));
    return session_plan::Plan(target_, global_capabilities_, options_, metadata_);
}

session_plan::Plan SessionBuilder::build() {
    return get_plan();
}

} // namespace session_builder
