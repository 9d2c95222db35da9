#ifndef WDSESSION_SESSION_BUILDER_HPP
#define WDSESSION_SESSION_BUILDER_HPP

// Builder for W3C new-session requests.
//
//   session_builder::SessionBuilder builder;
//   builder.add_options(browser_options::FirefoxOptions())
//          .add_options(browser_options::ChromeOptions())
//          .set_capability("se:cheese", "brie")
//          .url("http://localhost:4444/wd/hub");
//   session_plan::Plan plan = builder.get_plan();
//
// Each add_options() call becomes one firstMatch entry, in call order.
// set_capability() values go to alwaysMatch and therefore apply to every
// entry, whether it was added before or after the call.
//
// Every configuring call validates its input immediately and throws at the
// offending call; a rejected input is never partially applied.
//
// Not thread-safe. Callers sharing a builder must synchronize externally.

#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

#include "capabilities/capability_map.hpp"
#include "session/driver_service.hpp"
#include "session/execution_target.hpp"
#include "session/session_plan.hpp"

namespace session_builder {

using json = nlohmann::json;

class SessionBuilder {
public:
    SessionBuilder();

    // Throws w3c_errors::InvalidCapabilityError on the first non-W3C key.
    SessionBuilder &add_options(const capabilities::CapabilitySet &options);
    SessionBuilder &add_options(const capabilities::CapabilityMap &options);

    // Global capability, applied to all option entries. Overrides any value
    // an entry carries for the same key. A null value removes the override.
    // Throws w3c_errors::InvalidCapabilityError.
    SessionBuilder &set_capability(const std::string &key, const json &value);

    // Top-level payload entry. Throws w3c_errors::ConfigurationConflictError
    // for firstMatch, alwaysMatch and capabilities.
    SessionBuilder &add_metadata(const std::string &key, const json &value);

    // Create the session on a remote endpoint.
    // Throws w3c_errors::MalformedUrlError, or
    // w3c_errors::ConfigurationConflictError if a target was already chosen.
    SessionBuilder &url(const std::string &remote_url);

    // Create the session through a local driver service owned by the caller.
    // Throws std::invalid_argument for a null service, or
    // w3c_errors::ConfigurationConflictError if a target was already chosen.
    SessionBuilder &with_driver_service(std::shared_ptr<driver_service::DriverService> service);

    // Finalize. Throws w3c_errors::SessionNotCreatedError if no options were
    // added. After a successful call the builder accepts no further
    // configuration; calling get_plan() again yields an equivalent Plan.
    session_plan::Plan get_plan();

    // Same as get_plan().
    session_plan::Plan build();

    size_t options_count() const { return options_.size(); }
    bool is_finalized() const { return finalized_; }

private:
    void ensure_configurable(const char *operation) const;
    void choose_target(execution_target::ExecutionTarget target);

    std::vector<capabilities::CapabilityMap> options_;
    capabilities::Capabilities global_capabilities_;
    json metadata_;
    execution_target::ExecutionTarget target_;
    bool finalized_ = false;
};

} // namespace session_builder

#endif // WDSESSION_SESSION_BUILDER_HPP
