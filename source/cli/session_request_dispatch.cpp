#include "cli/session_request_dispatch.hpp"
#include "browser/browser_options.hpp"
#include "protocol/w3c_errors.hpp"
#include "session/driver_service.hpp"
#include "session/session_builder.hpp"
#include "utils/debug_log.hpp"

#include <cstdlib>
#include <functional>
#include <limits>
#include <memory>
#include <stdexcept>
#include <vector>

namespace session_request_dispatch {

std::string default_remote_url() {
    const char *value = std::getenv("WDSESSION_REMOTE_URL");
    if (value == nullptr) {
        return "";
    }
    return std::string(value);
}

// Options given by browser name use that browser's defaults.
static void add_named_browser(session_builder::SessionBuilder &builder, const std::string &browser_name) {
    if (browser_name == "chrome") {
        builder.add_options(browser_options::ChromeOptions());
    } else if (browser_name == "firefox") {
        builder.add_options(browser_options::FirefoxOptions());
    } else if (browser_name == "internet explorer") {
        builder.add_options(browser_options::InternetExplorerOptions());
    } else {
        throw std::invalid_argument("Unknown browser name in options: " + browser_name);
    }
}

static void apply_options(session_builder::SessionBuilder &builder, const json &options) {
    if (!options.is_array()) {
        throw std::invalid_argument("'options' must be an array");
    }
    for (const auto &entry : options) {
        if (entry.is_string()) {
            add_named_browser(builder, entry.get<std::string>());
        } else if (entry.is_object()) {
            builder.add_options(entry);
        } else {
            throw std::invalid_argument("Each entry of 'options' must be an object or a browser name");
        }
    }
}

static void apply_object(const json &request, const char *field,
                         const std::function<void(const std::string &, const json &)> &apply) {
    if (!request.contains(field)) {
        return;
    }
    const json &values = request[field];
    if (!values.is_object()) {
        throw std::invalid_argument("'" + std::string(field) + "' must be an object");
    }
    for (auto it = values.begin(); it != values.end(); ++it) {
        apply(it.key(), it.value());
    }
}

// Integer field checked against [minimum, maximum] before narrowing to int.
// minimum must not be negative.
static int read_bounded_int(const json &description, const char *field, int minimum, int maximum) {
    const json &value = description[field];
    bool in_range = false;
    if (value.is_number_unsigned()) {
        json::number_unsigned_t number = value.get<json::number_unsigned_t>();
        in_range = number >= static_cast<json::number_unsigned_t>(minimum) &&
                   number <= static_cast<json::number_unsigned_t>(maximum);
    } else if (value.is_number_integer()) {
        json::number_integer_t number = value.get<json::number_integer_t>();
        in_range = number >= minimum && number <= maximum;
    } else {
        throw std::invalid_argument("'driverService." + std::string(field) + "' must be an integer");
    }
    if (!in_range) {
        throw std::invalid_argument("'driverService." + std::string(field) + "' out of range " +
                                    std::to_string(minimum) + ".." + std::to_string(maximum) +
                                    ": " + value.dump());
    }
    return static_cast<int>(value.get<json::number_integer_t>());
}

static std::shared_ptr<driver_service::LocalDriverService> make_driver_service(const json &description) {
    if (!description.is_object() || !description.contains("executable") ||
        !description["executable"].is_string()) {
        throw std::invalid_argument("'driverService' needs a string 'executable'");
    }
    int port = driver_service::DEFAULT_DRIVER_PORT;
    if (description.contains("port")) {
        port = read_bounded_int(description, "port", 1, 65535);
    }
    std::vector<std::string> arguments;
    if (description.contains("args")) {
        arguments = description["args"].get<std::vector<std::string>>();
    }

    driver_service::LocalDriverService located = driver_service::create_default_service(
        description["executable"].get<std::string>(), port);
    auto service = std::make_shared<driver_service::LocalDriverService>(located.executable_path(), port, arguments);
    if (description.contains("pid")) {
        service->attach_process(read_bounded_int(description, "pid", 0, std::numeric_limits<int>::max()));
    }
    return service;
}

static json describe_target(const session_plan::Plan &plan) {
    json target;
    if (plan.is_using_driver_service()) {
        auto service = plan.get_driver_service();
        target["type"] = "local";
        target["url"] = service->get_url().to_string();
        target["running"] = service->is_running();
    } else if (plan.has_execution_target()) {
        target["type"] = "remote";
        target["url"] = plan.get_remote_host().original;
    } else {
        target["type"] = "none";
    }
    return target;
}

json dispatch_request(const json &request) {
    try {
        if (!request.is_object()) {
            throw std::invalid_argument("Session request must be a JSON object");
        }

        session_builder::SessionBuilder builder;

        if (request.contains("options")) {
            apply_options(builder, request["options"]);
        }
        apply_object(request, "capabilities", [&builder](const std::string &key, const json &value) {
            builder.set_capability(key, value);
        });
        apply_object(request, "metadata", [&builder](const std::string &key, const json &value) {
            builder.add_metadata(key, value);
        });

        if (request.contains("url")) {
            if (!request["url"].is_string()) {
                throw std::invalid_argument("'url' must be a string");
            }
            builder.url(request["url"].get<std::string>());
        }
        if (request.contains("driverService")) {
            builder.with_driver_service(make_driver_service(request["driverService"]));
        }
        if (!request.contains("url") && !request.contains("driverService")) {
            std::string fallback_url = default_remote_url();
            if (!fallback_url.empty()) {
                debug_log::log("dispatch", "no target in request, using WDSESSION_REMOTE_URL=" + fallback_url);
                builder.url(fallback_url);
            }
        }

        session_plan::Plan plan = builder.get_plan();

        json response;
        response["target"] = describe_target(plan);
        response["payload"] = plan.build_payload();
        return response;
    } catch (const w3c_errors::InvalidCapabilityError &error) {
        json data;
        data["key"] = error.key();
        return w3c_errors::build_error_payload(error.error_code(), error.what(), data);
    } catch (const w3c_errors::MalformedUrlError &error) {
        json data;
        data["url"] = error.url();
        return w3c_errors::build_error_payload(error.error_code(), error.what(), data);
    } catch (const w3c_errors::ConfigurationConflictError &error) {
        return w3c_errors::build_error_payload(error.error_code(), error.what());
    } catch (const w3c_errors::SessionNotCreatedError &error) {
        return w3c_errors::build_error_payload(error.error_code(), error.what());
    } catch (const std::invalid_argument &error) {
        return w3c_errors::build_error_payload(w3c_errors::INVALID_ARGUMENT, error.what());
    } catch (const json::exception &error) {
        // Wrong value types in the request (e.g. a string port).
        return w3c_errors::build_error_payload(w3c_errors::INVALID_ARGUMENT, error.what());
    } catch (const std::runtime_error &error) {
        return w3c_errors::build_error_payload(w3c_errors::SESSION_NOT_CREATED, error.what());
    }
}

json dispatch_raw_request(const std::string &raw_request) {
    json parsed_request;
    try {
        parsed_request = json::parse(raw_request);
    } catch (const json::parse_error &error) {
        return w3c_errors::build_error_payload(w3c_errors::INVALID_ARGUMENT,
                                               "Failed to parse request: " + std::string(error.what()));
    }
    return dispatch_request(parsed_request);
}

} // namespace session_request_dispatch
