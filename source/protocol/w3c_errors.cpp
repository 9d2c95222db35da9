#include "protocol/w3c_errors.hpp"

namespace w3c_errors {

InvalidCapabilityError::InvalidCapabilityError(const std::string &capability_key, const std::string &message)
    : std::invalid_argument(message), capability_key_(capability_key) {}

ConfigurationConflictError::ConfigurationConflictError(const std::string &message)
    : std::invalid_argument(message) {}

MalformedUrlError::MalformedUrlError(const std::string &url, const std::string &reason)
    : std::invalid_argument("Malformed URL '" + url + "': " + reason), url_(url) {}

SessionNotCreatedError::SessionNotCreatedError(const std::string &message)
    : std::runtime_error(message) {}

SerializationError::SerializationError(const std::string &message)
    : std::runtime_error(message) {}

json build_error_payload(const std::string &error_code, const std::string &error_message) {
    json payload;
    payload["value"]["error"] = error_code;
    payload["value"]["message"] = error_message;
    payload["value"]["stacktrace"] = "";
    return payload;
}

json build_error_payload(const std::string &error_code, const std::string &error_message, const json &error_data) {
    json payload = build_error_payload(error_code, error_message);
    payload["value"]["data"] = error_data;
    return payload;
}

std::string get_error_code(const json &error_payload) {
    if (error_payload.is_object() && error_payload.contains("value") &&
        error_payload["value"].is_object() && error_payload["value"].contains("error") &&
        error_payload["value"]["error"].is_string()) {
        return error_payload["value"]["error"].get<std::string>();
    }
    return "";
}

bool is_error_payload(const json &payload) {
    return !get_error_code(payload).empty();
}

} // namespace w3c_errors
