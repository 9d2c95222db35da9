#ifndef WDSESSION_W3C_ERRORS_HPP
#define WDSESSION_W3C_ERRORS_HPP

// Errors raised while building a new-session request, and helpers for the
// W3C WebDriver error body.
// Uses nlohmann/json for the error body.

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace w3c_errors {

using json = nlohmann::json;

// W3C WebDriver error codes used by this library.
constexpr const char *INVALID_ARGUMENT = "invalid argument";
constexpr const char *SESSION_NOT_CREATED = "session not created";
constexpr const char *UNKNOWN_ERROR = "unknown error";

// A capability key that is neither a W3C standard name nor an extension name.
class InvalidCapabilityError : public std::invalid_argument {
public:
    InvalidCapabilityError(const std::string &capability_key, const std::string &message);

    const std::string &key() const { return capability_key_; }
    const char *error_code() const { return INVALID_ARGUMENT; }

private:
    std::string capability_key_;
};

// Reserved metadata key, a second execution target, or mutation of a finalized builder.
class ConfigurationConflictError : public std::invalid_argument {
public:
    explicit ConfigurationConflictError(const std::string &message);

    const char *error_code() const { return INVALID_ARGUMENT; }
};

// Remote endpoint that is not a well-formed http(s) URL.
class MalformedUrlError : public std::invalid_argument {
public:
    MalformedUrlError(const std::string &url, const std::string &reason);

    const std::string &url() const { return url_; }
    const char *error_code() const { return INVALID_ARGUMENT; }

private:
    std::string url_;
};

// Finalizing a builder that never received any options.
class SessionNotCreatedError : public std::runtime_error {
public:
    explicit SessionNotCreatedError(const std::string &message);

    const char *error_code() const { return SESSION_NOT_CREATED; }
};

// The payload sink failed while the payload was being written.
class SerializationError : public std::runtime_error {
public:
    explicit SerializationError(const std::string &message);

    const char *error_code() const { return UNKNOWN_ERROR; }
};

// Build a W3C error body: {"value": {"error", "message", "stacktrace"}}.
json build_error_payload(const std::string &error_code, const std::string &error_message);

// Same, with additional data under value.data.
json build_error_payload(const std::string &error_code, const std::string &error_message, const json &error_data);

// Extract the error code from a W3C error body. Returns empty if missing.
std::string get_error_code(const json &error_payload);

// Check whether a JSON value has the shape of a W3C error body.
bool is_error_payload(const json &payload);

} // namespace w3c_errors

#endif // WDSESSION_W3C_ERRORS_HPP
