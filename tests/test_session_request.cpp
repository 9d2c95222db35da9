// Tests for the wdsession command front end: request framing on a stream
// and request dispatch into payloads or W3C error bodies.

#include "cli/session_request_dispatch.hpp"
#include "cli/session_request_io.hpp"
#include "protocol/w3c_errors.hpp"

#include <nlohmann/json.hpp>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

using json = nlohmann::json;

namespace test_session_request {

static bool report(bool success, const std::string &description) {
    std::cout << (success ? "  OK: " : "  FAIL: ") << description << std::endl;
    return success;
}

// Test: framing splits back-to-back objects and respects braces in strings.
static bool test_read_message_framing() {
    std::istringstream input("  {\"a\":\"}{\"}\n{\"b\":{\"c\":\"\\\"}\"}}{\"d\":1}");
    std::string first = session_request_io::read_message(input);
    std::string second = session_request_io::read_message(input);
    std::string third = session_request_io::read_message(input);
    std::string end = session_request_io::read_message(input);
    bool success = first == "{\"a\":\"}{\"}" && second == "{\"b\":{\"c\":\"\\\"}\"}}" &&
                   third == "{\"d\":1}" && end.empty();
    return report(success, "Brace-counting framing splits streamed objects");
}

// Test: write_message writes one line per response.
static bool test_write_message() {
    std::ostringstream output;
    session_request_io::write_message(output, "{\"x\":1}");
    session_request_io::write_message(output, "{\"y\":2}");
    return report(output.str() == "{\"x\":1}\n{\"y\":2}\n", "Responses are newline-delimited");
}

// Test: EOF inside an object hands back the partial text; a clean EOF is empty.
static bool test_read_message_partial_object() {
    std::istringstream input("noise {\"options\": [\"{\"");
    std::string partial = session_request_io::read_message(input);
    std::string end = session_request_io::read_message(input);
    bool success = partial == "{\"options\": [\"{\"" && end.empty();
    return report(success, "Truncated object is returned as-is for error reporting");
}

// Test: invalid UTF-8 in the request still yields an encodable error body.
static bool test_invalid_utf8_request_is_encodable() {
    json response = session_request_dispatch::dispatch_raw_request("{\"options\": [\xff]}");
    bool success = w3c_errors::get_error_code(response) == w3c_errors::INVALID_ARGUMENT;
    std::string encoded;
    try {
        encoded = session_request_io::encode_response(response);
        success &= json::parse(encoded).is_object();
    } catch (const json::exception &error) {
        std::cout << "  encode failed: " << error.what() << std::endl;
        success = false;
    }
    success &= encoded.find('\n') == std::string::npos;
    return report(success, "Error body for invalid UTF-8 input encodes on one line");
}

// Test: a valid request yields target and payload.
static bool test_dispatch_remote_request() {
    json request = json::parse(R"({
        "options": ["firefox", {"browserName": "chrome", "se:cheese": "cheddar"}],
        "capabilities": {"se:cheese": "brie"},
        "metadata": {"cloud:options": {"cheese": "brie"}},
        "url": "http://localhost:4444/wd/hub"
    })");
    json response = session_request_dispatch::dispatch_request(request);
    bool success = !w3c_errors::is_error_payload(response) &&
                   response["target"]["type"] == "remote" &&
                   response["target"]["url"] == "http://localhost:4444/wd/hub" &&
                   response["payload"]["capabilities"]["alwaysMatch"]["se:cheese"] == "brie" &&
                   response["payload"]["capabilities"]["firstMatch"].size() == 2 &&
                   response["payload"]["capabilities"]["firstMatch"][0]["browserName"] == "firefox" &&
                   response["payload"]["cloud:options"]["cheese"] == "brie";
    if (!success) {
        std::cout << "  response was: " << response.dump() << std::endl;
    }
    return report(success, "Remote request yields target and payload");
}

// Test: a driver service request resolves the executable and reports a local target.
static bool test_dispatch_driver_service_request() {
    json request = json::parse(R"({"options": ["chrome"], "driverService": {"executable": "sh", "port": 9515}})");
    json response = session_request_dispatch::dispatch_request(request);
    bool success = response["target"]["type"] == "local" &&
                   response["target"]["url"] == "http://127.0.0.1:9515/" &&
                   response["target"]["running"] == false;
    if (!success) {
        std::cout << "  response was: " << response.dump() << std::endl;
    }
    return report(success, "Driver service request yields a local target");
}

// Test: errors come back as W3C error bodies with the right code.
static bool test_dispatch_errors() {
    json legacy = session_request_dispatch::dispatch_request(json::parse(R"({"options": [{"platform": "LINUX"}]})"));
    json empty = session_request_dispatch::dispatch_request(json::object());
    json reserved = session_request_dispatch::dispatch_request(
        json::parse(R"({"options": ["firefox"], "metadata": {"firstMatch": {}}})"));
    json both = session_request_dispatch::dispatch_request(json::parse(
        R"({"options": ["firefox"], "url": "http://localhost:4444/", "driverService": {"executable": "sh"}})"));
    json bad_url = session_request_dispatch::dispatch_request(json::parse(R"({"options": ["firefox"], "url": "nope"})"));
    json bad_type = session_request_dispatch::dispatch_request(
        json::parse(R"({"options": ["chrome"], "driverService": {"executable": "sh", "port": "x"}})"));
    json unparsable = session_request_dispatch::dispatch_raw_request("{\"options\": [");

    bool success = w3c_errors::get_error_code(legacy) == w3c_errors::INVALID_ARGUMENT &&
                   legacy["value"]["data"]["key"] == "platform" &&
                   w3c_errors::get_error_code(empty) == w3c_errors::SESSION_NOT_CREATED &&
                   w3c_errors::get_error_code(reserved) == w3c_errors::INVALID_ARGUMENT &&
                   w3c_errors::get_error_code(both) == w3c_errors::INVALID_ARGUMENT &&
                   w3c_errors::get_error_code(bad_url) == w3c_errors::INVALID_ARGUMENT &&
                   bad_url["value"]["data"]["url"] == "nope" &&
                   w3c_errors::get_error_code(bad_type) == w3c_errors::INVALID_ARGUMENT &&
                   w3c_errors::get_error_code(unparsable) == w3c_errors::INVALID_ARGUMENT;
    return report(success, "Failures are reported as W3C error bodies");
}

// Test: port and pid are range-checked before narrowing.
static bool test_driver_service_integer_ranges() {
    json wrapped_port = session_request_dispatch::dispatch_request(
        json::parse(R"({"options": ["chrome"], "driverService": {"executable": "sh", "port": 4294967297}})"));
    json zero_port = session_request_dispatch::dispatch_request(
        json::parse(R"({"options": ["chrome"], "driverService": {"executable": "sh", "port": 0}})"));
    json negative_port = session_request_dispatch::dispatch_request(
        json::parse(R"({"options": ["chrome"], "driverService": {"executable": "sh", "port": -4444}})"));
    json fractional_port = session_request_dispatch::dispatch_request(
        json::parse(R"({"options": ["chrome"], "driverService": {"executable": "sh", "port": 4444.5}})"));
    json huge_pid = session_request_dispatch::dispatch_request(
        json::parse(R"({"options": ["chrome"], "driverService": {"executable": "sh", "pid": 4294967297}})"));
    json highest_port = session_request_dispatch::dispatch_request(
        json::parse(R"({"options": ["chrome"], "driverService": {"executable": "sh", "port": 65535}})"));

    bool success = w3c_errors::get_error_code(wrapped_port) == w3c_errors::INVALID_ARGUMENT &&
                   w3c_errors::get_error_code(zero_port) == w3c_errors::INVALID_ARGUMENT &&
                   w3c_errors::get_error_code(negative_port) == w3c_errors::INVALID_ARGUMENT &&
                   w3c_errors::get_error_code(fractional_port) == w3c_errors::INVALID_ARGUMENT &&
                   w3c_errors::get_error_code(huge_pid) == w3c_errors::INVALID_ARGUMENT &&
                   highest_port["target"]["url"] == "http://127.0.0.1:65535/";
    if (!success) {
        std::cout << "  wrapped port response was: " << wrapped_port.dump() << std::endl;
    }
    return report(success, "Out-of-range port and pid are rejected, not wrapped");
}

// Test: WDSESSION_REMOTE_URL fills in a missing target.
static bool test_default_remote_url() {
    setenv("WDSESSION_REMOTE_URL", "http://grid.internal:4444/", 1);
    json defaulted = session_request_dispatch::dispatch_request(json::parse(R"({"options": ["firefox"]})"));
    unsetenv("WDSESSION_REMOTE_URL");
    json untargeted = session_request_dispatch::dispatch_request(json::parse(R"({"options": ["firefox"]})"));
    bool success = defaulted["target"]["type"] == "remote" &&
                   defaulted["target"]["url"] == "http://grid.internal:4444/" &&
                   untargeted["target"]["type"] == "none";
    return report(success, "WDSESSION_REMOTE_URL is used only when no target is given");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_read_message_framing();
    all_passed &= test_write_message();
    all_passed &= test_read_message_partial_object();
    all_passed &= test_invalid_utf8_request_is_encodable();
    all_passed &= test_dispatch_remote_request();
    all_passed &= test_dispatch_driver_service_request();
    all_passed &= test_dispatch_errors();
    all_passed &= test_driver_service_integer_ranges();
    all_passed &= test_default_remote_url();
    return all_passed;
}

} // namespace test_session_request
