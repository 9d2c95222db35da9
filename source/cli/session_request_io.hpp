#ifndef WDSESSION_SESSION_REQUEST_IO_HPP
#define WDSESSION_SESSION_REQUEST_IO_HPP

// stdio transport for the wdsession command: request objects in, one JSON
// line per response out.

#include <nlohmann/json.hpp>
#include <istream>
#include <ostream>
#include <string>

namespace session_request_io {

using json = nlohmann::json;

// Tracks object nesting over a character stream. Braces inside string
// literals (escapes included) do not count.
class ObjectFramer {
public:
    // Feed one character. Returns true when it closes the outermost object.
    bool consume(char character);

    bool has_started() const { return depth_ > 0 || closed_; }

private:
    int depth_ = 0;
    bool in_string_ = false;
    bool escaped_ = false;
    bool closed_ = false;
};

// Next top-level JSON object on input, with text between objects skipped.
// Returns the partial text if EOF hits inside an object, empty on a clean EOF.
std::string read_message(std::istream &input);

// Encode a response on one line. Invalid UTF-8 in strings becomes U+FFFD,
// so this never throws.
std::string encode_response(const json &response);

// Write one line and flush.
void write_message(std::ostream &output, const std::string &json_string);

// Operational message to stderr.
void log_message(const std::string &message);

} // namespace session_request_io

#endif // WDSESSION_SESSION_REQUEST_IO_HPP
