#include "cli/session_request_io.hpp"

#include <iostream>

namespace session_request_io {

bool ObjectFramer::consume(char character) {
    if (in_string_) {
        if (escaped_) {
            escaped_ = false;
        } else if (character == '\\') {
            escaped_ = true;
        } else if (character == '"') {
            in_string_ = false;
        }
        return false;
    }

    switch (character) {
    case '"':
        in_string_ = true;
        return false;
    case '{':
        depth_++;
        return false;
    case '}':
        depth_--;
        if (depth_ == 0) {
            closed_ = true;
            return true;
        }
        return false;
    default:
        return false;
    }
}

std::string read_message(std::istream &input) {
    std::string buffer;
    ObjectFramer framer;

    char character;
    while (input.get(character)) {
        if (!framer.has_started() && character != '{') {
            continue;
        }
        buffer += character;
        if (framer.consume(character)) {
            return buffer;
        }
    }
    return buffer;
}

std::string encode_response(const json &response) {
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

void write_message(std::ostream &output, const std::string &json_string) {
    output << json_string << "\n";
    output.flush();
}

void log_message(const std::string &message) {
    std::cerr << "[wdsession] " << message << std::endl;
}

} // namespace session_request_io
