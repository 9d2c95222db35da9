#include "protocol/endpoint_url.hpp"
#include "protocol/w3c_errors.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <cctype>

namespace endpoint_url {

static int parse_port(const std::string &url, const std::string &port_text) {
    if (port_text.empty() || port_text.size() > 5) {
        throw w3c_errors::MalformedUrlError(url, "invalid port '" + port_text + "'");
    }
    int port = 0;
    for (char character : port_text) {
        if (!std::isdigit(static_cast<unsigned char>(character))) {
            throw w3c_errors::MalformedUrlError(url, "invalid port '" + port_text + "'");
        }
        port = port * 10 + (character - '0');
    }
    if (port <= 0 || port > 65535) {
        throw w3c_errors::MalformedUrlError(url, "port out of range: " + port_text);
    }
    return port;
}

static bool is_valid_host_character(char character) {
    unsigned char value = static_cast<unsigned char>(character);
    return std::isalnum(value) || character == '-' || character == '.' || character == '_';
}

static bool is_valid_ipv6_character(char character) {
    return std::isxdigit(static_cast<unsigned char>(character)) || character == ':' || character == '.';
}

int default_port(const std::string &scheme) {
    if (scheme == "http") {
        return 80;
    }
    if (scheme == "https") {
        return 443;
    }
    return -1;
}

EndpointUrl parse_endpoint_url(const std::string &url) {
    EndpointUrl result;
    result.original = url;

    std::string rest;
    if (boost::algorithm::istarts_with(url, "http://")) {
        result.scheme = "http";
        rest = url.substr(7);
    } else if (boost::algorithm::istarts_with(url, "https://")) {
        result.scheme = "https";
        rest = url.substr(8);
    } else {
        throw w3c_errors::MalformedUrlError(url, "expected an http:// or https:// URL");
    }

    // Query and fragment belong to the path for our purposes.
    std::string::size_type slash = rest.find_first_of("/?#");
    std::string authority = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    std::string target = (slash == std::string::npos) ? "/" : rest.substr(slash);
    if (target[0] != '/') {
        target = "/" + target;
    }
    result.path = target;

    if (authority.find('@') != std::string::npos) {
        throw w3c_errors::MalformedUrlError(url, "user info is not supported");
    }

    std::string port_text;
    if (!authority.empty() && authority[0] == '[') {
        std::string::size_type closing = authority.find(']');
        if (closing == std::string::npos || closing == 1) {
            throw w3c_errors::MalformedUrlError(url, "unterminated IPv6 host");
        }
        result.host = authority.substr(0, closing + 1);
        if (result.host.find(':') == std::string::npos) {
            throw w3c_errors::MalformedUrlError(url, "invalid IPv6 host '" + result.host + "'");
        }
        for (std::string::size_type index = 1; index < closing; index++) {
            if (!is_valid_ipv6_character(authority[index])) {
                throw w3c_errors::MalformedUrlError(url, "invalid IPv6 host '" + result.host + "'");
            }
        }
        std::string after = authority.substr(closing + 1);
        if (!after.empty()) {
            if (after[0] != ':') {
                throw w3c_errors::MalformedUrlError(url, "unexpected text after IPv6 host");
            }
            port_text = after.substr(1);
            result.port = parse_port(url, port_text);
        }
    } else {
        std::string::size_type colon = authority.find(':');
        result.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
            result.port = parse_port(url, port_text);
        }
        for (char character : result.host) {
            if (!is_valid_host_character(character)) {
                throw w3c_errors::MalformedUrlError(url, "invalid host '" + result.host + "'");
            }
        }
    }

    if (result.host.empty()) {
        throw w3c_errors::MalformedUrlError(url, "missing host");
    }
    if (result.port == 0) {
        result.port = default_port(result.scheme);
    }
    return result;
}

std::string EndpointUrl::to_string() const {
    return scheme + "://" + host + ":" + std::to_string(port) + path;
}

bool EndpointUrl::operator==(const EndpointUrl &other) const {
    return scheme == other.scheme && boost::algorithm::iequals(host, other.host) &&
           port == other.port && path == other.path;
}

} // namespace endpoint_url
