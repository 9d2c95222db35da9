#ifndef WDSESSION_ENDPOINT_URL_HPP
#define WDSESSION_ENDPOINT_URL_HPP

// Remote WebDriver endpoint URLs (http and https only).

#include <string>

namespace endpoint_url {

struct EndpointUrl {
    std::string scheme; // "http" | "https", lower case
    std::string host;   // IPv6 hosts keep their brackets
    int port = 0;
    std::string path;   // always starts with '/'
    std::string original;

    // External form: scheme://host:port/path
    std::string to_string() const;

    bool operator==(const EndpointUrl &other) const;
    bool operator!=(const EndpointUrl &other) const { return !(*this == other); }
};

// Parse a remote endpoint URL. Throws w3c_errors::MalformedUrlError.
EndpointUrl parse_endpoint_url(const std::string &url);

// Default port for a scheme: 80 for http, 443 for https, -1 otherwise.
int default_port(const std::string &scheme);

} // namespace endpoint_url

#endif // WDSESSION_ENDPOINT_URL_HPP
