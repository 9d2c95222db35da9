// Tests for remote endpoint URL parsing.

#include "protocol/endpoint_url.hpp"
#include "protocol/w3c_errors.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace test_endpoint_url {

static bool report(bool success, const std::string &description) {
    std::cout << (success ? "  OK: " : "  FAIL: ") << description << std::endl;
    return success;
}

// Test: scheme, host, port and path are split out.
static bool test_parses_full_url() {
    endpoint_url::EndpointUrl url = endpoint_url::parse_endpoint_url("http://localhost:3000/woohoo/cheese");
    bool success = url.scheme == "http" && url.host == "localhost" && url.port == 3000 &&
                   url.path == "/woohoo/cheese" && url.original == "http://localhost:3000/woohoo/cheese";
    return report(success, "Full http URL is parsed into its parts");
}

// Test: default ports and paths are filled in.
static bool test_defaults() {
    endpoint_url::EndpointUrl http_url = endpoint_url::parse_endpoint_url("http://example.com");
    endpoint_url::EndpointUrl https_url = endpoint_url::parse_endpoint_url("HTTPS://grid.example.com/wd/hub");
    bool success = http_url.port == 80 && http_url.path == "/" &&
                   https_url.scheme == "https" && https_url.port == 443 && https_url.path == "/wd/hub";
    return report(success, "Default ports and root path are applied");
}

// Test: bracketed IPv6 hosts keep their brackets.
static bool test_ipv6_host() {
    endpoint_url::EndpointUrl url = endpoint_url::parse_endpoint_url("http://[::1]:4444/");
    endpoint_url::EndpointUrl mapped = endpoint_url::parse_endpoint_url("http://[::ffff:192.168.0.1]/");
    bool success = url.host == "[::1]" && url.port == 4444 && url.to_string() == "http://[::1]:4444/" &&
                   mapped.host == "[::ffff:192.168.0.1]" && mapped.port == 80;
    return report(success, "IPv6 host with port is parsed");
}

// Test: equality ignores the original spelling.
static bool test_equality() {
    bool success = endpoint_url::parse_endpoint_url("http://LOCALHOST/") ==
                       endpoint_url::parse_endpoint_url("http://localhost:80") &&
                   endpoint_url::parse_endpoint_url("http://localhost:4444/") !=
                       endpoint_url::parse_endpoint_url("http://localhost:4445/");
    return report(success, "URLs compare by scheme, host, port and path");
}

// Test: malformed inputs raise MalformedUrlError.
static bool test_malformed_urls() {
    std::vector<std::string> malformed = {
        "",
        "localhost:4444",
        "ftp://example.com/",
        "http://",
        "http://:4444/",
        "http://host:notaport/",
        "http://host:0/",
        "http://host:70000/",
        "http://user@host/",
        "http://[::1/",
        "http://bad host/",
        "http://[zz]/",
        "http://[abcd]/",
        "http://[::1%eth0]:4444/",
    };
    bool success = true;
    for (const auto &text : malformed) {
        try {
            endpoint_url::parse_endpoint_url(text);
            std::cout << "  FAIL: accepted malformed URL '" << text << "'" << std::endl;
            success = false;
        } catch (const w3c_errors::MalformedUrlError &error) {
            if (error.url() != text) {
                std::cout << "  FAIL: error carries wrong URL for '" << text << "'" << std::endl;
                success = false;
            }
        }
    }
    return report(success, "Malformed URLs raise MalformedUrlError");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_parses_full_url();
    all_passed &= test_defaults();
    all_passed &= test_ipv6_host();
    all_passed &= test_equality();
    all_passed &= test_malformed_urls();
    return all_passed;
}

} // namespace test_endpoint_url
