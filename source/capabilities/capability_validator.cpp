#include "capabilities/capability_validator.hpp"

#include <algorithm>
#include <map>

namespace capability_validator {

static const std::vector<std::string> STANDARD_CAPABILITY_NAMES = {
    "acceptInsecureCerts",
    "browserName",
    "browserVersion",
    "pageLoadStrategy",
    "platformName",
    "proxy",
    "setWindowRect",
    "strictFileInteractability",
    "timeouts",
    "unhandledPromptBehavior",
    "webSocketUrl",
};

// JSON Wire Protocol names. An empty replacement means no W3C equivalent.
static const std::map<std::string, std::string> LEGACY_CAPABILITY_NAMES = {
    {"platform", "platformName"},
    {"version", "browserVersion"},
    {"acceptSslCerts", "acceptInsecureCerts"},
    {"unexpectedAlertBehaviour", "unhandledPromptBehavior"},
    {"javascriptEnabled", ""},
    {"cssSelectorsEnabled", ""},
    {"takesScreenshot", ""},
    {"nativeEvents", ""},
    {"rotatable", ""},
};

const std::vector<std::string> &standard_capability_names() {
    return STANDARD_CAPABILITY_NAMES;
}

bool is_standard_capability(const std::string &key) {
    return std::find(STANDARD_CAPABILITY_NAMES.begin(), STANDARD_CAPABILITY_NAMES.end(), key) !=
           STANDARD_CAPABILITY_NAMES.end();
}

bool is_extension_capability(const std::string &key) {
    std::string::size_type colon = key.find(':');
    return colon != std::string::npos && colon > 0 && colon + 1 < key.size();
}

bool is_w3c_compatible(const std::string &key) {
    return is_standard_capability(key) || is_extension_capability(key);
}

std::string legacy_replacement(const std::string &key) {
    auto found = LEGACY_CAPABILITY_NAMES.find(key);
    if (found == LEGACY_CAPABILITY_NAMES.end()) {
        return "";
    }
    return found->second;
}

ValidationResult validate_key(const std::string &key) {
    ValidationResult result;
    if (is_w3c_compatible(key)) {
        result.success = true;
        return result;
    }

    result.invalid_key = key;
    auto legacy = LEGACY_CAPABILITY_NAMES.find(key);
    if (legacy != LEGACY_CAPABILITY_NAMES.end()) {
        result.error_message = "Capability '" + key + "' is a legacy JSON Wire Protocol name";
        if (!legacy->second.empty()) {
            result.error_message += "; use '" + legacy->second + "' instead";
        }
    } else {
        result.error_message = "Capability '" + key +
                               "' is not a W3C capability; extension capabilities must be "
                               "of the form 'vendor:name'";
    }
    return result;
}

ValidationResult validate(const capabilities::CapabilityMap &map) {
    if (!map.is_object()) {
        ValidationResult result;
        result.error_message = "Capabilities must be a JSON object, got: " + std::string(map.type_name());
        return result;
    }

    for (auto it = map.begin(); it != map.end(); ++it) {
        ValidationResult key_result = validate_key(it.key());
        if (!key_result.success) {
            return key_result;
        }
    }

    ValidationResult result;
    result.success = true;
    return result;
}

} // namespace capability_validator
