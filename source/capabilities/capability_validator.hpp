#ifndef WDSESSION_CAPABILITY_VALIDATOR_HPP
#define WDSESSION_CAPABILITY_VALIDATOR_HPP

// W3C capability name checks.
// A key is accepted if it is one of the standard capability names or an
// extension name of the form "prefix:suffix". Legacy JSON Wire Protocol names
// (platform, version, ...) are rejected, never translated.

#include <string>
#include <vector>

#include "capabilities/capability_map.hpp"

namespace capability_validator {

// Result of validating a capability map.
struct ValidationResult {
    bool success = false;
    std::string invalid_key;
    std::string error_message;
};

// The closed set of standard W3C capability names.
const std::vector<std::string> &standard_capability_names();

bool is_standard_capability(const std::string &key);

// True if key contains ':' with a non-empty prefix and a non-empty suffix.
bool is_extension_capability(const std::string &key);

bool is_w3c_compatible(const std::string &key);

// W3C name that superseded a legacy name, or empty when key is not a known
// legacy name or has no direct replacement.
std::string legacy_replacement(const std::string &key);

// Validate a single key. On failure error_message says why.
ValidationResult validate_key(const std::string &key);

// Validate every key of a capability map. Stops at the first invalid key.
ValidationResult validate(const capabilities::CapabilityMap &map);

} // namespace capability_validator

#endif // WDSESSION_CAPABILITY_VALIDATOR_HPP
