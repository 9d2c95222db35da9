#include "utils/debug_log.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace debug_log {

static std::optional<bool> debug_override;

static const char *const TRUTHY_VALUES[] = {"1", "true", "yes"};

static bool environment_flag_set() {
    const char *value = std::getenv("WDSESSION_DEBUG");
    if (value == nullptr) {
        return false;
    }
    for (const char *truthy : TRUTHY_VALUES) {
        if (boost::algorithm::iequals(value, truthy)) {
            return true;
        }
    }
    return false;
}

bool is_debug_enabled() {
    return debug_override.value_or(environment_flag_set());
}

void set_debug_override(bool enabled) {
    debug_override = enabled;
}

void clear_debug_override() {
    debug_override.reset();
}

void log(const std::string &message) {
    if (is_debug_enabled()) {
        std::cerr << "[wdsession] " << message << std::endl;
    }
}

void log(const std::string &component, const std::string &message) {
    if (is_debug_enabled()) {
        std::cerr << "[wdsession] " << component << ": " << message << std::endl;
    }
}

} // namespace debug_log
