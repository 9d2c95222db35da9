#ifndef WDSESSION_PLATFORM_ABI_HPP
#define WDSESSION_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <string>

namespace platform {

// Result of looking up an executable.
struct ExecutableLookupResult {
    bool success = false;
    std::string executable_path;
    std::string error_message;
};

// Resolve an executable name. Names containing '/' are checked as paths;
// bare names are searched on PATH.
ExecutableLookupResult find_executable(const std::string &executable_name);

// True if a process with this id exists. Never signals the process.
bool process_exists(int process_id);

} // namespace platform

#endif // WDSESSION_PLATFORM_ABI_HPP
