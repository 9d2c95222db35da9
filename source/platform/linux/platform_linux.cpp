#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <signal.h>
#include <sys/types.h>
#include <cerrno>
#include <cstdlib>
#include <sstream>
#include <filesystem>
#include <system_error>

namespace platform {

static bool is_executable_file(const std::string &path) {
    std::error_code error;
    if (!std::filesystem::is_regular_file(path, error)) {
        return false;
    }
    return access(path.c_str(), X_OK) == 0;
}

ExecutableLookupResult find_executable(const std::string &executable_name) {
    ExecutableLookupResult result;

    if (executable_name.empty()) {
        result.error_message = "Empty executable name.";
        return result;
    }

    if (executable_name.find('/') != std::string::npos) {
        if (is_executable_file(executable_name)) {
            result.success = true;
            result.executable_path = executable_name;
        } else {
            result.error_message = "Not an executable file: " + executable_name;
        }
        return result;
    }

    const char *path_environment = std::getenv("PATH");
    if (path_environment == nullptr) {
        result.error_message = "PATH is not set; cannot locate " + executable_name;
        return result;
    }
    std::istringstream path_stream(path_environment);
    std::string directory;
    while (std::getline(path_stream, directory, ':')) {
        if (directory.empty()) {
            continue;
        }
        std::string full_path = directory + "/" + executable_name;
        if (is_executable_file(full_path)) {
            result.success = true;
            result.executable_path = full_path;
            return result;
        }
    }

    result.error_message = "Could not find " + executable_name + " on PATH.";
    return result;
}

bool process_exists(int process_id) {
    if (process_id <= 0) {
        return false;
    }
    // Signal 0 only checks existence and permission.
    if (kill(static_cast<pid_t>(process_id), 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

} // namespace platform
