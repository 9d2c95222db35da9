#include "session/driver_service.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"

#include <stdexcept>

namespace driver_service {

LocalDriverService::LocalDriverService(const std::string &executable_path, int port,
                                       const std::vector<std::string> &extra_arguments)
    : executable_path_(executable_path), port_(port), extra_arguments_(extra_arguments) {
    if (port <= 0 || port > 65535) {
        throw std::invalid_argument("Driver port out of range: " + std::to_string(port));
    }
}

bool LocalDriverService::is_running() const {
    return platform::process_exists(process_id_);
}

endpoint_url::EndpointUrl LocalDriverService::get_url() const {
    endpoint_url::EndpointUrl url;
    url.scheme = "http";
    url.host = "127.0.0.1";
    url.port = port_;
    url.path = "/";
    url.original = url.to_string();
    return url;
}

DriverCommandLine LocalDriverService::build_command_line() const {
    DriverCommandLine command_line;
    command_line.executable_path = executable_path_;
    command_line.arguments.push_back("--port=" + std::to_string(port_));
    command_line.arguments.insert(command_line.arguments.end(),
                                  extra_arguments_.begin(), extra_arguments_.end());
    return command_line;
}

void LocalDriverService::attach_process(int process_id) {
    process_id_ = (process_id > 0) ? process_id : -1;
    debug_log::log("driver_service", "attached pid=" + std::to_string(process_id_) +
                                         " to " + executable_path_);
}

LocalDriverService create_default_service(const std::string &executable_name, int port) {
    platform::ExecutableLookupResult lookup = platform::find_executable(executable_name);
    if (!lookup.success) {
        throw std::runtime_error(lookup.error_message);
    }
    debug_log::log("driver_service", "found " + executable_name + " at " + lookup.executable_path);
    return LocalDriverService(lookup.executable_path, port);
}

} // namespace driver_service
