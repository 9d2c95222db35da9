#ifndef WDSESSION_DRIVER_SERVICE_HPP
#define WDSESSION_DRIVER_SERVICE_HPP

// Local driver service descriptors (geckodriver, chromedriver, ...).
// The process itself is started and stopped by the caller; the session
// builder only needs to know where the driver listens.

#include <string>
#include <vector>

#include "protocol/endpoint_url.hpp"

namespace driver_service {

// A driver process owned by some collaborator.
class DriverService {
public:
    virtual ~DriverService() = default;

    virtual bool is_running() const = 0;

    virtual endpoint_url::EndpointUrl get_url() const = 0;
};

// Command line for launching a driver executable.
struct DriverCommandLine {
    std::string executable_path;
    std::vector<std::string> arguments;
};

// A driver executable listening on 127.0.0.1:<port>.
class LocalDriverService : public DriverService {
public:
    // Throws std::invalid_argument if port is outside 1..65535.
    LocalDriverService(const std::string &executable_path, int port,
                       const std::vector<std::string> &extra_arguments = {});

    bool is_running() const override;

    endpoint_url::EndpointUrl get_url() const override;

    // Argv the owner should spawn: --port=<port> followed by extra arguments.
    DriverCommandLine build_command_line() const;

    // Record the process started by the owner. 0 or negative detaches.
    void attach_process(int process_id);

    int process_id() const { return process_id_; }
    int port() const { return port_; }
    const std::string &executable_path() const { return executable_path_; }

private:
    std::string executable_path_;
    int port_;
    std::vector<std::string> extra_arguments_;
    int process_id_ = -1;
};

// Default port used by create_default_service.
static constexpr int DEFAULT_DRIVER_PORT = 4444;

// Locate executable_name (on PATH unless it contains '/') and describe it.
// Throws std::runtime_error if the executable cannot be found.
LocalDriverService create_default_service(const std::string &executable_name,
                                          int port = DEFAULT_DRIVER_PORT);

} // namespace driver_service

#endif // WDSESSION_DRIVER_SERVICE_HPP
