// wdsession – W3C WebDriver new-session request builder
// Entry point: reads session request descriptions on stdin, writes one
// response line per request on stdout.
//
// Logs go to stderr so stdout only ever carries responses.

#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <csignal>

#include "cli/session_request_dispatch.hpp"
#include "cli/session_request_io.hpp"
#include "protocol/w3c_errors.hpp"
#include "utils/debug_log.hpp"

using json = nlohmann::json;

// Global flag for graceful shutdown.
static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

int main() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    session_request_io::log_message("wdsession started. Waiting for session requests on stdin.");

    int request_count = 0;
    int error_count = 0;
    while (!shutdown_requested) {
        std::string raw_request = session_request_io::read_message(std::cin);
        if (raw_request.empty()) {
            debug_log::log("EOF on stdin after " + std::to_string(request_count) + " request(s).");
            break;
        }

        json response = session_request_dispatch::dispatch_raw_request(raw_request);
        request_count++;
        if (w3c_errors::is_error_payload(response)) {
            error_count++;
        }

        session_request_io::write_message(std::cout, session_request_io::encode_response(response));
        if (!std::cout.good()) {
            session_request_io::log_message("stdout closed. Shutting down.");
            return 1;
        }
    }

    session_request_io::log_message("wdsession shut down (" + std::to_string(request_count) +
                                    " request(s), " + std::to_string(error_count) + " error(s)).");
    return 0;
}
