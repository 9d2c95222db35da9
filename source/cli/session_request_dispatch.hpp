#ifndef WDSESSION_SESSION_REQUEST_DISPATCH_HPP
#define WDSESSION_SESSION_REQUEST_DISPATCH_HPP

// Turns a session request description into a new-session payload.
//
// Request:
//   { "options": [ {capability map} | "chrome" | "firefox" | "internet explorer", ... ],
//     "capabilities": { global capabilities },
//     "metadata": { top-level payload entries },
//     "url": "http://host:port/path",
//     "driverService": { "executable": "geckodriver", "port": 4444, "args": [...] } }
//
// Response:
//   { "target": {...}, "payload": {...} }  or a W3C error body.

#include <nlohmann/json.hpp>
#include <string>

namespace session_request_dispatch {

using json = nlohmann::json;

// Remote endpoint used when a request names no target: WDSESSION_REMOTE_URL,
// or empty when unset.
std::string default_remote_url();

// Build the response for one parsed request. Request errors come back as
// W3C error bodies instead of exceptions.
json dispatch_request(const json &request);

// Parse raw request text and dispatch it. Unparsable text yields an
// "invalid argument" error body.
json dispatch_raw_request(const std::string &raw_request);

} // namespace session_request_dispatch

#endif // WDSESSION_SESSION_REQUEST_DISPATCH_HPP
