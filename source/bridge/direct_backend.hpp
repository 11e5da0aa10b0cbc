#ifndef PAGEMCP_DIRECT_BACKEND_HPP
#define PAGEMCP_DIRECT_BACKEND_HPP

// Direct backend: every call launches its own Session (engine + isolated context + page),
// runs one tool handler on it and destroys it, on success and on every error path.

#include <functional>
#include <nlohmann/json.hpp>
#include <string>

#include "browser/browser_driver_abi.hpp"
#include "tool_handlers/tool_arguments.hpp"

namespace direct_backend {

using json = nlohmann::ordered_json;

// Creates a Session. The real one is cdp_session::launch_session; tests inject doubles.
using SessionLauncher = std::function<browser_driver::LaunchResult(const browser_driver::LaunchOptions &)>;

// Run the tool whose arguments are given. engine_family is the raw "browser" value;
// anything other than chromium/firefox/webkit yields "Unsupported browser: <value>".
json execute(const SessionLauncher &launcher, const std::string &engine_family, bool headless,
             const tool_arguments::ToolArguments &arguments);

} // namespace direct_backend

#endif // PAGEMCP_DIRECT_BACKEND_HPP
