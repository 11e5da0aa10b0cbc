#ifndef PAGEMCP_MCP_DISPATCH_HPP
#define PAGEMCP_MCP_DISPATCH_HPP

// MCP JSON-RPC method dispatch and the serial server loop.
// One message is read, fully handled and answered before the next read.

#include <functional>
#include <iosfwd>
#include <nlohmann/json.hpp>

#include "bridge/execution_bridge.hpp"
#include "config/server_config.hpp"

namespace mcp_dispatch {

using json = nlohmann::ordered_json;

enum class LifecycleState {
    Uninitialized,
    Initialized,
    ShuttingDown,
    Stopped
};

// Runs one tool call. Normally ExecutionBridge::execute.
using ToolExecutor = std::function<json(const execution_bridge::InvocationContext &context)>;

// Wrap a tool result as tools/call result content:
// {"content": [{"type": "text", "text": <result as text>}], "isError": <status == "error">}
json build_tool_envelope(const json &tool_result);

class Dispatcher {
public:
    Dispatcher(ToolExecutor tool_executor, server_config::ServerConfig config);

    // Response for one message, or a null json value when none is due (notifications).
    json handle_message(const json &message);

    // Serve until end of stream, shutdown or a termination signal.
    void run(std::istream &input, std::ostream &output);

    LifecycleState state() const { return lifecycle_state; }

    // False once shutdown has been handled.
    bool should_continue() const { return continue_running; }

private:
    json handle_initialize(const json &request_id, const json &params);
    json handle_tools_call(const json &request_id, const json &params);
    json handle_shutdown(const json &request_id);

    ToolExecutor tool_executor;
    server_config::ServerConfig config;
    LifecycleState lifecycle_state = LifecycleState::Uninitialized;
    bool continue_running = true;
};

} // namespace mcp_dispatch

#endif // PAGEMCP_MCP_DISPATCH_HPP
