#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_tools.hpp"
#include "protocol/json_rpc.hpp"
#include "protocol/json_text.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"
#include "utils/shutdown_signal.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

namespace mcp_dispatch {

// Protocol version we support.
static const std::string PROTOCOL_VERSION = "2024-11-05";

// Server info.
static const std::string SERVER_NAME = "pagemcp";
static const std::string SERVER_VERSION = "0.1.0";
// Lets MCP clients see what the server is for.
static const std::string SERVER_DESCRIPTION =
    "Browser automation tool server: every call opens the given URL in a fresh, isolated "
    "browser session, performs one action and closes the session. Tools: navigate, screenshot, "
    "get_content, click, fill, execute_script, get_attribute, wait_for.";

json build_tool_envelope(const json &tool_result) {
    json text_content;
    text_content["type"] = "text";
    text_content["text"] = json_text::dump_spaced(tool_result);

    bool is_error = tool_result.is_object() && tool_result.contains("status") &&
                    tool_result["status"].is_string() && tool_result["status"].get<std::string>() == "error";

    json result;
    result["content"] = json::array({text_content});
    result["isError"] = is_error;
    return result;
}

Dispatcher::Dispatcher(ToolExecutor tool_executor, server_config::ServerConfig config)
    : tool_executor(std::move(tool_executor)), config(std::move(config)) {}

json Dispatcher::handle_initialize(const json &request_id, const json &params) {
    if (params.contains("clientInfo")) {
        mcp_stdio::log_message("initialize from client " + params["clientInfo"].dump());
    } else {
        mcp_stdio::log_message("initialize (no clientInfo)");
    }

    json capabilities;
    capabilities["tools"] = json::object();

    json server_info;
    server_info["name"] = SERVER_NAME;
    server_info["version"] = SERVER_VERSION;
    server_info["description"] = SERVER_DESCRIPTION;

    json result;
    result["protocolVersion"] = PROTOCOL_VERSION;
    result["capabilities"] = capabilities;
    result["serverInfo"] = server_info;

    return json_rpc::build_response(request_id, result);
}

json Dispatcher::handle_tools_call(const json &request_id, const json &params) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS,
                                              "Missing or invalid 'name' in tools/call");
    }
    std::string tool_name = params["name"].get<std::string>();

    std::optional<mcp_tools::ToolName> name = mcp_tools::parse_tool_name(tool_name);
    if (!name) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_PARAMS, "Unknown tool: " + tool_name);
    }

    json arguments = json::object();
    if (params.contains("arguments") && params["arguments"].is_object()) {
        arguments = params["arguments"];
    }

    execution_bridge::InvocationContext context = execution_bridge::make_context(*name, arguments, config);

    auto start_time = std::chrono::steady_clock::now();
    json tool_result;
    try {
        tool_result = tool_executor(context);
    } catch (const std::exception &error) {
        tool_result = tool_handlers::error_result(error.what());
    }
    auto elapsed_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time).count();

    json envelope = build_tool_envelope(tool_result);
    mcp_stdio::log_message("tools/call " + tool_name + " -> " +
                           (envelope["isError"].get<bool>() ? "error" : "success") + " (" +
                           std::to_string(elapsed_milliseconds) + " ms)");
    return json_rpc::build_response(request_id, envelope);
}

json Dispatcher::handle_shutdown(const json &request_id) {
    mcp_stdio::log_message("shutdown requested by client.");
    lifecycle_state = LifecycleState::ShuttingDown;
    continue_running = false;
    return json_rpc::build_response(request_id, nullptr);
}

json Dispatcher::handle_message(const json &message) {
    if (!message.is_object()) {
        return json_rpc::build_error_response(nullptr, json_rpc::INVALID_REQUEST, "Invalid Request");
    }

    std::string method = json_rpc::get_method(message);
    json request_id = json_rpc::get_id(message);
    json params = json_rpc::get_params(message);

    // Never answered, even when a client attaches an id.
    if (method == "notifications/initialized") {
        lifecycle_state = LifecycleState::Initialized;
        debug_log::log("Client reported initialized.");
        return nullptr;
    }

    if (json_rpc::is_notification(message)) {
        debug_log::log("Ignoring notification: " + method);
        return nullptr;
    }

    if (method.empty()) {
        return json_rpc::build_error_response(request_id, json_rpc::INVALID_REQUEST, "Invalid Request");
    }
    if (method == "initialize") {
        return handle_initialize(request_id, params);
    }
    if (method == "tools/list") {
        return json_rpc::build_response(request_id, mcp_tools::build_tools_list_response());
    }
    if (method == "tools/call") {
        return handle_tools_call(request_id, params);
    }
    if (method == "shutdown") {
        return handle_shutdown(request_id);
    }

    return json_rpc::build_error_response(request_id, json_rpc::METHOD_NOT_FOUND, "Method not found: " + method);
}

void Dispatcher::run(std::istream &input, std::ostream &output) {
    while (continue_running) {
        if (shutdown_signal::is_requested()) {
            mcp_stdio::log_message("Termination signal received. Stopping.");
            break;
        }

        mcp_stdio::ReadResult read_result = mcp_stdio::read_message(input);
        switch (read_result.status) {
        case mcp_stdio::ReadStatus::EndOfStream:
            mcp_stdio::log_message("EOF on stdin. Shutting down.");
            continue_running = false;
            break;

        case mcp_stdio::ReadStatus::FramingError:
            // Already logged by the channel; the frame is dropped.
            break;

        case mcp_stdio::ReadStatus::ParseError:
            // Logged by the channel.
            mcp_stdio::write_message(output,
                                     json_rpc::build_error_response(nullptr, json_rpc::PARSE_ERROR, "Parse error"));
            break;

        case mcp_stdio::ReadStatus::Message: {
            json response = handle_message(read_result.message);
            if (!response.is_null()) {
                mcp_stdio::write_message(output, response);
            }
            break;
        }
        }
    }
    lifecycle_state = LifecycleState::Stopped;
}

} // namespace mcp_dispatch
