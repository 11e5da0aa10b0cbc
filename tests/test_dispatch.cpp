// Tests for the MCP dispatcher: method routing, lifecycle states, tools/call envelopes
// and the framed server loop. Tool execution goes through the real ExecutionBridge with
// in-memory sessions, or through a stub executor where only dispatch is under test.

#include "mcp/mcp_dispatch.hpp"
#include "mcp/mcp_stdio.hpp"
#include "test_doubles.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace test_dispatch {

using json = mcp_dispatch::json;

static bool expect(bool condition, const std::string &description) {
    if (condition) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return condition;
}

static json request(int id, const std::string &method, const json &params = json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

static json tools_call(int id, const std::string &name, const json &arguments) {
    return request(id, "tools/call", {{"name", name}, {"arguments", arguments}});
}

// Counts calls and answers with a fixed result.
struct StubExecutor {
    int calls = 0;
    std::vector<execution_bridge::InvocationContext> contexts;
    json result = {{"status", "success"}, {"content", "hello"}};

    mcp_dispatch::ToolExecutor executor() {
        return [this](const execution_bridge::InvocationContext &context) {
            ++calls;
            contexts.push_back(context);
            return result;
        };
    }
};

static execution_bridge::ExecutionBridge bridge_for(test_doubles::LaunchLedger &ledger) {
    cli_backend::CommandRunner no_process = [](const std::vector<std::string> &, int) {
        platform::ProcessResult result;
        result.error_message = "no processes in this test";
        return result;
    };
    return execution_bridge::ExecutionBridge(test_doubles::make_launcher(ledger), cli_backend::CliSettings{},
                                             no_process);
}

static bool test_initialize_then_list() {
    StubExecutor stub;
    mcp_dispatch::Dispatcher dispatcher(stub.executor(), server_config::ServerConfig{});

    json init = dispatcher.handle_message(
        request(1, "initialize", {{"protocolVersion", "2024-11-05"}, {"clientInfo", {{"name", "t"}}}}));
    json initialized = dispatcher.handle_message({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    json listing = dispatcher.handle_message(request(2, "tools/list"));

    bool ok = init["id"] == 1 && init["result"]["protocolVersion"] == "2024-11-05" &&
              init["result"]["capabilities"].contains("tools") && init["result"]["serverInfo"]["name"] == "pagemcp" &&
              initialized.is_null() && dispatcher.state() == mcp_dispatch::LifecycleState::Initialized &&
              listing["id"] == 2 && listing["result"]["tools"].size() == 8 && stub.calls == 0;
    return expect(ok, "initialize, notifications/initialized and tools/list follow the handshake");
}

static bool test_initialized_with_id_gets_no_response() {
    StubExecutor stub;
    mcp_dispatch::Dispatcher dispatcher(stub.executor(), server_config::ServerConfig{});
    json response = dispatcher.handle_message(request(9, "notifications/initialized"));
    bool ok = response.is_null() && dispatcher.state() == mcp_dispatch::LifecycleState::Initialized;
    return expect(ok, "notifications/initialized carrying an id still only switches state");
}

static bool test_initial_state() {
    StubExecutor stub;
    mcp_dispatch::Dispatcher dispatcher(stub.executor(), server_config::ServerConfig{});
    json listing = dispatcher.handle_message(request(1, "tools/list"));
    bool ok = dispatcher.state() == mcp_dispatch::LifecycleState::Uninitialized && listing.contains("result") &&
              dispatcher.should_continue();
    return expect(ok, "A new dispatcher is Uninitialized and still serves requests");
}

static bool test_unknown_tool() {
    test_doubles::LaunchLedger ledger;
    execution_bridge::ExecutionBridge bridge = bridge_for(ledger);
    int executor_calls = 0;
    mcp_dispatch::Dispatcher dispatcher(
        [&](const execution_bridge::InvocationContext &context) {
            ++executor_calls;
            return bridge.execute(context);
        },
        server_config::ServerConfig{});

    json response = dispatcher.handle_message(tools_call(5, "open_browser", {{"url", "http://a.test/"}}));
    json missing_name = dispatcher.handle_message(request(6, "tools/call", {{"arguments", json::object()}}));

    bool ok = response["id"] == 5 && response["error"]["code"] == -32602 &&
              response["error"]["message"] == "Unknown tool: open_browser" && !response.contains("result") &&
              missing_name["error"]["code"] == -32602 && executor_calls == 0 && ledger.launches == 0;
    return expect(ok, "Unknown tool is -32602 and launches nothing");
}

static bool test_envelope_text_and_flag() {
    StubExecutor stub;
    mcp_dispatch::Dispatcher dispatcher(stub.executor(), server_config::ServerConfig{});

    json response = dispatcher.handle_message(
        tools_call(3, "get_content", {{"url", "http://a.test/"}, {"content_type", "text"}}));

    bool ok = response["id"] == 3 &&
              response["result"].dump() ==
                  "{\"content\":[{\"type\":\"text\",\"text\":\"{\\\"status\\\": \\\"success\\\", "
                  "\\\"content\\\": \\\"hello\\\"}\"}],\"isError\":false}";
    return expect(ok, "A successful tool result is wrapped as one text item with isError false");
}

static bool test_context_defaults_and_overrides() {
    StubExecutor stub;
    server_config::ServerConfig config;
    config.default_browser = "firefox";
    config.default_headless = false;
    mcp_dispatch::Dispatcher dispatcher(stub.executor(), config);

    dispatcher.handle_message(tools_call(1, "navigate", {{"url", "http://a.test/"}}));
    dispatcher.handle_message(
        tools_call(2, "navigate", {{"url", "http://a.test/"}, {"browser", "webkit"}, {"headless", true}}));
    dispatcher.handle_message(tools_call(3, "navigate", {{"url", "http://a.test/"}, {"headless", "yes"}}));

    bool ok = stub.calls == 3 && stub.contexts[0].engine_family == "firefox" && !stub.contexts[0].headless &&
              stub.contexts[0].tool_name == mcp_tools::ToolName::Navigate &&
              stub.contexts[1].engine_family == "webkit" && stub.contexts[1].headless &&
              !stub.contexts[2].headless;
    return expect(ok, "browser and headless come from arguments, else from configuration");
}

static bool test_unsupported_browser_is_in_band() {
    test_doubles::LaunchLedger ledger;
    execution_bridge::ExecutionBridge bridge = bridge_for(ledger);
    mcp_dispatch::Dispatcher dispatcher(
        [&](const execution_bridge::InvocationContext &context) { return bridge.execute(context); },
        server_config::ServerConfig{});

    json response = dispatcher.handle_message(
        tools_call(4, "screenshot", {{"url", "http://a.test/"}, {"browser", "netscape"}}));

    bool ok = response.contains("result") && !response.contains("error") && response["result"]["isError"] == true &&
              response["result"]["content"][0]["text"] ==
                  "{\"status\": \"error\", \"error\": \"Unsupported browser: netscape\"}" &&
              ledger.launches == 0;
    return expect(ok, "Unsupported browser is an isError result, not a JSON-RPC error");
}

static bool test_missing_arguments_are_in_band() {
    test_doubles::LaunchLedger ledger;
    execution_bridge::ExecutionBridge bridge = bridge_for(ledger);
    mcp_dispatch::Dispatcher dispatcher(
        [&](const execution_bridge::InvocationContext &context) { return bridge.execute(context); },
        server_config::ServerConfig{});

    json no_arguments = dispatcher.handle_message(request(7, "tools/call", {{"name", "navigate"}}));
    json bad_arguments = dispatcher.handle_message(tools_call(8, "fill", json::array({"x"})));

    bool ok = no_arguments["result"]["isError"] == true &&
              no_arguments["result"]["content"][0]["text"] ==
                  "{\"status\": \"error\", \"error\": \"navigate requires 'url' (string).\"}" &&
              bad_arguments["result"]["isError"] == true && ledger.launches == 0;
    return expect(ok, "Missing arguments are reported in-band before any launch");
}

static bool test_full_call_through_bridge() {
    test_doubles::LaunchLedger ledger;
    execution_bridge::ExecutionBridge bridge = bridge_for(ledger);
    mcp_dispatch::Dispatcher dispatcher(
        [&](const execution_bridge::InvocationContext &context) { return bridge.execute(context); },
        server_config::ServerConfig{});

    json first = dispatcher.handle_message(tools_call(9, "navigate", {{"url", "http://example.test/"}}));
    json second = dispatcher.handle_message(
        tools_call(10, "get_attribute", {{"url", "http://example.test/"}, {"selector", "a"}, {"attribute", "href"}}));

    bool ok = first["result"]["isError"] == false &&
              first["result"]["content"][0]["text"] ==
                  "{\"status\": \"success\", \"url\": \"http://example.test/\", \"title\": \"Test Page\", "
                  "\"http_status\": 200}" &&
              second["result"]["isError"] == false && ledger.launches == 2 && ledger.teardowns == 2 &&
              ledger.session_serials.size() == 2 && ledger.session_serials[0] != ledger.session_serials[1];
    return expect(ok, "Each tools/call gets its own session, torn down before the response");
}

static bool test_cli_mode_through_bridge() {
    std::vector<std::vector<std::string>> runs;
    cli_backend::CommandRunner runner = [&](const std::vector<std::string> &argv, int) {
        runs.push_back(argv);
        platform::ProcessResult result;
        result.started = true;
        result.exit_code = 0;
        result.standard_output = "{\"status\": \"success\", \"url\": \"http://a.test/\", \"title\": \"A\"}\n";
        return result;
    };
    test_doubles::LaunchLedger ledger;
    cli_backend::CliSettings cli_settings;
    cli_settings.cli_path = "pagemcp_driver";
    execution_bridge::ExecutionBridge bridge(test_doubles::make_launcher(ledger), cli_settings, runner);

    server_config::ServerConfig config;
    config.backend_mode = server_config::BackendMode::Cli;
    mcp_dispatch::Dispatcher dispatcher(
        [&](const execution_bridge::InvocationContext &context) { return bridge.execute(context); }, config);

    json navigate = dispatcher.handle_message(tools_call(1, "navigate", {{"url", "http://a.test/"}}));
    json click = dispatcher.handle_message(tools_call(2, "click", {{"url", "http://a.test/"}, {"selector", "b"}}));

    bool ok = navigate["result"]["isError"] == false &&
              navigate["result"]["content"][0]["text"] ==
                  "{\"status\": \"success\", \"url\": \"http://a.test/\", \"title\": \"A\"}" &&
              click["result"]["isError"] == true && runs.size() == 1 && ledger.launches == 0;
    return expect(ok, "CLI mode runs the driver process and never launches in-process");
}

static bool test_executor_exception() {
    mcp_dispatch::Dispatcher dispatcher(
        [](const execution_bridge::InvocationContext &) -> json { throw std::runtime_error("executor exploded"); },
        server_config::ServerConfig{});

    json response = dispatcher.handle_message(tools_call(11, "navigate", {{"url", "http://a.test/"}}));
    bool ok = response["id"] == 11 && response["result"]["isError"] == true &&
              response["result"]["content"][0]["text"] ==
                  "{\"status\": \"error\", \"error\": \"executor exploded\"}";
    return expect(ok, "An exception from the executor becomes an isError envelope");
}

static bool test_unknown_method_and_invalid_requests() {
    StubExecutor stub;
    mcp_dispatch::Dispatcher dispatcher(stub.executor(), server_config::ServerConfig{});

    json with_id = dispatcher.handle_message(request(12, "resources/list"));
    json without_id = dispatcher.handle_message({{"jsonrpc", "2.0"}, {"method", "resources/list"}});
    json not_object = dispatcher.handle_message(json::array({1, 2}));
    json no_method = dispatcher.handle_message({{"jsonrpc", "2.0"}, {"id", 13}});

    bool ok = with_id["error"]["code"] == -32601 && with_id["error"]["message"] == "Method not found: resources/list" &&
              without_id.is_null() && not_object["error"]["code"] == -32600 && not_object["id"].is_null() &&
              no_method["error"]["code"] == -32600 && no_method["id"] == 13;
    return expect(ok, "Unknown methods are -32601; notifications are dropped; malformed requests are -32600");
}

static bool test_string_ids_are_echoed() {
    StubExecutor stub;
    mcp_dispatch::Dispatcher dispatcher(stub.executor(), server_config::ServerConfig{});
    json message = {{"jsonrpc", "2.0"}, {"id", "req-7"}, {"method", "tools/list"}};
    json response = dispatcher.handle_message(message);
    return expect(response["id"] == "req-7", "String request ids are echoed unchanged");
}

static std::vector<json> read_all(const std::string &bytes) {
    std::istringstream stream(bytes);
    std::vector<json> messages;
    while (true) {
        mcp_stdio::ReadResult result = mcp_stdio::read_message(stream);
        if (result.status != mcp_stdio::ReadStatus::Message) {
            break;
        }
        messages.push_back(result.message);
    }
    return messages;
}

static bool test_run_loop_stops_on_shutdown() {
    StubExecutor stub;
    mcp_dispatch::Dispatcher dispatcher(stub.executor(), server_config::ServerConfig{});

    std::string input = mcp_stdio::encode_message(request(1, "initialize")) +
                        mcp_stdio::encode_message({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}) +
                        mcp_stdio::encode_message(request(2, "shutdown")) +
                        mcp_stdio::encode_message(request(3, "tools/list"));
    std::istringstream in(input);
    std::ostringstream out;
    dispatcher.run(in, out);

    std::vector<json> responses = read_all(out.str());
    bool ok = responses.size() == 2 && responses[0]["id"] == 1 && responses[1]["id"] == 2 &&
              responses[1].contains("result") && responses[1]["result"].is_null() &&
              dispatcher.state() == mcp_dispatch::LifecycleState::Stopped && !dispatcher.should_continue();
    return expect(ok, "shutdown answers with a null result and the loop reads nothing further");
}

static bool test_run_loop_parse_and_framing_errors() {
    StubExecutor stub;
    mcp_dispatch::Dispatcher dispatcher(stub.executor(), server_config::ServerConfig{});

    std::string not_json = "{not json";
    std::string input = "Content-Length: " + std::to_string(not_json.size()) + "\r\n\r\n" + not_json +
                        "Content-Length: abc\r\n\r\n" +
                        mcp_stdio::encode_message(request(4, "tools/list"));
    std::istringstream in(input);
    std::ostringstream out;
    dispatcher.run(in, out);

    std::vector<json> responses = read_all(out.str());
    bool ok = responses.size() == 2 && responses[0]["error"]["code"] == -32700 && responses[0]["id"].is_null() &&
              responses[1]["id"] == 4 && responses[1]["result"]["tools"].size() == 8 &&
              dispatcher.state() == mcp_dispatch::LifecycleState::Stopped;
    return expect(ok, "Bad JSON gets -32700 with a null id; the loop keeps serving until end of input");
}

static size_t count_occurrences(const std::string &text, const std::string &needle) {
    size_t count = 0;
    for (size_t position = text.find(needle); position != std::string::npos;
         position = text.find(needle, position + needle.size())) {
        ++count;
    }
    return count;
}

static bool test_parse_error_logged_once() {
    StubExecutor stub;
    mcp_dispatch::Dispatcher dispatcher(stub.executor(), server_config::ServerConfig{});

    std::string not_json = "[1,";
    std::istringstream in("Content-Length: " + std::to_string(not_json.size()) + "\r\n\r\n" + not_json);
    std::ostringstream out;
    std::ostringstream log;
    std::streambuf *saved = std::cerr.rdbuf(log.rdbuf());
    dispatcher.run(in, out);
    std::cerr.rdbuf(saved);

    bool ok = count_occurrences(log.str(), "Failed to parse incoming JSON") == 1 &&
              read_all(out.str()).size() == 1;
    return expect(ok, "A body that is not JSON produces one log line and one -32700 response");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_initialize_then_list();
    all_passed &= test_initialized_with_id_gets_no_response();
    all_passed &= test_initial_state();
    all_passed &= test_unknown_tool();
    all_passed &= test_envelope_text_and_flag();
    all_passed &= test_context_defaults_and_overrides();
    all_passed &= test_unsupported_browser_is_in_band();
    all_passed &= test_missing_arguments_are_in_band();
    all_passed &= test_full_call_through_bridge();
    all_passed &= test_cli_mode_through_bridge();
    all_passed &= test_executor_exception();
    all_passed &= test_unknown_method_and_invalid_requests();
    all_passed &= test_string_ids_are_echoed();
    all_passed &= test_run_loop_stops_on_shutdown();
    all_passed &= test_run_loop_parse_and_framing_errors();
    all_passed &= test_parse_error_logged_once();
    return all_passed;
}

} // namespace test_dispatch
