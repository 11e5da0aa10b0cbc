#include "browser/cdp/cdp_driver.hpp"
#include "utils/debug_log.hpp"

#include <libwebsockets.h>
#include <chrono>
#include <cstring>
#include <iostream>
#include <vector>

namespace cdp_driver {

// Forward declaration of the WebSocket callback.
static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length);

// WebSocket protocol definition for libwebsockets.
static const struct lws_protocols websocket_protocols[] = {
    {
        "cdp-protocol",
        websocket_callback,
        0,    // per-session data size
        65536 // rx buffer size
    },
    {nullptr, nullptr, 0, 0} // sentinel
};

static const int CONNECTION_TIMEOUT_MILLISECONDS = 20000;

// --- WebSocket callback ---

// The owning CdpConnection is stored as the context user pointer.
static CdpConnection *connection_for(struct lws *websocket_instance) {
    if (websocket_instance == nullptr) {
        return nullptr;
    }
    struct lws_context *context = lws_get_context(websocket_instance);
    if (context == nullptr) {
        return nullptr;
    }
    return static_cast<CdpConnection *>(lws_context_user(context));
}

static int websocket_callback(struct lws *websocket_instance, enum lws_callback_reasons reason,
                              void *user_data, void *incoming_data, size_t incoming_length) {
    (void)user_data;

    CdpConnection *connection = connection_for(websocket_instance);
    if (connection == nullptr) {
        return 0;
    }

    switch (reason) {
    case LWS_CALLBACK_CLIENT_ESTABLISHED:
        connection->on_established();
        break;

    case LWS_CALLBACK_CLIENT_RECEIVE: {
        bool message_complete = lws_is_final_fragment(websocket_instance) &&
                                lws_remaining_packet_payload(websocket_instance) == 0;
        connection->on_receive(static_cast<const char *>(incoming_data), incoming_length, message_complete);
        break;
    }

    case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
        const char *error_message = incoming_data ? static_cast<const char *>(incoming_data) : "unknown";
        connection->on_connection_error(error_message);
        break;
    }

    case LWS_CALLBACK_CLIENT_CLOSED:
        connection->on_closed();
        break;

    default:
        break;
    }

    return 0;
}

// --- Callback handlers ---

void CdpConnection::on_established() {
    state.connected = true;
    debug_log::log("CDP WebSocket connected.");
}

void CdpConnection::on_receive(const char *data, size_t length, bool message_complete) {
    state.receive_buffer.append(data, length);
    if (!message_complete) {
        return;
    }

    json message;
    try {
        message = json::parse(state.receive_buffer);
    } catch (const json::parse_error &parse_error) {
        std::cerr << "[pagemcp] Failed to parse CDP message: " << parse_error.what()
                  << ", buffer content: " << state.receive_buffer.substr(0, 200) << std::endl;
        state.receive_buffer.clear();
        return;
    }
    state.receive_buffer.clear();

    // Responses carry an id; events carry a method and no id.
    if (message.contains("id") && message["id"].is_number_integer()) {
        int message_id = message["id"].get<int>();
        state.pending_responses[message_id] = std::move(message);
        return;
    }

    if (!message.contains("method") || !message["method"].is_string()) {
        return;
    }

    CdpEvent event;
    event.method = message["method"].get<std::string>();
    if (message.contains("sessionId") && message["sessionId"].is_string()) {
        event.session_id = message["sessionId"].get<std::string>();
    }
    if (message.contains("params")) {
        event.params = std::move(message["params"]);
    }
    state.events.push_back(std::move(event));
    while (state.events.size() > ConnectionState::kEventsMax) {
        state.events.pop_front();
    }
}

void CdpConnection::on_connection_error(const std::string &error_message) {
    std::cerr << "[pagemcp] CDP WebSocket connection error: " << error_message << std::endl;
    state.connected = false;
    state.connection_failed = true;
}

void CdpConnection::on_closed() {
    debug_log::log("CDP WebSocket closed.");
    state.connected = false;
}

// --- Public functions ---

CdpConnection::~CdpConnection() {
    disconnect();
}

bool CdpConnection::connect(const std::string &websocket_url, std::string &error_detail) {
    debug_log::log("connect() URL=" + websocket_url);

    std::string url_without_scheme = websocket_url;
    if (url_without_scheme.compare(0, 5, "ws://") == 0) {
        url_without_scheme = url_without_scheme.substr(5);
    }

    // Split host:port from path.
    std::string host_and_port;
    std::string path = "/";
    auto slash_position = url_without_scheme.find('/');
    if (slash_position != std::string::npos) {
        host_and_port = url_without_scheme.substr(0, slash_position);
        path = url_without_scheme.substr(slash_position);
    } else {
        host_and_port = url_without_scheme;
    }

    // Split host from port.
    std::string host = "127.0.0.1";
    int port = 9222;
    auto colon_position = host_and_port.find(':');
    if (colon_position != std::string::npos) {
        host = host_and_port.substr(0, colon_position);
        try {
            port = std::stoi(host_and_port.substr(colon_position + 1));
        } catch (const std::exception &) {
            error_detail = "Failed to parse port from WebSocket URL: " + websocket_url;
            return false;
        }
    }

    lws_set_log_level(LLL_ERR, nullptr);

    struct lws_context_creation_info context_info;
    memset(&context_info, 0, sizeof(context_info));
    context_info.port = CONTEXT_PORT_NO_LISTEN; // Client mode, no listening.
    context_info.protocols = websocket_protocols;
    context_info.gid = -1;
    context_info.uid = -1;
    context_info.user = this;

    state.websocket_context = lws_create_context(&context_info);
    if (state.websocket_context == nullptr) {
        error_detail = "Failed to create libwebsockets context.";
        return false;
    }

    struct lws_client_connect_info connect_info;
    memset(&connect_info, 0, sizeof(connect_info));
    connect_info.context = state.websocket_context;
    connect_info.address = host.c_str();
    connect_info.port = port;
    connect_info.path = path.c_str();
    connect_info.host = host.c_str();
    connect_info.origin = nullptr;
    connect_info.protocol = nullptr;

    debug_log::log("connect() host=" + host + " port=" + std::to_string(port) + " path=" + path);
    state.connection_failed = false;
    state.websocket_connection = lws_client_connect_via_info(&connect_info);
    if (state.websocket_connection == nullptr) {
        error_detail = "Failed to initiate CDP WebSocket connection to " + websocket_url;
        lws_context_destroy(state.websocket_context);
        state.websocket_context = nullptr;
        return false;
    }

    auto start_time = std::chrono::steady_clock::now();
    while (!state.connected) {
        lws_service(state.websocket_context, 50);

        if (state.connection_failed) {
            error_detail = "CDP WebSocket connection to " + websocket_url + " failed.";
            lws_context_destroy(state.websocket_context);
            state.websocket_context = nullptr;
            state.websocket_connection = nullptr;
            return false;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > CONNECTION_TIMEOUT_MILLISECONDS) {
            error_detail = "Timed out connecting to CDP WebSocket after " +
                           std::to_string(CONNECTION_TIMEOUT_MILLISECONDS / 1000) + " s.";
            lws_context_destroy(state.websocket_context);
            state.websocket_context = nullptr;
            state.websocket_connection = nullptr;
            return false;
        }
    }

    return true;
}

void CdpConnection::disconnect() {
    if (state.websocket_context != nullptr) {
        lws_context_destroy(state.websocket_context);
        state.websocket_context = nullptr;
        debug_log::log("disconnect(): WebSocket context destroyed.");
    }
    state.websocket_connection = nullptr;
    state.connected = false;
    state.pending_responses.clear();
    state.events.clear();
    state.receive_buffer.clear();
}

void CdpConnection::service(int timeout_milliseconds) {
    if (state.websocket_context != nullptr) {
        lws_service(state.websocket_context, timeout_milliseconds);
    }
}

json CdpConnection::send_command(const std::string &method, const json &params,
                                 const std::string &session_id, int timeout_milliseconds) {
    if (!state.connected || state.websocket_connection == nullptr) {
        json error_response;
        error_response["error"] = "Not connected to CDP";
        return error_response;
    }

    int message_id = state.next_message_id++;
    json command;
    command["id"] = message_id;
    command["method"] = method;
    if (!params.is_null() && !params.empty()) {
        command["params"] = params;
    }
    if (!session_id.empty()) {
        command["sessionId"] = session_id;
    }

    std::string serialized_command = command.dump(-1, ' ', false, json::error_handler_t::replace);
    debug_log::log("CDP -> " + method + " (id=" + std::to_string(message_id) + ")");

    // libwebsockets requires LWS_PRE bytes of padding before the data.
    std::vector<unsigned char> send_buffer(LWS_PRE + serialized_command.size());
    memcpy(send_buffer.data() + LWS_PRE, serialized_command.data(), serialized_command.size());

    int bytes_written = lws_write(state.websocket_connection,
                                  send_buffer.data() + LWS_PRE,
                                  serialized_command.size(), LWS_WRITE_TEXT);
    if (bytes_written < 0) {
        json error_response;
        error_response["error"] = "Failed to send CDP command via WebSocket";
        return error_response;
    }

    auto start_time = std::chrono::steady_clock::now();
    while (true) {
        lws_service(state.websocket_context, 10);

        auto response_iterator = state.pending_responses.find(message_id);
        if (response_iterator != state.pending_responses.end()) {
            json response = std::move(response_iterator->second);
            state.pending_responses.erase(response_iterator);
            return response;
        }

        if (!state.connected) {
            json error_response;
            error_response["error"] = "CDP connection closed while waiting for response to method: " + method;
            return error_response;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > timeout_milliseconds) {
            json error_response;
            error_response["error"] = "Timed out waiting for CDP response to method: " + method;
            error_response["message_id"] = message_id;
            return error_response;
        }
    }
}

bool CdpConnection::wait_for_event(const std::function<bool(const CdpEvent &)> &predicate,
                                   int timeout_milliseconds, CdpEvent *matched_event) {
    auto start_time = std::chrono::steady_clock::now();
    while (true) {
        for (auto iterator = state.events.begin(); iterator != state.events.end(); ++iterator) {
            if (predicate(*iterator)) {
                if (matched_event != nullptr) {
                    *matched_event = *iterator;
                }
                state.events.erase(iterator);
                return true;
            }
        }

        if (!state.connected) {
            return false;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() > timeout_milliseconds) {
            return false;
        }
        lws_service(state.websocket_context, 20);
    }
}

const CdpEvent *CdpConnection::find_last_event(const std::function<bool(const CdpEvent &)> &predicate) const {
    for (auto iterator = state.events.rbegin(); iterator != state.events.rend(); ++iterator) {
        if (predicate(*iterator)) {
            return &(*iterator);
        }
    }
    return nullptr;
}

void CdpConnection::clear_events() {
    state.events.clear();
}

std::string command_error(const json &response) {
    if (!response.is_object()) {
        return "Unexpected CDP response";
    }
    if (!response.contains("error")) {
        return "";
    }
    const json &error_value = response["error"];
    if (error_value.is_string()) {
        return error_value.get<std::string>();
    }
    if (error_value.is_object() && error_value.contains("message") && error_value["message"].is_string()) {
        return error_value["message"].get<std::string>();
    }
    return error_value.dump();
}

} // namespace cdp_driver
