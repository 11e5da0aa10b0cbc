#ifndef PAGEMCP_CDP_DRIVER_HPP
#define PAGEMCP_CDP_DRIVER_HPP

// CDP (Chrome DevTools Protocol) driver.
// One CdpConnection is one WebSocket to one engine instance. It is owned by a single
// session and used from a single thread: send_command services the socket until the
// matching response arrives, and events received meanwhile are buffered for wait_for_event.

#include <nlohmann/json.hpp>
#include <deque>
#include <functional>
#include <map>
#include <string>

struct lws_context;
struct lws;

namespace cdp_driver {

using json = nlohmann::json;

// A CDP event (a message with a method and no id).
struct CdpEvent {
    std::string method;
    std::string session_id; // empty for browser-level events
    json params;
};

// State of one CDP connection.
struct ConnectionState {
    bool connected = false;
    bool connection_failed = false;
    struct lws_context *websocket_context = nullptr;
    struct lws *websocket_connection = nullptr;

    // CDP message ID counter (incremented for each request).
    int next_message_id = 1;

    // Pending request map: message id -> response JSON (filled when response arrives).
    std::map<int, json> pending_responses;

    // Buffer for incoming WebSocket fragments.
    std::string receive_buffer;

    // Events not consumed yet, oldest first.
    std::deque<CdpEvent> events;
    static constexpr size_t kEventsMax = 2000;
};

class CdpConnection {
public:
    CdpConnection() = default;
    ~CdpConnection();

    CdpConnection(const CdpConnection &) = delete;
    CdpConnection &operator=(const CdpConnection &) = delete;

    // Connect to the engine's browser-level WebSocket URL (ws://host:port/path).
    bool connect(const std::string &websocket_url, std::string &error_detail);

    // Close the WebSocket. Safe to call more than once.
    void disconnect();

    bool is_connected() const { return state.connected; }

    // Send a CDP command and wait for the response (blocking, with timeout).
    // If session_id is non-empty, the command is routed to that session.
    // Local failures come back as {"error": "<text>"}; protocol failures as CDP's
    // {"id": n, "error": {"code": c, "message": m}}. Use command_error() to check either.
    json send_command(const std::string &method, const json &params,
                      const std::string &session_id = "", int timeout_milliseconds = 10000);

    // Service the socket until an event matching predicate has been received, or timeout.
    // The matching event is removed from the buffer and copied to matched_event.
    bool wait_for_event(const std::function<bool(const CdpEvent &)> &predicate,
                        int timeout_milliseconds, CdpEvent *matched_event = nullptr);

    // Last buffered event matching predicate, or nullptr. Does not service the socket.
    const CdpEvent *find_last_event(const std::function<bool(const CdpEvent &)> &predicate) const;

    void clear_events();

    // Run the WebSocket event loop for up to timeout_milliseconds.
    void service(int timeout_milliseconds);

    // Called from the libwebsockets callback.
    void on_established();
    void on_receive(const char *data, size_t length, bool message_complete);
    void on_connection_error(const std::string &error_message);
    void on_closed();

private:
    ConnectionState state;
};

// Error text of a send_command response, or empty if the command succeeded.
std::string command_error(const json &response);

} // namespace cdp_driver

#endif // PAGEMCP_CDP_DRIVER_HPP
