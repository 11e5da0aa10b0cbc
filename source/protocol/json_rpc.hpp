#ifndef PAGEMCP_JSON_RPC_HPP
#define PAGEMCP_JSON_RPC_HPP

// JSON-RPC 2.0 helpers for the MCP tool server.
// Objects keep their insertion order (nlohmann::ordered_json) so responses read the way they are built.

#include <nlohmann/json.hpp>
#include <string>

namespace json_rpc {

using json = nlohmann::ordered_json;

// Standard JSON-RPC error codes.
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;

// Build a JSON-RPC 2.0 success response. The id is echoed verbatim.
json build_response(const json &request_id, const json &result_payload);

// Build a JSON-RPC 2.0 error response.
json build_error_response(const json &request_id, int error_code, const std::string &error_message);

// Method name of a request/notification, or empty if missing or not a string.
std::string get_method(const json &message);

// The id of a message, or a null json value if absent.
json get_id(const json &message);

// Params object of a message, or an empty object if missing or not an object.
json get_params(const json &message);

// A message without an id, or with a null id, expects no response.
bool is_notification(const json &message);

} // namespace json_rpc

#endif // PAGEMCP_JSON_RPC_HPP
