#ifndef PAGEMCP_JSON_TEXT_HPP
#define PAGEMCP_JSON_TEXT_HPP

// Text rendering of tool results for the "text" content item of a tools/call envelope.
// Uses ", " between items and ": " after keys,
// keeps object keys in insertion order and writes non-ASCII characters as \uXXXX escapes.

#include <nlohmann/json.hpp>
#include <string>

namespace json_text {

using json = nlohmann::ordered_json;

// {"status": "success", "content": "hello"}
std::string dump_spaced(const json &value);

} // namespace json_text

#endif // PAGEMCP_JSON_TEXT_HPP
