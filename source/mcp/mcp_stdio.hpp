#ifndef PAGEMCP_MCP_STDIO_HPP
#define PAGEMCP_MCP_STDIO_HPP

// MCP stdio transport: Content-Length framed JSON messages on a single byte stream.
//
//   Content-Length: 17\r\n
//   \r\n
//   {"jsonrpc":"2.0"}
//
// Diagnostics go to stderr only; the framed stream is never used for logging.

#include <nlohmann/json.hpp>
#include <iosfwd>
#include <string>

namespace mcp_stdio {

using json = nlohmann::ordered_json;

enum class ReadStatus {
    Message,      // message holds the parsed body
    EndOfStream,  // input closed (also when it closes mid-frame)
    FramingError, // header block without a usable Content-Length (missing, malformed or over 64 MiB); frame abandoned
    ParseError    // body read in full but it is not valid JSON
};

struct ReadResult {
    ReadStatus status = ReadStatus::EndOfStream;
    json message;
    std::string error_detail;
};

// Consume one frame from input.
ReadResult read_message(std::istream &input);

// Serialize compactly and write header plus body as a single write. Thread-safe.
void write_message(std::ostream &output, const json &message);

// The exact bytes write_message emits for message.
std::string encode_message(const json &message);

// Write a log line to stderr with the [pagemcp] prefix.
void log_message(const std::string &message);

} // namespace mcp_stdio

#endif // PAGEMCP_MCP_STDIO_HPP
