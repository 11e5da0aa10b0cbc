#include "mcp/mcp_stdio.hpp"
#include "utils/string_utils.hpp"

#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace mcp_stdio {

static std::mutex output_mutex;

// Largest body accepted; a bigger Content-Length abandons the frame.
static const size_t MAX_CONTENT_LENGTH = 64 * 1024 * 1024;

// Reads one header line, without its CRLF (a bare LF is accepted too).
// Returns false on EOF before any byte of the line was read.
static bool read_header_line(std::istream &input, std::string &line) {
    line.clear();
    if (!std::getline(input, line)) {
        return false;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

// Parses a Content-Length value: decimal digits only, no sign.
static bool parse_content_length(const std::string &text, size_t &length) {
    if (text.empty() || text.size() > 18) {
        return false;
    }
    size_t value = 0;
    for (char character : text) {
        if (character < '0' || character > '9') {
            return false;
        }
        value = value * 10 + static_cast<size_t>(character - '0');
    }
    length = value;
    return true;
}

ReadResult read_message(std::istream &input) {
    ReadResult result;

    bool saw_any_header = false;
    bool has_content_length = false;
    std::string content_length_text;
    std::string line;

    while (true) {
        if (!read_header_line(input, line)) {
            result.status = ReadStatus::EndOfStream;
            return result;
        }
        if (line.empty()) {
            if (!saw_any_header) {
                // Stray blank line between frames.
                continue;
            }
            break;
        }
        saw_any_header = true;

        auto colon_position = line.find(':');
        if (colon_position == std::string::npos) {
            log_message("Ignoring malformed header line: " + line.substr(0, 200));
            continue;
        }
        std::string key = string_utils::to_lower(string_utils::trim(line.substr(0, colon_position)));
        std::string value = string_utils::trim(line.substr(colon_position + 1));
        if (key == "content-length") {
            has_content_length = true;
            content_length_text = value;
        }
    }

    if (!has_content_length) {
        result.status = ReadStatus::FramingError;
        result.error_detail = "Missing Content-Length header";
        log_message(result.error_detail);
        return result;
    }

    size_t content_length = 0;
    if (!parse_content_length(content_length_text, content_length)) {
        result.status = ReadStatus::FramingError;
        result.error_detail = "Invalid Content-Length: " + content_length_text;
        log_message(result.error_detail);
        return result;
    }
    if (content_length > MAX_CONTENT_LENGTH) {
        result.status = ReadStatus::FramingError;
        result.error_detail = "Content-Length " + content_length_text + " exceeds the " +
                              std::to_string(MAX_CONTENT_LENGTH) + " byte limit";
        log_message(result.error_detail);
        return result;
    }

    std::string body(content_length, '\0');
    if (content_length > 0) {
        input.read(&body[0], static_cast<std::streamsize>(content_length));
        if (static_cast<size_t>(input.gcount()) != content_length) {
            log_message("Input closed in the middle of a message body (expected " +
                        std::to_string(content_length) + " bytes, got " +
                        std::to_string(input.gcount()) + ").");
            result.status = ReadStatus::EndOfStream;
            return result;
        }
    }

    try {
        result.message = json::parse(body);
        result.status = ReadStatus::Message;
    } catch (const json::parse_error &error) {
        result.status = ReadStatus::ParseError;
        result.error_detail = error.what();
        log_message("Failed to parse incoming JSON: " + result.error_detail);
    }
    return result;
}

std::string encode_message(const json &message) {
    std::string body = message.dump(-1, ' ', false, json::error_handler_t::replace);
    // std::string::size() is a byte count, which is what Content-Length names.
    std::string frame = "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
    frame += body;
    return frame;
}

void write_message(std::ostream &output, const json &message) {
    std::string frame = encode_message(message);
    std::lock_guard<std::mutex> lock(output_mutex);
    output.write(frame.data(), static_cast<std::streamsize>(frame.size()));
    output.flush();
}

void log_message(const std::string &message) {
    std::cerr << "[pagemcp] " << message << std::endl;
}

} // namespace mcp_stdio
