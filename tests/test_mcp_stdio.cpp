// Tests for Content-Length framing on in-memory streams.

#include "mcp/mcp_stdio.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace test_mcp_stdio {

using json = mcp_stdio::json;

static std::string frame(const std::string &body) {
    return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

static bool expect(bool condition, const std::string &description) {
    if (condition) {
        std::cout << "  OK: " << description << std::endl;
    } else {
        std::cout << "  FAIL: " << description << std::endl;
    }
    return condition;
}

static bool test_round_trip() {
    json message = {{"jsonrpc", "2.0"}, {"id", 7}, {"method", "tools/list"}, {"params", json::object()}};
    std::stringstream stream;
    mcp_stdio::write_message(stream, message);

    mcp_stdio::ReadResult result = mcp_stdio::read_message(stream);
    bool first_ok = result.status == mcp_stdio::ReadStatus::Message && result.message == message;
    mcp_stdio::ReadResult after = mcp_stdio::read_message(stream);
    return expect(first_ok && after.status == mcp_stdio::ReadStatus::EndOfStream,
                  "Written frame reads back as an equal value, then end of stream");
}

static bool test_content_length_counts_bytes() {
    json ascii = {{"a", 1}};
    std::string encoded = mcp_stdio::encode_message(ascii);
    bool ascii_ok = encoded == "Content-Length: 7\r\n\r\n{\"a\":1}";

    // "é" is two bytes and "日本" six in UTF-8.
    json multibyte = {{"text", "caf\xC3\xA9 \xE6\x97\xA5\xE6\x9C\xAC"}};
    std::string body = multibyte.dump();
    std::string multibyte_encoded = mcp_stdio::encode_message(multibyte);
    bool multibyte_ok = body.size() == 23 &&
                        multibyte_encoded == "Content-Length: 23\r\n\r\n" + body;

    return expect(ascii_ok && multibyte_ok, "Content-Length is the UTF-8 byte count of the compact body");
}

static bool test_headers_case_insensitive_and_lf_tolerated() {
    std::string body = "{\"id\":1,\"method\":\"initialize\"}";
    std::stringstream stream("content-length:   " + std::to_string(body.size()) +
                             "\nContent-Type: application/vscode-jsonrpc; charset=utf-8\n\n" + body);

    mcp_stdio::ReadResult result = mcp_stdio::read_message(stream);
    return expect(result.status == mcp_stdio::ReadStatus::Message && result.message["method"] == "initialize",
                  "Lower-case header key, extra headers and bare LF are accepted");
}

static bool test_bad_content_length_then_recovery() {
    std::string good = frame("{\"id\":2,\"method\":\"tools/list\"}");
    std::stringstream stream("Content-Length: abc\r\n\r\n" + good);

    mcp_stdio::ReadResult bad = mcp_stdio::read_message(stream);
    mcp_stdio::ReadResult next = mcp_stdio::read_message(stream);
    return expect(bad.status == mcp_stdio::ReadStatus::FramingError &&
                      next.status == mcp_stdio::ReadStatus::Message && next.message["id"] == 2,
                  "Non-integer Content-Length is a framing error and the next frame still reads");
}

static bool test_negative_and_missing_content_length() {
    std::stringstream negative("Content-Length: -5\r\n\r\n");
    std::stringstream missing("X-Other: 1\r\n\r\n");
    bool negative_ok = mcp_stdio::read_message(negative).status == mcp_stdio::ReadStatus::FramingError;
    bool missing_ok = mcp_stdio::read_message(missing).status == mcp_stdio::ReadStatus::FramingError;
    return expect(negative_ok && missing_ok, "Negative or missing Content-Length is a framing error");
}

static bool test_oversized_content_length_is_rejected_before_allocating() {
    std::string good = frame("{\"id\":3,\"method\":\"tools/list\"}");
    std::stringstream stream("Content-Length: 900000000000000\r\n\r\n{}\r\n" + good);

    mcp_stdio::ReadResult oversized;
    mcp_stdio::ReadResult next;
    try {
        oversized = mcp_stdio::read_message(stream);
        next = mcp_stdio::read_message(stream);
    } catch (const std::exception &error) {
        return expect(false, std::string("Oversized Content-Length threw: ") + error.what());
    }
    return expect(oversized.status == mcp_stdio::ReadStatus::FramingError &&
                      next.status == mcp_stdio::ReadStatus::Message && next.message["id"] == 3,
                  "Content-Length above the limit is a framing error and the next frame still reads");
}

static bool test_body_not_json() {
    std::stringstream stream(frame("{not json"));
    mcp_stdio::ReadResult result = mcp_stdio::read_message(stream);
    return expect(result.status == mcp_stdio::ReadStatus::ParseError && !result.error_detail.empty(),
                  "Framed body that is not JSON is a parse error");
}

static bool test_eof_mid_body() {
    std::stringstream stream("Content-Length: 50\r\n\r\n{\"id\":1");
    return expect(mcp_stdio::read_message(stream).status == mcp_stdio::ReadStatus::EndOfStream,
                  "Stream closing mid-body is end of stream");
}

static bool test_empty_input() {
    std::stringstream stream("");
    std::stringstream blank_lines("\r\n\r\n");
    return expect(mcp_stdio::read_message(stream).status == mcp_stdio::ReadStatus::EndOfStream &&
                      mcp_stdio::read_message(blank_lines).status == mcp_stdio::ReadStatus::EndOfStream,
                  "Empty input and stray blank lines end the stream without an error");
}

static bool test_back_to_back_frames() {
    std::stringstream stream(frame("{\"id\":1}") + frame("{\"id\":2}") + frame("[1,2,3]"));
    mcp_stdio::ReadResult first = mcp_stdio::read_message(stream);
    mcp_stdio::ReadResult second = mcp_stdio::read_message(stream);
    mcp_stdio::ReadResult third = mcp_stdio::read_message(stream);
    return expect(first.message["id"] == 1 && second.message["id"] == 2 && third.message.is_array(),
                  "Frames with no gap between them are split by length");
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_round_trip();
    all_passed &= test_content_length_counts_bytes();
    all_passed &= test_headers_case_insensitive_and_lf_tolerated();
    all_passed &= test_bad_content_length_then_recovery();
    all_passed &= test_negative_and_missing_content_length();
    all_passed &= test_oversized_content_length_is_rejected_before_allocating();
    all_passed &= test_body_not_json();
    all_passed &= test_eof_mid_body();
    all_passed &= test_empty_input();
    all_passed &= test_back_to_back_frames();
    return all_passed;
}

} // namespace test_mcp_stdio
