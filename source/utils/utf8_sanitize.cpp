#include "utils/utf8_sanitize.hpp"

#include <cstddef>

namespace utf8_sanitize {

namespace {

const char kReplacement[] = "\xEF\xBF\xBD"; // U+FFFD

// Length of the well-formed sequence starting at offset, or 0 if the lead byte at offset
// does not start one. Follows the table in Unicode 15, section 3.9 (D92).
size_t sequence_length(const unsigned char *bytes, size_t offset, size_t size) {
    unsigned char lead = bytes[offset];
    if (lead < 0x80u) {
        return 1;
    }

    size_t length = 0;
    unsigned char second_min = 0x80u;
    unsigned char second_max = 0xBFu;

    if (lead >= 0xC2u && lead <= 0xDFu) {
        length = 2;
    } else if (lead >= 0xE0u && lead <= 0xEFu) {
        length = 3;
        if (lead == 0xE0u) {
            second_min = 0xA0u; // overlong
        } else if (lead == 0xEDu) {
            second_max = 0x9Fu; // surrogates
        }
    } else if (lead >= 0xF0u && lead <= 0xF4u) {
        length = 4;
        if (lead == 0xF0u) {
            second_min = 0x90u;
        } else if (lead == 0xF4u) {
            second_max = 0x8Fu; // > U+10FFFF
        }
    } else {
        return 0;
    }

    if (offset + length > size) {
        return 0;
    }
    if (bytes[offset + 1] < second_min || bytes[offset + 1] > second_max) {
        return 0;
    }
    for (size_t index = 2; index < length; ++index) {
        if ((bytes[offset + index] & 0xC0u) != 0x80u) {
            return 0;
        }
    }
    return length;
}

} // namespace

bool is_valid(const std::string &text) {
    const unsigned char *bytes = reinterpret_cast<const unsigned char *>(text.data());
    size_t offset = 0;
    while (offset < text.size()) {
        size_t length = sequence_length(bytes, offset, text.size());
        if (length == 0) {
            return false;
        }
        offset += length;
    }
    return true;
}

void sanitize(std::string &text) {
    if (is_valid(text)) {
        return;
    }

    std::string result;
    result.reserve(text.size() + 8);

    const unsigned char *bytes = reinterpret_cast<const unsigned char *>(text.data());
    size_t offset = 0;
    while (offset < text.size()) {
        size_t length = sequence_length(bytes, offset, text.size());
        if (length == 0) {
            result.append(kReplacement);
            ++offset;
            continue;
        }
        result.append(text, offset, length);
        offset += length;
    }

    text = std::move(result);
}

std::string sanitize(const std::string &text) {
    std::string copy = text;
    sanitize(copy);
    return copy;
}

} // namespace utf8_sanitize
