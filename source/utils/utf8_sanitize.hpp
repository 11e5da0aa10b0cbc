#ifndef PAGEMCP_UTF8_SANITIZE_HPP
#define PAGEMCP_UTF8_SANITIZE_HPP

#include <string>

namespace utf8_sanitize {

// True if text is well-formed UTF-8 (no overlongs, surrogates or code points past U+10FFFF).
bool is_valid(const std::string &text);

// Replaces every ill-formed byte with U+FFFD. In-place version.
void sanitize(std::string &text);

// Replaces every ill-formed byte with U+FFFD. Returns a new string.
std::string sanitize(const std::string &text);

} // namespace utf8_sanitize

#endif // PAGEMCP_UTF8_SANITIZE_HPP
