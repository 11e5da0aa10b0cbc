#ifndef PAGEMCP_STRING_UTILS_HPP
#define PAGEMCP_STRING_UTILS_HPP

#include <string>

namespace string_utils {

std::string to_lower(const std::string &input);

// Strips leading and trailing whitespace (space, tab, CR, LF).
std::string trim(const std::string &input);

// Accepts 1/true/yes and 0/false/no (case-insensitive). Anything else returns fallback.
bool parse_bool(const std::string &input, bool fallback);

} // namespace string_utils

#endif // PAGEMCP_STRING_UTILS_HPP
