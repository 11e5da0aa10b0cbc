#include "utils/string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace string_utils {

std::string to_lower(const std::string &input) {
    std::string result = input;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
    return result;
}

std::string trim(const std::string &input) {
    const char *whitespace = " \t\r\n";
    size_t first = input.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = input.find_last_not_of(whitespace);
    return input.substr(first, last - first + 1);
}

bool parse_bool(const std::string &input, bool fallback) {
    std::string normalized = to_lower(trim(input));
    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no") {
        return false;
    }
    return fallback;
}

} // namespace string_utils
