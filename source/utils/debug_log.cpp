#include "utils/debug_log.hpp"
#include "utils/string_utils.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

namespace debug_log {

// Read once; the environment does not change while the server runs.
static int cached_debug_flag = -1;

bool is_debug_enabled() {
    if (cached_debug_flag < 0) {
        const char *value = std::getenv("PAGEMCP_DEBUG");
        bool enabled = false;
        if (value != nullptr && value[0] != '\0') {
            enabled = string_utils::parse_bool(value, false);
        }
        cached_debug_flag = enabled ? 1 : 0;
    }
    return cached_debug_flag == 1;
}

void log(const std::string &message) {
    if (!is_debug_enabled()) {
        return;
    }
    std::cerr << "[pagemcp] " << message << std::endl;
}

} // namespace debug_log
