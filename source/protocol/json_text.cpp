#include "protocol/json_text.hpp"

namespace json_text {

static std::string dump_scalar(const json &value) {
    return value.dump(-1, ' ', true, json::error_handler_t::replace);
}

static void append_value(const json &value, std::string &output) {
    if (value.is_object()) {
        output += '{';
        bool first = true;
        for (auto iterator = value.begin(); iterator != value.end(); ++iterator) {
            if (!first) {
                output += ", ";
            }
            first = false;
            output += dump_scalar(json(iterator.key()));
            output += ": ";
            append_value(iterator.value(), output);
        }
        output += '}';
        return;
    }

    if (value.is_array()) {
        output += '[';
        bool first = true;
        for (const auto &element : value) {
            if (!first) {
                output += ", ";
            }
            first = false;
            append_value(element, output);
        }
        output += ']';
        return;
    }

    output += dump_scalar(value);
}

std::string dump_spaced(const json &value) {
    std::string output;
    append_value(value, output);
    return output;
}

} // namespace json_text
