#include "browser/browser_driver_abi.hpp"

namespace browser_driver {

std::optional<EngineFamily> parse_engine_family(const std::string &name) {
    if (name == "chromium") {
        return EngineFamily::Chromium;
    }
    if (name == "firefox") {
        return EngineFamily::Firefox;
    }
    if (name == "webkit") {
        return EngineFamily::Webkit;
    }
    return std::nullopt;
}

std::string engine_family_name(EngineFamily family) {
    switch (family) {
    case EngineFamily::Chromium:
        return "chromium";
    case EngineFamily::Firefox:
        return "firefox";
    case EngineFamily::Webkit:
        return "webkit";
    }
    return "unknown";
}

std::vector<std::string> engine_family_names() {
    return {
        engine_family_name(EngineFamily::Chromium),
        engine_family_name(EngineFamily::Firefox),
        engine_family_name(EngineFamily::Webkit),
    };
}

} // namespace browser_driver
