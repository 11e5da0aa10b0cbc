#include "bridge/direct_backend.hpp"
#include "tool_handlers/tool_handlers.hpp"
#include "utils/debug_log.hpp"

#include <memory>

namespace direct_backend {

// Selects the handler for the argument record's type.
struct HandlerVisitor {
    browser_driver::Page &page;

    json operator()(const tool_arguments::NavigateArguments &arguments) const {
        return tool_navigate::run(page, arguments);
    }
    json operator()(const tool_arguments::ScreenshotArguments &arguments) const {
        return tool_screenshot::run(page, arguments);
    }
    json operator()(const tool_arguments::GetContentArguments &arguments) const {
        return tool_get_content::run(page, arguments);
    }
    json operator()(const tool_arguments::ClickArguments &arguments) const {
        return tool_click::run(page, arguments);
    }
    json operator()(const tool_arguments::FillArguments &arguments) const {
        return tool_fill::run(page, arguments);
    }
    json operator()(const tool_arguments::ExecuteScriptArguments &arguments) const {
        return tool_execute_script::run(page, arguments);
    }
    json operator()(const tool_arguments::GetAttributeArguments &arguments) const {
        return tool_get_attribute::run(page, arguments);
    }
    json operator()(const tool_arguments::WaitForArguments &arguments) const {
        return tool_wait_for::run(page, arguments);
    }
};

json execute(const SessionLauncher &launcher, const std::string &engine_family, bool headless,
             const tool_arguments::ToolArguments &arguments) {
    std::optional<browser_driver::EngineFamily> family = browser_driver::parse_engine_family(engine_family);
    if (!family) {
        return tool_handlers::error_result("Unsupported browser: " + engine_family);
    }

    browser_driver::LaunchOptions options;
    options.family = *family;
    options.headless = headless;

    browser_driver::LaunchResult launch_result = launcher(options);
    std::unique_ptr<browser_driver::Session> session = std::move(launch_result.session);
    if (!launch_result.success || !session) {
        std::string detail = launch_result.error_detail.empty() ? "unknown error" : launch_result.error_detail;
        return tool_handlers::error_result("Failed to launch " + engine_family + ": " + detail);
    }

    debug_log::log("Session launched for " + engine_family);
    // session goes out of scope on return or throw; its destructor tears the engine down.
    return std::visit(HandlerVisitor{session->page()}, arguments);
}

} // namespace direct_backend
