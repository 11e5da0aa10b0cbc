#ifndef PAGEMCP_BROWSER_DRIVER_ABI_HPP
#define PAGEMCP_BROWSER_DRIVER_ABI_HPP

// Browser driver abstraction interface.
// A Session bundles one engine instance, one isolated browsing context and one page.
// The CDP driver implements it for real engines; tests implement it with doubles.
// This keeps the tool_handlers layer decoupled from any particular browser protocol.

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace browser_driver {

// Interchangeable browser engines selectable per call.
enum class EngineFamily {
    Chromium,
    Firefox,
    Webkit
};

// "chromium" | "firefox" | "webkit". Returns nullopt for anything else.
std::optional<EngineFamily> parse_engine_family(const std::string &name);

std::string engine_family_name(EngineFamily family);

// All family names in declaration order (used for schema enums).
std::vector<std::string> engine_family_names();

// Options for launching one engine instance.
struct LaunchOptions {
    EngineFamily family = EngineFamily::Chromium;
    bool headless = true;
};

// Lifecycle event a navigation waits for.
enum class WaitUntil {
    Load,
    DomContentLoaded,
    NetworkIdle
};

// Element state a wait_for_selector call waits for.
enum class ElementState {
    Visible,
    Hidden,
    Attached
};

// Result of a browser driver operation.
struct DriverResult {
    bool success = false;
    std::string error_detail;
};

// Result of navigation.
struct NavigateResult {
    bool success = false;
    std::string url;        // final URL after redirects
    std::string title;
    int http_status = 0;    // 0 when the navigation produced no HTTP response (about:, data:)
    std::string error_text; // CDP errorText if navigation failed
};

// Result of capturing a screenshot. image_bytes holds the decoded PNG.
struct CaptureScreenshotResult {
    bool success = false;
    std::string image_bytes;
    std::string mime_type;
    std::string error_detail;
};

// Result of reading HTML or text from the page.
struct ContentResult {
    bool success = false;
    bool found = false;     // false when a selector matched nothing
    std::string content;
    std::string error_detail;
};

// Result of evaluating a script. result_json_string is the JSON serialization of the value
// ("null" for undefined).
struct EvaluateResult {
    bool success = false;
    std::string result_json_string;
    std::string error_detail;
};

// Result of reading an element attribute.
struct AttributeResult {
    bool success = false;
    bool has_value = false; // false when the element has no such attribute
    std::string value;
    std::string error_detail;
};

// The page of a session. Every call acts on the page as the last navigation left it.
class Page {
public:
    virtual ~Page() = default;

    virtual NavigateResult navigate(const std::string &url, WaitUntil wait_until) = 0;
    virtual std::string current_url() = 0;

    virtual CaptureScreenshotResult capture_screenshot(bool full_page) = 0;

    // Full document HTML (including doctype).
    virtual ContentResult get_html() = 0;
    // innerHTML of the first element matching selector; found=false if none.
    virtual ContentResult get_inner_html(const std::string &selector) = 0;
    // innerText of the first element matching selector; fails if none.
    virtual ContentResult get_inner_text(const std::string &selector) = 0;

    virtual DriverResult click(const std::string &selector) = 0;
    virtual DriverResult fill(const std::string &selector, const std::string &value) = 0;
    virtual EvaluateResult evaluate(const std::string &script) = 0;
    virtual AttributeResult get_attribute(const std::string &selector, const std::string &attribute) = 0;
    virtual DriverResult wait_for_selector(const std::string &selector, ElementState state,
                                           int timeout_milliseconds) = 0;
};

// One engine instance + isolated context + page. Destroying the session tears all three down.
class Session {
public:
    virtual ~Session() = default;
    virtual Page &page() = 0;
};

// Result of launching a session. On failure, session is null.
struct LaunchResult {
    bool success = false;
    std::unique_ptr<Session> session;
    std::string error_detail;
};

} // namespace browser_driver

#endif // PAGEMCP_BROWSER_DRIVER_ABI_HPP
