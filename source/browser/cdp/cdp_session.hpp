#ifndef PAGEMCP_CDP_SESSION_HPP
#define PAGEMCP_CDP_SESSION_HPP

// CDP implementation of browser_driver::Session and browser_driver::Page.
// A session owns the engine process, its WebSocket, one isolated browser context
// (Target.createBrowserContext) and one page target attached in flatten mode.
// The destructor disposes the context, closes the socket, reaps the process and
// removes the profile directory.

#include <string>

#include "browser/browser_driver_abi.hpp"
#include "browser/cdp/cdp_driver.hpp"
#include "browser/cdp/cdp_engine_launch.hpp"

namespace cdp_session {

class CdpPage : public browser_driver::Page {
public:
    CdpPage(cdp_driver::CdpConnection &connection, const std::string &session_id);

    browser_driver::NavigateResult navigate(const std::string &url,
                                            browser_driver::WaitUntil wait_until) override;
    std::string current_url() override;

    browser_driver::CaptureScreenshotResult capture_screenshot(bool full_page) override;

    browser_driver::ContentResult get_html() override;
    browser_driver::ContentResult get_inner_html(const std::string &selector) override;
    browser_driver::ContentResult get_inner_text(const std::string &selector) override;

    browser_driver::DriverResult click(const std::string &selector) override;
    browser_driver::DriverResult fill(const std::string &selector, const std::string &value) override;
    browser_driver::EvaluateResult evaluate(const std::string &script) override;
    browser_driver::AttributeResult get_attribute(const std::string &selector,
                                                  const std::string &attribute) override;
    browser_driver::DriverResult wait_for_selector(const std::string &selector,
                                                   browser_driver::ElementState state,
                                                   int timeout_milliseconds) override;

private:
    // Runtime.evaluate with returnByValue and awaitPromise. On success value holds the result.
    bool evaluate_value(const std::string &expression, int timeout_milliseconds,
                        cdp_driver::json &value, std::string &error_detail);

    // Fallback for click: element.click() in page.
    browser_driver::DriverResult click_by_script(const std::string &selector);

    cdp_driver::CdpConnection &connection;
    std::string session_id;
};

class CdpSession : public browser_driver::Session {
public:
    CdpSession(int process_id, const std::string &user_data_directory);
    ~CdpSession() override;

    CdpSession(const CdpSession &) = delete;
    CdpSession &operator=(const CdpSession &) = delete;

    // Connect, create the isolated context and the page. Returns false with error_detail on failure;
    // the caller destroys the session, which cleans up whatever was created.
    bool open(const std::string &websocket_url, std::string &error_detail);

    browser_driver::Page &page() override;

private:
    cdp_driver::CdpConnection connection;
    int process_id = -1;
    std::string user_data_directory;
    std::string browser_context_id;
    std::string target_id;
    std::string session_id;
    std::unique_ptr<CdpPage> attached_page;
};

// Full-page clip from a Page.getLayoutMetrics result (cssContentSize, else contentSize).
// Returns false if the result carries no numeric width and height.
bool content_size_clip(const cdp_driver::json &layout_metrics, cdp_driver::json &clip);

// Center of the content quad of a DOM.getBoxModel result. Returns false unless
// model.content holds eight numbers.
bool box_model_center(const cdp_driver::json &box_model_result, double &x, double &y);

// Launch an engine and open a session on it.
browser_driver::LaunchResult launch_session(const browser_driver::LaunchOptions &options,
                                            const cdp_engine_launch::ExecutableOverrides &overrides);

} // namespace cdp_session

#endif // PAGEMCP_CDP_SESSION_HPP
