#include "browser/cdp/cdp_session.hpp"
#include "platform/platform_abi.hpp"
#include "utils/debug_log.hpp"
#include "utils/utf8_sanitize.hpp"

#include <libwebsockets.h>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace cdp_session {

using json = cdp_driver::json;

static const int NAVIGATION_TIMEOUT_MILLISECONDS = 30000;
static const int SCRIPT_TIMEOUT_MILLISECONDS = 30000;
static const int ACTION_TIMEOUT_MILLISECONDS = 10000;
static const int WAIT_POLL_INTERVAL_MILLISECONDS = 100;

// JSON string literal for embedding a value in a script.
static std::string js_literal(const std::string &value) {
    return json(value).dump(-1, ' ', false, json::error_handler_t::replace);
}

static std::string lifecycle_event_name(browser_driver::WaitUntil wait_until) {
    switch (wait_until) {
    case browser_driver::WaitUntil::Load:
        return "load";
    case browser_driver::WaitUntil::DomContentLoaded:
        return "DOMContentLoaded";
    case browser_driver::WaitUntil::NetworkIdle:
        return "networkIdle";
    }
    return "load";
}

static std::string element_state_name(browser_driver::ElementState state) {
    switch (state) {
    case browser_driver::ElementState::Visible:
        return "visible";
    case browser_driver::ElementState::Hidden:
        return "hidden";
    case browser_driver::ElementState::Attached:
        return "attached";
    }
    return "visible";
}

static std::string string_field(const json &object, const char *key) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "";
}

// --- CdpPage ---

CdpPage::CdpPage(cdp_driver::CdpConnection &connection, const std::string &session_id)
    : connection(connection), session_id(session_id) {}

bool CdpPage::evaluate_value(const std::string &expression, int timeout_milliseconds,
                             json &value, std::string &error_detail) {
    json eval_params;
    eval_params["expression"] = expression;
    eval_params["returnByValue"] = true;
    eval_params["awaitPromise"] = true;
    json eval_response = connection.send_command("Runtime.evaluate", eval_params, session_id,
                                                 timeout_milliseconds);

    std::string command_error = cdp_driver::command_error(eval_response);
    if (!command_error.empty()) {
        error_detail = command_error;
        return false;
    }
    if (!eval_response.contains("result")) {
        error_detail = "Runtime.evaluate did not return a result.";
        return false;
    }

    const json &eval_result = eval_response["result"];
    if (eval_result.contains("exceptionDetails")) {
        const json &details = eval_result["exceptionDetails"];
        std::string description;
        if (details.contains("exception")) {
            description = string_field(details["exception"], "description");
        }
        if (description.empty()) {
            description = string_field(details, "text");
        }
        error_detail = description.empty() ? "Script raised an exception." : description;
        utf8_sanitize::sanitize(error_detail);
        return false;
    }

    value = nullptr;
    if (eval_result.contains("result") && eval_result["result"].contains("value")) {
        value = eval_result["result"]["value"];
    }
    return true;
}

browser_driver::NavigateResult CdpPage::navigate(const std::string &url,
                                                 browser_driver::WaitUntil wait_until) {
    browser_driver::NavigateResult result;
    connection.clear_events();

    json navigate_params;
    navigate_params["url"] = url;
    json navigate_response = connection.send_command("Page.navigate", navigate_params, session_id,
                                                     NAVIGATION_TIMEOUT_MILLISECONDS);

    std::string command_error = cdp_driver::command_error(navigate_response);
    if (!command_error.empty()) {
        result.error_text = command_error;
        return result;
    }

    const json &navigate_result = navigate_response["result"];
    std::string error_text = string_field(navigate_result, "errorText");
    if (!error_text.empty()) {
        result.error_text = error_text + " at " + url;
        return result;
    }

    // Same-document navigations have no loaderId and fire no lifecycle events.
    std::string loader_id = string_field(navigate_result, "loaderId");
    if (!loader_id.empty()) {
        std::string event_name = lifecycle_event_name(wait_until);
        std::string page_session = session_id;
        bool reached = connection.wait_for_event(
            [&](const cdp_driver::CdpEvent &event) {
                return event.method == "Page.lifecycleEvent" && event.session_id == page_session &&
                       string_field(event.params, "name") == event_name &&
                       string_field(event.params, "loaderId") == loader_id;
            },
            NAVIGATION_TIMEOUT_MILLISECONDS);
        if (!reached) {
            result.error_text = "Timeout " + std::to_string(NAVIGATION_TIMEOUT_MILLISECONDS) +
                                "ms exceeded waiting for '" + event_name + "' at " + url;
            return result;
        }

        const cdp_driver::CdpEvent *document_response = connection.find_last_event(
            [&](const cdp_driver::CdpEvent &event) {
                return event.method == "Network.responseReceived" && event.session_id == page_session &&
                       string_field(event.params, "loaderId") == loader_id &&
                       string_field(event.params, "type") == "Document";
            });
        if (document_response != nullptr && document_response->params.contains("response") &&
            document_response->params["response"].contains("status") &&
            document_response->params["response"]["status"].is_number()) {
            result.http_status = document_response->params["response"]["status"].get<int>();
        }
    }

    json location;
    std::string evaluate_error;
    if (!evaluate_value("[location.href, document.title]", ACTION_TIMEOUT_MILLISECONDS, location, evaluate_error) ||
        !location.is_array() || location.size() != 2) {
        result.error_text = "Navigated, but reading the page location failed: " + evaluate_error;
        return result;
    }
    result.url = location[0].is_string() ? location[0].get<std::string>() : url;
    result.title = location[1].is_string() ? location[1].get<std::string>() : "";
    utf8_sanitize::sanitize(result.title);

    result.success = true;
    debug_log::log("navigate: " + result.url + " status=" + std::to_string(result.http_status));
    return result;
}

std::string CdpPage::current_url() {
    json value;
    std::string error_detail;
    if (evaluate_value("location.href", ACTION_TIMEOUT_MILLISECONDS, value, error_detail) && value.is_string()) {
        return value.get<std::string>();
    }
    return "";
}

browser_driver::CaptureScreenshotResult CdpPage::capture_screenshot(bool full_page) {
    browser_driver::CaptureScreenshotResult result;

    json capture_params;
    capture_params["format"] = "png";

    if (full_page) {
        json metrics_response = connection.send_command("Page.getLayoutMetrics", json::object(), session_id);
        std::string metrics_error = cdp_driver::command_error(metrics_response);
        if (!metrics_error.empty()) {
            result.error_detail = "Page.getLayoutMetrics failed: " + metrics_error;
            return result;
        }
        json clip;
        if (!content_size_clip(metrics_response["result"], clip)) {
            result.error_detail = "Page.getLayoutMetrics did not report the content size.";
            return result;
        }
        capture_params["clip"] = clip;
        capture_params["captureBeyondViewport"] = true;
    }

    json capture_response = connection.send_command("Page.captureScreenshot", capture_params, session_id,
                                                    NAVIGATION_TIMEOUT_MILLISECONDS);
    std::string capture_error = cdp_driver::command_error(capture_response);
    if (!capture_error.empty()) {
        result.error_detail = capture_error;
        return result;
    }

    std::string image_base64 = string_field(capture_response["result"], "data");
    if (image_base64.empty()) {
        result.error_detail = "Page.captureScreenshot did not return image data.";
        return result;
    }

    std::vector<char> decoded(image_base64.size() * 3 / 4 + 4);
    int decoded_length = lws_b64_decode_string(image_base64.c_str(), decoded.data(),
                                               static_cast<int>(decoded.size()));
    if (decoded_length < 0) {
        result.error_detail = "Screenshot data is not valid base64.";
        return result;
    }

    result.image_bytes.assign(decoded.data(), static_cast<size_t>(decoded_length));
    result.mime_type = "image/png";
    result.success = true;
    debug_log::log("capture_screenshot: " + std::to_string(result.image_bytes.size()) + " bytes");
    return result;
}

browser_driver::ContentResult CdpPage::get_html() {
    browser_driver::ContentResult result;
    const char *script =
        "(() => {"
        "const doctype = document.doctype ? new XMLSerializer().serializeToString(document.doctype) : '';"
        "return doctype + (document.documentElement ? document.documentElement.outerHTML : '');"
        "})()";

    json value;
    if (!evaluate_value(script, SCRIPT_TIMEOUT_MILLISECONDS, value, result.error_detail)) {
        return result;
    }
    result.found = true;
    result.content = value.is_string() ? value.get<std::string>() : "";
    utf8_sanitize::sanitize(result.content);
    result.success = true;
    return result;
}

browser_driver::ContentResult CdpPage::get_inner_html(const std::string &selector) {
    browser_driver::ContentResult result;
    std::string script =
        "(() => {"
        "const el = document.querySelector(" + js_literal(selector) + ");"
        "return el ? [true, el.innerHTML] : [false, null];"
        "})()";

    json value;
    if (!evaluate_value(script, SCRIPT_TIMEOUT_MILLISECONDS, value, result.error_detail)) {
        return result;
    }
    if (!value.is_array() || value.size() != 2) {
        result.error_detail = "Unexpected result while reading innerHTML.";
        return result;
    }
    result.found = value[0].is_boolean() && value[0].get<bool>();
    if (result.found && value[1].is_string()) {
        result.content = value[1].get<std::string>();
        utf8_sanitize::sanitize(result.content);
    }
    result.success = true;
    return result;
}

browser_driver::ContentResult CdpPage::get_inner_text(const std::string &selector) {
    browser_driver::ContentResult result;
    std::string script =
        "(() => {"
        "const el = document.querySelector(" + js_literal(selector) + ");"
        "return el ? [true, el.innerText] : [false, null];"
        "})()";

    json value;
    if (!evaluate_value(script, SCRIPT_TIMEOUT_MILLISECONDS, value, result.error_detail)) {
        return result;
    }
    if (!value.is_array() || value.size() != 2 || !value[0].is_boolean()) {
        result.error_detail = "Unexpected result while reading innerText.";
        return result;
    }
    if (!value[0].get<bool>()) {
        result.error_detail = "No element matches selector: " + selector;
        return result;
    }
    result.found = true;
    result.content = value[1].is_string() ? value[1].get<std::string>() : "";
    utf8_sanitize::sanitize(result.content);
    result.success = true;
    return result;
}

browser_driver::DriverResult CdpPage::click_by_script(const std::string &selector) {
    browser_driver::DriverResult result;
    std::string script =
        "(() => {"
        "const el = document.querySelector(" + js_literal(selector) + ");"
        "if (!el) { return false; }"
        "el.click();"
        "return true;"
        "})()";

    json value;
    if (!evaluate_value(script, ACTION_TIMEOUT_MILLISECONDS, value, result.error_detail)) {
        return result;
    }
    if (!value.is_boolean() || !value.get<bool>()) {
        result.error_detail = "No element matches selector: " + selector;
        return result;
    }
    result.success = true;
    return result;
}

browser_driver::DriverResult CdpPage::click(const std::string &selector) {
    browser_driver::DriverResult result;

    json get_doc_response = connection.send_command("DOM.getDocument", json::object(), session_id);
    if (!cdp_driver::command_error(get_doc_response).empty() || !get_doc_response.contains("result") ||
        !get_doc_response["result"].contains("root")) {
        result.error_detail = "DOM.getDocument failed: " + cdp_driver::command_error(get_doc_response);
        return result;
    }
    int root_node_id = get_doc_response["result"]["root"]["nodeId"].get<int>();

    json query_params;
    query_params["nodeId"] = root_node_id;
    query_params["selector"] = selector;
    json query_response = connection.send_command("DOM.querySelector", query_params, session_id);
    std::string query_error = cdp_driver::command_error(query_response);
    if (!query_error.empty()) {
        // DOM.querySelector rejects invalid selectors; the page agrees on what is invalid.
        result.error_detail = "Invalid selector '" + selector + "': " + query_error;
        return result;
    }
    int node_id = 0;
    if (query_response["result"].contains("nodeId") && query_response["result"]["nodeId"].is_number_integer()) {
        node_id = query_response["result"]["nodeId"].get<int>();
    }
    if (node_id == 0) {
        result.error_detail = "No element matches selector: " + selector;
        return result;
    }

    json scroll_params;
    scroll_params["nodeId"] = node_id;
    json scroll_response = connection.send_command("DOM.scrollIntoViewIfNeeded", scroll_params, session_id);
    std::string scroll_error = cdp_driver::command_error(scroll_response);
    if (!scroll_error.empty()) {
        debug_log::log("click: DOM.scrollIntoViewIfNeeded failed: " + scroll_error);
    }

    json box_params;
    box_params["nodeId"] = node_id;
    json box_response = connection.send_command("DOM.getBoxModel", box_params, session_id);
    double x = 0;
    double y = 0;
    if (!cdp_driver::command_error(box_response).empty() || !box_model_center(box_response["result"], x, y)) {
        return click_by_script(selector);
    }

    const char *event_types[] = {"mouseMoved", "mousePressed", "mouseReleased"};
    for (const char *event_type : event_types) {
        json mouse_event;
        mouse_event["type"] = event_type;
        mouse_event["x"] = x;
        mouse_event["y"] = y;
        if (std::string(event_type) != "mouseMoved") {
            mouse_event["button"] = "left";
            mouse_event["clickCount"] = 1;
        }
        json mouse_response = connection.send_command("Input.dispatchMouseEvent", mouse_event, session_id);
        std::string mouse_error = cdp_driver::command_error(mouse_response);
        if (!mouse_error.empty()) {
            result.error_detail = "Input.dispatchMouseEvent failed: " + mouse_error;
            return result;
        }
    }

    result.success = true;
    return result;
}

browser_driver::DriverResult CdpPage::fill(const std::string &selector, const std::string &value) {
    browser_driver::DriverResult result;

    std::string focus_script =
        "(() => {"
        "const el = document.querySelector(" + js_literal(selector) + ");"
        "if (!el) { return 'missing'; }"
        "const editable = el.isContentEditable || el.tagName === 'INPUT' || el.tagName === 'TEXTAREA' ||"
        " el.tagName === 'SELECT';"
        "if (!editable) { return 'not-editable'; }"
        "el.focus();"
        "if (el.isContentEditable) { el.textContent = ''; } else { el.value = ''; }"
        "el.dispatchEvent(new Event('input', {bubbles: true}));"
        "return 'ok';"
        "})()";

    json focus_value;
    if (!evaluate_value(focus_script, ACTION_TIMEOUT_MILLISECONDS, focus_value, result.error_detail)) {
        return result;
    }
    std::string outcome = focus_value.is_string() ? focus_value.get<std::string>() : "";
    if (outcome == "missing") {
        result.error_detail = "No element matches selector: " + selector;
        return result;
    }
    if (outcome != "ok") {
        result.error_detail = "Element is not an <input>, <textarea>, <select> or contenteditable: " + selector;
        return result;
    }

    if (!value.empty()) {
        json insert_params;
        insert_params["text"] = value;
        json insert_response = connection.send_command("Input.insertText", insert_params, session_id,
                                                       ACTION_TIMEOUT_MILLISECONDS);
        std::string insert_error = cdp_driver::command_error(insert_response);
        if (!insert_error.empty()) {
            result.error_detail = insert_error;
            return result;
        }
    }

    std::string change_script =
        "(() => {"
        "const el = document.querySelector(" + js_literal(selector) + ");"
        "if (el) { el.dispatchEvent(new Event('change', {bubbles: true})); }"
        "return true;"
        "})()";
    json change_value;
    std::string change_error;
    if (!evaluate_value(change_script, ACTION_TIMEOUT_MILLISECONDS, change_value, change_error)) {
        debug_log::log("fill: change event dispatch failed: " + change_error);
    }

    result.success = true;
    return result;
}

browser_driver::EvaluateResult CdpPage::evaluate(const std::string &script) {
    browser_driver::EvaluateResult result;
    json value;
    if (!evaluate_value(script, SCRIPT_TIMEOUT_MILLISECONDS, value, result.error_detail)) {
        return result;
    }
    result.result_json_string = value.dump(-1, ' ', false, json::error_handler_t::replace);
    result.success = true;
    return result;
}

browser_driver::AttributeResult CdpPage::get_attribute(const std::string &selector,
                                                       const std::string &attribute) {
    browser_driver::AttributeResult result;
    std::string script =
        "(() => {"
        "const el = document.querySelector(" + js_literal(selector) + ");"
        "if (!el) { return null; }"
        "return [el.getAttribute(" + js_literal(attribute) + ")];"
        "})()";

    json value;
    if (!evaluate_value(script, ACTION_TIMEOUT_MILLISECONDS, value, result.error_detail)) {
        return result;
    }
    if (!value.is_array() || value.empty()) {
        result.error_detail = "No element matches selector: " + selector;
        return result;
    }
    if (value[0].is_string()) {
        result.has_value = true;
        result.value = value[0].get<std::string>();
        utf8_sanitize::sanitize(result.value);
    }
    result.success = true;
    return result;
}

browser_driver::DriverResult CdpPage::wait_for_selector(const std::string &selector,
                                                        browser_driver::ElementState state,
                                                        int timeout_milliseconds) {
    browser_driver::DriverResult result;
    std::string state_name = element_state_name(state);
    std::string script =
        "(() => {"
        "const el = document.querySelector(" + js_literal(selector) + ");"
        "const state = " + js_literal(state_name) + ";"
        "if (state === 'attached') { return !!el; }"
        "let visible = false;"
        "if (el) {"
        " const style = getComputedStyle(el);"
        " const rect = el.getBoundingClientRect();"
        " visible = style.visibility !== 'hidden' && rect.width > 0 && rect.height > 0;"
        "}"
        "return state === 'visible' ? visible : !visible;"
        "})()";

    auto start_time = std::chrono::steady_clock::now();
    while (true) {
        json value;
        if (!evaluate_value(script, ACTION_TIMEOUT_MILLISECONDS, value, result.error_detail)) {
            return result;
        }
        if (value.is_boolean() && value.get<bool>()) {
            result.success = true;
            return result;
        }

        auto elapsed = std::chrono::steady_clock::now() - start_time;
        if (std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() >= timeout_milliseconds) {
            result.error_detail = "Timeout " + std::to_string(timeout_milliseconds) +
                                  "ms exceeded waiting for selector '" + selector + "' to be " + state_name;
            return result;
        }
        connection.service(WAIT_POLL_INTERVAL_MILLISECONDS);
    }
}

// --- CdpSession ---

CdpSession::CdpSession(int process_id, const std::string &user_data_directory)
    : process_id(process_id), user_data_directory(user_data_directory) {}

CdpSession::~CdpSession() {
    debug_log::log("Tearing down session (pid=" + std::to_string(process_id) + ")");
    try {
        if (connection.is_connected() && !browser_context_id.empty()) {
            json dispose_params;
            dispose_params["browserContextId"] = browser_context_id;
            json dispose_response = connection.send_command("Target.disposeBrowserContext", dispose_params, "", 5000);
            std::string dispose_error = cdp_driver::command_error(dispose_response);
            if (!dispose_error.empty()) {
                debug_log::log("Target.disposeBrowserContext failed: " + dispose_error);
            }
        }
    } catch (const std::exception &error) {
        debug_log::log(std::string("Disposing the browser context raised: ") + error.what());
    }
    attached_page.reset();
    connection.disconnect();

    platform::terminate_and_reap(process_id, 3000);

    if (!user_data_directory.empty()) {
        std::error_code remove_error;
        std::filesystem::remove_all(user_data_directory, remove_error);
        if (remove_error) {
            debug_log::log("Failed to remove profile directory " + user_data_directory + ": " +
                           remove_error.message());
        }
    }
}

bool CdpSession::open(const std::string &websocket_url, std::string &error_detail) {
    if (!connection.connect(websocket_url, error_detail)) {
        return false;
    }

    json context_response = connection.send_command("Target.createBrowserContext", json::object());
    std::string context_error = cdp_driver::command_error(context_response);
    if (!context_error.empty()) {
        error_detail = "Target.createBrowserContext failed: " + context_error;
        return false;
    }
    browser_context_id = string_field(context_response["result"], "browserContextId");

    json create_params;
    create_params["url"] = "about:blank";
    create_params["browserContextId"] = browser_context_id;
    json create_response = connection.send_command("Target.createTarget", create_params);
    std::string create_error = cdp_driver::command_error(create_response);
    if (!create_error.empty()) {
        error_detail = "Target.createTarget failed: " + create_error;
        return false;
    }
    target_id = string_field(create_response["result"], "targetId");

    json attach_params;
    attach_params["targetId"] = target_id;
    attach_params["flatten"] = true;
    json attach_response = connection.send_command("Target.attachToTarget", attach_params);
    std::string attach_error = cdp_driver::command_error(attach_response);
    if (!attach_error.empty()) {
        error_detail = "Target.attachToTarget failed: " + attach_error;
        return false;
    }
    session_id = string_field(attach_response["result"], "sessionId");

    json lifecycle_params;
    lifecycle_params["enabled"] = true;
    const std::pair<const char *, json> enable_commands[] = {
        {"Page.enable", json::object()},
        {"Page.setLifecycleEventsEnabled", lifecycle_params},
        {"Runtime.enable", json::object()},
        {"Network.enable", json::object()},
        {"DOM.enable", json::object()},
    };
    for (const auto &command : enable_commands) {
        json enable_response = connection.send_command(command.first, command.second, session_id);
        std::string enable_error = cdp_driver::command_error(enable_response);
        if (!enable_error.empty()) {
            error_detail = std::string(command.first) + " failed: " + enable_error;
            return false;
        }
    }

    attached_page = std::make_unique<CdpPage>(connection, session_id);
    debug_log::log("Session open: context=" + browser_context_id + " target=" + target_id +
                   " session=" + session_id);
    return true;
}

browser_driver::Page &CdpSession::page() {
    if (!attached_page) {
        throw std::logic_error("CDP session has no attached page");
    }
    return *attached_page;
}

bool content_size_clip(const json &layout_metrics, json &clip) {
    if (!layout_metrics.is_object()) {
        return false;
    }
    const char *size_key = layout_metrics.contains("cssContentSize") ? "cssContentSize" : "contentSize";
    auto size = layout_metrics.find(size_key);
    if (size == layout_metrics.end() || !size->is_object()) {
        return false;
    }
    auto width = size->find("width");
    auto height = size->find("height");
    if (width == size->end() || height == size->end() || !width->is_number() || !height->is_number()) {
        return false;
    }
    clip = json::object();
    clip["x"] = 0;
    clip["y"] = 0;
    clip["width"] = *width;
    clip["height"] = *height;
    clip["scale"] = 1;
    return true;
}

bool box_model_center(const json &box_model_result, double &x, double &y) {
    if (!box_model_result.is_object()) {
        return false;
    }
    auto model = box_model_result.find("model");
    if (model == box_model_result.end() || !model->is_object()) {
        return false;
    }
    auto content = model->find("content");
    if (content == model->end() || !content->is_array() || content->size() < 8) {
        return false;
    }
    for (const auto &coordinate : *content) {
        if (!coordinate.is_number()) {
            return false;
        }
    }
    // Quad corners clockwise from top-left: [x1, y1, x2, y2, x3, y3, x4, y4].
    x = ((*content)[0].get<double>() + (*content)[4].get<double>()) / 2;
    y = ((*content)[1].get<double>() + (*content)[5].get<double>()) / 2;
    return true;
}

browser_driver::LaunchResult launch_session(const browser_driver::LaunchOptions &options,
                                            const cdp_engine_launch::ExecutableOverrides &overrides) {
    browser_driver::LaunchResult result;

    cdp_engine_launch::EngineLaunchResult launch = cdp_engine_launch::launch_engine(options, overrides);
    if (!launch.success) {
        result.error_detail = launch.error_message;
        return result;
    }

    auto session = std::make_unique<CdpSession>(launch.process_id, launch.user_data_directory);
    std::string open_error;
    if (!session->open(launch.websocket_debugger_url, open_error)) {
        result.error_detail = "Failed to open a session on " +
                              browser_driver::engine_family_name(options.family) + ": " + open_error;
        return result;
    }

    result.success = true;
    result.session = std::move(session);
    return result;
}

} // namespace cdp_session
