#include "webdriver_renderer.hpp"
#include <cpr/cpr.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <cstdint>

namespace {

// Extra time on top of the browser's own page load timeout before the HTTP call gives up
constexpr int kHttpTimeoutMarginSeconds = 15;

std::string strip_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

void throw_on_transport_error(const cpr::Response& response, const std::string& action) {
    if (response.error) {
        throw RenderError(fmt::format("{} failed: {}", action, response.error.message));
    }
}

} // namespace

nlohmann::json build_new_session_request(const WebDriverConfig& config) {
    return {
        {"capabilities", {
            {"alwaysMatch", {
                {"browserName", "chrome"},
                {"goog:chromeOptions", {{"args", config.browser_args}}},
                {"timeouts", {{"pageLoad", static_cast<std::int64_t>(config.page_load_timeout_seconds) * 1000}}}
            }}
        }}
    };
}

nlohmann::json unwrap_webdriver_response(long status_code, const std::string& body) {
    nlohmann::json reply;
    try {
        reply = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw RenderError(fmt::format("Malformed WebDriver reply (HTTP {}): {}", status_code, e.what()));
    }

    if (!reply.is_object()) {
        throw RenderError(fmt::format("Unexpected WebDriver reply (HTTP {})", status_code));
    }

    nlohmann::json value = reply.contains("value") ? reply["value"] : nlohmann::json();

    if (value.is_object() && value.contains("error")) {
        throw RenderError(fmt::format("WebDriver error '{}': {}",
                                      value.value("error", ""), value.value("message", "")));
    }

    if (status_code < 200 || status_code >= 300) {
        throw RenderError(fmt::format("WebDriver HTTP error {}", status_code));
    }

    return value;
}

std::string extract_session_id(long status_code, const std::string& body) {
    auto value = unwrap_webdriver_response(status_code, body);

    if (value.is_object() && value.contains("sessionId") && value["sessionId"].is_string()) {
        return value["sessionId"].get<std::string>();
    }

    // Legacy JSON wire protocol puts the id next to "value"
    auto reply = nlohmann::json::parse(body);
    if (reply.contains("sessionId") && reply["sessionId"].is_string()) {
        return reply["sessionId"].get<std::string>();
    }

    throw RenderError("WebDriver new session reply carries no sessionId");
}

WebDriverRenderer::WebDriverRenderer(const WebDriverConfig& config)
    : config_(config), base_url_(strip_trailing_slash(config.url)) {
    auto response = cpr::Post(
        cpr::Url{base_url_ + "/session"},
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{build_new_session_request(config_).dump()},
        cpr::Timeout{http_timeout()}
    );
    throw_on_transport_error(response, "Starting browser session");

    session_id_ = extract_session_id(response.status_code, response.text);
    spdlog::debug("Browser session {} started via {}", session_id_, base_url_);
}

WebDriverRenderer::~WebDriverRenderer() {
    if (session_id_.empty()) return;

    try {
        close();
    } catch (const std::exception& e) {
        spdlog::warn("Leaking browser session {}: {}", session_id_, e.what());
    }
}

std::string WebDriverRenderer::open(const std::string& url) {
    if (session_id_.empty()) {
        throw RenderError("Browser session is closed");
    }

    auto navigate = cpr::Post(
        cpr::Url{session_url() + "/url"},
        cpr::Header{{"Content-Type", "application/json"}},
        cpr::Body{nlohmann::json{{"url", url}}.dump()},
        cpr::Timeout{http_timeout()}
    );
    throw_on_transport_error(navigate, "Navigation to " + url);
    unwrap_webdriver_response(navigate.status_code, navigate.text);

    auto source = cpr::Get(
        cpr::Url{session_url() + "/source"},
        cpr::Timeout{http_timeout()}
    );
    throw_on_transport_error(source, "Reading page source");

    auto value = unwrap_webdriver_response(source.status_code, source.text);
    if (!value.is_string()) {
        throw RenderError("WebDriver page source is not a string");
    }
    return value.get<std::string>();
}

void WebDriverRenderer::close() {
    if (session_id_.empty()) return;

    std::string id = session_id_;
    session_id_.clear();

    auto response = cpr::Delete(
        cpr::Url{base_url_ + "/session/" + id},
        cpr::Timeout{http_timeout()}
    );
    throw_on_transport_error(response, "Closing browser session " + id);
    unwrap_webdriver_response(response.status_code, response.text);

    spdlog::debug("Browser session {} closed", id);
}

std::string WebDriverRenderer::session_url() const {
    return base_url_ + "/session/" + session_id_;
}

std::chrono::milliseconds WebDriverRenderer::http_timeout() const {
    return std::chrono::seconds(config_.page_load_timeout_seconds) +
           std::chrono::seconds(kHttpTimeoutMarginSeconds);
}

RendererFactory make_webdriver_factory(const WebDriverConfig& config) {
    return [config]() -> std::unique_ptr<PageRenderer> {
        return std::make_unique<WebDriverRenderer>(config);
    };
}
