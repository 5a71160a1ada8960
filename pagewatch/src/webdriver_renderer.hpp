#pragma once
#include "config.hpp"
#include "page_renderer.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

// Headless browser session driven over the W3C WebDriver HTTP protocol (e.g. chromedriver).
// The constructor starts the session; close() deletes it.
class WebDriverRenderer : public PageRenderer {
public:
    explicit WebDriverRenderer(const WebDriverConfig& config);
    ~WebDriverRenderer() override;

    // Non-copyable
    WebDriverRenderer(const WebDriverRenderer&) = delete;
    WebDriverRenderer& operator=(const WebDriverRenderer&) = delete;

    std::string open(const std::string& url) override;
    void close() override;

private:
    std::string session_url() const;
    std::chrono::milliseconds http_timeout() const;

    WebDriverConfig config_;
    std::string base_url_;
    std::string session_id_;
};

// New-session payload with chrome options and the page load timeout
nlohmann::json build_new_session_request(const WebDriverConfig& config);

// Returns the "value" member of a WebDriver reply, throws RenderError for
// HTTP errors, WebDriver error objects and malformed bodies
nlohmann::json unwrap_webdriver_response(long status_code, const std::string& body);

// Extracts the session id from a new-session reply (W3C and legacy layouts)
std::string extract_session_id(long status_code, const std::string& body);

RendererFactory make_webdriver_factory(const WebDriverConfig& config);
