#pragma once
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SmtpSettings {
    std::string host;
    int port = 25;
    std::string username;
    std::string password;
    int timeout_seconds = 30;
};

struct EmailConfig {
    bool enabled = false;
    SmtpSettings smtp;
    std::string from;
    std::vector<std::string> to;
    std::string subject = "Application is DOWN";

    static EmailConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct WebDriverConfig {
    std::string url = "http://localhost:9515";
    int page_load_timeout_seconds = 30;
    std::vector<std::string> browser_args = {
        "--headless=new",
        "--no-sandbox",
        "--disable-dev-shm-usage"
    };

    static WebDriverConfig from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

struct Config {
    // Target
    std::string url;
    std::string expected_text;

    // Retry policy
    int retry_delay_seconds = 60;
    int max_attempts = 2;

    // General
    std::string log_level = "info";

    EmailConfig email;
    WebDriverConfig webdriver;

    static Config from_json(const nlohmann::json& j);
    static Config from_file(const std::string& path);
    static Config default_template();

    nlohmann::json to_json() const;

    // LOG_LEVEL, WEBDRIVER_URL, SMTP_PASSWORD_FILE / SMTP_PASSWORD
    void apply_env_overrides();
    void validate() const;
};

// Writes a template config when path does not exist. Returns true if the file already existed.
bool ensure_config_exists(const std::string& path);
