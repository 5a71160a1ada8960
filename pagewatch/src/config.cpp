#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>

namespace {

constexpr int kMaxTimeoutSeconds = 86400;

// Integer fields are read wide so values outside int are rejected instead of truncated
int read_int(const nlohmann::json& j, const char* key, int fallback, const char* section = "") {
    if (!j.contains(key)) {
        return fallback;
    }

    const auto& value = j.at(key);
    if (!value.is_number_integer()) {
        throw ConfigError(fmt::format("{}{} must be an integer", section, key));
    }

    bool in_range;
    if (value.is_number_unsigned()) {
        in_range = value.get<std::uint64_t>() <=
                   static_cast<std::uint64_t>(std::numeric_limits<int>::max());
    } else {
        auto wide = value.get<std::int64_t>();
        in_range = wide >= std::numeric_limits<int>::min() &&
                   wide <= std::numeric_limits<int>::max();
    }
    if (!in_range) {
        throw ConfigError(fmt::format("{}{} is out of range", section, key));
    }
    return value.get<int>();
}

} // namespace

EmailConfig EmailConfig::from_json(const nlohmann::json& j) {
    EmailConfig email;
    email.enabled = j.value("enabled", email.enabled);
    email.smtp.host = j.value("smtp_host", email.smtp.host);
    email.smtp.port = read_int(j, "smtp_port", email.smtp.port, "email.");
    email.smtp.username = j.value("smtp_username", email.smtp.username);
    email.smtp.password = j.value("smtp_password", email.smtp.password);
    email.smtp.timeout_seconds = read_int(j, "timeout_seconds", email.smtp.timeout_seconds, "email.");
    email.from = j.value("from", email.from);
    if (j.contains("to")) {
        email.to = j.at("to").get<std::vector<std::string>>();
    }
    email.subject = j.value("subject", email.subject);
    return email;
}

nlohmann::json EmailConfig::to_json() const {
    return {
        {"enabled", enabled},
        {"smtp_host", smtp.host},
        {"smtp_port", smtp.port},
        {"smtp_username", smtp.username},
        {"smtp_password", smtp.password},
        {"timeout_seconds", smtp.timeout_seconds},
        {"from", from},
        {"to", to},
        {"subject", subject}
    };
}

WebDriverConfig WebDriverConfig::from_json(const nlohmann::json& j) {
    WebDriverConfig webdriver;
    webdriver.url = j.value("url", webdriver.url);
    webdriver.page_load_timeout_seconds =
        read_int(j, "page_load_timeout_seconds", webdriver.page_load_timeout_seconds, "webdriver.");
    if (j.contains("browser_args")) {
        webdriver.browser_args = j.at("browser_args").get<std::vector<std::string>>();
    }
    return webdriver;
}

nlohmann::json WebDriverConfig::to_json() const {
    return {
        {"url", url},
        {"page_load_timeout_seconds", page_load_timeout_seconds},
        {"browser_args", browser_args}
    };
}

Config Config::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Configuration root must be a JSON object");
    }

    Config config;
    try {
        config.url = j.at("url").get<std::string>();
        config.expected_text = j.at("expected_text").get<std::string>();
        config.retry_delay_seconds = read_int(j, "retry_delay_seconds", config.retry_delay_seconds);
        config.max_attempts = read_int(j, "max_attempts", config.max_attempts);
        config.log_level = j.value("log_level", config.log_level);

        if (j.contains("email")) {
            config.email = EmailConfig::from_json(j.at("email"));
        }
        if (j.contains("webdriver")) {
            config.webdriver = WebDriverConfig::from_json(j.at("webdriver"));
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }

    return config;
}

Config Config::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open configuration file " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Malformed JSON in " + path + ": " + e.what());
    }

    return from_json(j);
}

Config Config::default_template() {
    Config config;
    config.url = "https://example.com/";
    config.expected_text = "I'm alive";

    config.email.enabled = false;
    config.email.smtp.host = "mail.example.com";
    config.email.smtp.port = 25;
    config.email.smtp.username = "monitor@example.com";
    config.email.smtp.password = "your_password";
    config.email.from = "monitor@example.com";
    config.email.to = {"oncall@example.com"};
    config.email.subject = "Monitored application is DOWN";

    return config;
}

nlohmann::json Config::to_json() const {
    return {
        {"url", url},
        {"expected_text", expected_text},
        {"retry_delay_seconds", retry_delay_seconds},
        {"max_attempts", max_attempts},
        {"log_level", log_level},
        {"email", email.to_json()},
        {"webdriver", webdriver.to_json()}
    };
}

void Config::apply_env_overrides() {
    log_level = util::get_env_var("LOG_LEVEL", log_level);
    webdriver.url = util::get_env_var("WEBDRIVER_URL", webdriver.url);
    email.smtp.password = util::read_secret("SMTP_PASSWORD_FILE", "SMTP_PASSWORD", email.smtp.password);
}

void Config::validate() const {
    if (url.empty()) {
        throw ConfigError("url is required");
    }

    if (expected_text.empty()) {
        throw ConfigError("expected_text is required");
    }

    if (retry_delay_seconds < 0) {
        throw ConfigError("retry_delay_seconds must not be negative");
    }

    if (max_attempts < 0) {
        throw ConfigError("max_attempts must not be negative");
    }

    if (email.smtp.port < 1 || email.smtp.port > 65535) {
        throw ConfigError("email.smtp_port must be between 1 and 65535");
    }

    if (email.smtp.timeout_seconds < 1 || email.smtp.timeout_seconds > kMaxTimeoutSeconds) {
        throw ConfigError(fmt::format("email.timeout_seconds must be between 1 and {}", kMaxTimeoutSeconds));
    }

    if (webdriver.url.empty()) {
        throw ConfigError("webdriver.url is required");
    }

    if (webdriver.page_load_timeout_seconds < 1 ||
        webdriver.page_load_timeout_seconds > kMaxTimeoutSeconds) {
        throw ConfigError(fmt::format("webdriver.page_load_timeout_seconds must be between 1 and {}",
                                      kMaxTimeoutSeconds));
    }

    if (max_attempts == 0) {
        spdlog::warn("max_attempts is 0: no page check will run and the alert goes out immediately");
    }

    spdlog::debug("Configuration validated successfully");
}

bool ensure_config_exists(const std::string& path) {
    if (std::filesystem::exists(path)) {
        return true;
    }

    spdlog::warn("Config file not found. Expected path: {}", path);
    spdlog::info("Creating a template config file...");

    std::ofstream file(path);
    if (!file.is_open()) {
        spdlog::error("Failed to create template config file {}", path);
        return false;
    }

    file << Config::default_template().to_json().dump(2) << '\n';
    if (!file) {
        spdlog::error("Failed to write template config file {}", path);
        return false;
    }

    spdlog::info("Template config created. Edit it with your URL, expected_text and email settings.");
    return false;
}
