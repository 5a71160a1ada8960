#include "alert_notifier.hpp"
#include "check_runner.hpp"
#include "config.hpp"
#include "liveness_checker.hpp"
#include "smtp_transport.hpp"
#include "util.hpp"
#include "webdriver_renderer.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <filesystem>

namespace {

constexpr int kExitChecked = 0;
constexpr int kExitConfigMissing = 1;
constexpr int kExitConfigInvalid = 2;
constexpr int kExitCancelled = 3;
constexpr int kExitFatal = 4;

// Raised by SIGINT/SIGTERM, polled by the inter-attempt pause
std::atomic<bool> stop_requested{false};

void signal_handler(int) {
    stop_requested = true;
}

std::string resolve_config_path(int argc, char* argv[]) {
    if (argc > 1) {
        return argv[1];
    }
    std::string from_env = util::get_env_var("PAGEWATCH_CONFIG");
    if (!from_env.empty()) {
        return from_env;
    }
    return (std::filesystem::path(util::executable_dir()) / "config.json").string();
}

} // namespace

int main(int argc, char* argv[]) {
    // Console logging before the config is known, level refined below
    util::setup_logging(util::get_env_var("LOG_LEVEL", "info"));

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        std::string config_path = resolve_config_path(argc, argv);
        if (!ensure_config_exists(config_path)) {
            return kExitConfigMissing;
        }

        Config config;
        try {
            config = Config::from_file(config_path);
            config.apply_env_overrides();
            util::setup_logging(config.log_level);
            config.validate();
        } catch (const ConfigError& e) {
            spdlog::critical("Could not load config {}: {}", config_path, e.what());
            return kExitConfigInvalid;
        }
        spdlog::debug("Configuration loaded from {}", config_path);

        CurlGlobal curl_global;

        LivenessChecker checker(make_webdriver_factory(config.webdriver));
        AlertNotifier notifier(std::make_shared<SmtpTransport>());
        CheckRunner runner(config, checker, notifier, [](std::chrono::seconds delay) {
            return util::interruptible_sleep(delay, stop_requested);
        });

        RunOutcome outcome = runner.run();
        spdlog::info("Run {}: {}", to_string(outcome.status), describe(outcome, config.max_attempts));

        if (outcome.status == RunStatus::Cancelled) {
            return kExitCancelled;
        }

    } catch (const std::exception& e) {
        spdlog::critical("A critical error occurred: {}", e.what());
        return kExitFatal;
    }

    return kExitChecked;
}
