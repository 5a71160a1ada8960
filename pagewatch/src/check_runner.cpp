#include "check_runner.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

CheckRunner::CheckRunner(const Config& config, LivenessChecker& checker, AlertNotifier& notifier, PauseFn pause)
    : config_(config), checker_(checker), notifier_(notifier), pause_(std::move(pause)) {
    if (!pause_) {
        throw std::invalid_argument("CheckRunner requires a pause function");
    }
}

RunOutcome CheckRunner::run() {
    RunOutcome outcome;
    log_run_start();

    int attempt = 0;
    while (attempt < config_.max_attempts) {
        ++attempt;
        outcome.attempts_used = attempt;

        spdlog::info("Attempt {}/{}...", attempt, config_.max_attempts);
        AttemptResult result = run_attempt(attempt);
        outcome.attempts.push_back(result);

        if (result.is_alive()) {
            spdlog::info("Application is alive.");
            outcome.status = RunStatus::Succeeded;
            return outcome;
        }

        if (result.status == AttemptStatus::NotAlive) {
            spdlog::warn("Application is NOT alive on attempt {}.", attempt);
        } else {
            spdlog::warn("Attempt {} errored: {}", attempt, result.detail);
        }

        if (attempt < config_.max_attempts) {
            spdlog::info("Waiting {} seconds before next attempt...", config_.retry_delay_seconds);
            if (!pause_(std::chrono::seconds(config_.retry_delay_seconds))) {
                spdlog::warn("Wait interrupted, stopping after {} attempt(s) without sending an alert.", attempt);
                outcome.status = RunStatus::Cancelled;
                return outcome;
            }
        }
    }

    if (config_.max_attempts == 0) {
        spdlog::warn("No attempts configured, treating the target as down.");
    }

    spdlog::error("Application still down after all attempts. Sending alert email...");
    outcome.status = RunStatus::Exhausted;
    outcome.notification = notifier_.notify(config_.email, config_.url, config_.expected_text);
    return outcome;
}

AttemptResult CheckRunner::run_attempt(int attempt) {
    try {
        return checker_.check(config_.url, config_.expected_text);
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error on attempt {}: {}", attempt, e.what());
        return AttemptResult::errored(e.what());
    } catch (...) {
        spdlog::error("Unexpected non-standard error on attempt {}", attempt);
        return AttemptResult::errored("unknown error");
    }
}

void CheckRunner::log_run_start() const {
    spdlog::info("Starting single check");
    spdlog::info("  URL: {}", config_.url);
    spdlog::info("  Expected text: {}", config_.expected_text);
    spdlog::info("  Retry delay: {} seconds", config_.retry_delay_seconds);
    spdlog::info("  Max attempts: {}", config_.max_attempts);
}
