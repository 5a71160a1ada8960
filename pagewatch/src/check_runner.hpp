#pragma once
#include "alert_notifier.hpp"
#include "config.hpp"
#include "liveness_checker.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>

// Drives one run: up to max_attempts checks with a fixed pause between them,
// one alert when every attempt failed.
class CheckRunner {
public:
    // Blocking pause between attempts; returns false if the wait was cancelled
    using PauseFn = std::function<bool(std::chrono::seconds)>;

    CheckRunner(const Config& config, LivenessChecker& checker, AlertNotifier& notifier, PauseFn pause);

    // Always returns a terminal outcome; faults inside an attempt count as a failed attempt
    RunOutcome run();

private:
    AttemptResult run_attempt(int attempt);
    void log_run_start() const;

    const Config& config_;
    LivenessChecker& checker_;
    AlertNotifier& notifier_;
    PauseFn pause_;
};
