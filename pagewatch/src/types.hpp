#pragma once
#include <string>
#include <vector>

enum class AttemptStatus {
    Alive,
    NotAlive,
    Errored
};

struct AttemptResult {
    AttemptStatus status = AttemptStatus::Errored;
    std::string detail; // Error text for Errored, empty otherwise

    bool is_alive() const { return status == AttemptStatus::Alive; }

    static AttemptResult alive() { return {AttemptStatus::Alive, ""}; }
    static AttemptResult not_alive() { return {AttemptStatus::NotAlive, ""}; }
    static AttemptResult errored(const std::string& detail) { return {AttemptStatus::Errored, detail}; }
};

enum class DeliveryStatus {
    NotAttempted,
    Sent,
    Disabled,
    Failed
};

struct DeliveryResult {
    DeliveryStatus status = DeliveryStatus::NotAttempted;
    std::string error;

    // Disabled counts as success: nothing was supposed to be sent
    bool ok() const { return status == DeliveryStatus::Sent || status == DeliveryStatus::Disabled; }
};

enum class RunStatus {
    Succeeded,
    Exhausted,
    Cancelled
};

struct RunOutcome {
    RunStatus status = RunStatus::Exhausted;
    int attempts_used = 0;
    std::vector<AttemptResult> attempts;
    DeliveryResult notification;
};

std::string to_string(AttemptStatus status);
std::string to_string(DeliveryStatus status);
std::string to_string(RunStatus status);

// One-line human readable summary, e.g. "succeeded on attempt 2/3"
std::string describe(const RunOutcome& outcome, int max_attempts);
