#include "types.hpp"
#include <fmt/format.h>

std::string to_string(AttemptStatus status) {
    switch (status) {
        case AttemptStatus::Alive: return "alive";
        case AttemptStatus::NotAlive: return "not alive";
        case AttemptStatus::Errored: return "errored";
    }
    return "unknown";
}

std::string to_string(DeliveryStatus status) {
    switch (status) {
        case DeliveryStatus::NotAttempted: return "not attempted";
        case DeliveryStatus::Sent: return "sent";
        case DeliveryStatus::Disabled: return "disabled";
        case DeliveryStatus::Failed: return "failed";
    }
    return "unknown";
}

std::string to_string(RunStatus status) {
    switch (status) {
        case RunStatus::Succeeded: return "succeeded";
        case RunStatus::Exhausted: return "exhausted";
        case RunStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string describe(const RunOutcome& outcome, int max_attempts) {
    switch (outcome.status) {
        case RunStatus::Succeeded:
            return fmt::format("succeeded on attempt {}/{}", outcome.attempts_used, max_attempts);
        case RunStatus::Cancelled:
            return fmt::format("cancelled after {}/{} attempts", outcome.attempts_used, max_attempts);
        case RunStatus::Exhausted:
            break;
    }

    std::string summary = fmt::format("failed after {} attempts, notification {}",
                                      outcome.attempts_used, to_string(outcome.notification.status));
    if (outcome.notification.status == DeliveryStatus::Failed && !outcome.notification.error.empty()) {
        summary += fmt::format(" ({})", outcome.notification.error);
    }
    return summary;
}
