#include "alert_notifier.hpp"
#include "formatter.hpp"
#include <spdlog/spdlog.h>

AlertNotifier::AlertNotifier(std::shared_ptr<MailTransport> transport)
    : transport_(std::move(transport)) {}

DeliveryResult AlertNotifier::notify(const EmailConfig& email, const std::string& url,
                                     const std::string& expected_text) {
    DeliveryResult result;

    if (!email.enabled) {
        spdlog::info("Email alert is disabled in config.");
        result.status = DeliveryStatus::Disabled;
        return result;
    }

    try {
        if (!transport_) {
            throw MailError("No mail transport configured");
        }

        std::string body = Formatter::format_alert_body(url, expected_text);
        transport_->send(email.smtp, email.from, email.to, email.subject, body);

        result.status = DeliveryStatus::Sent;
        spdlog::info("Alert email sent successfully to {} recipient(s).", email.to.size());

    } catch (const std::exception& e) {
        result.status = DeliveryStatus::Failed;
        result.error = e.what();
        spdlog::error("Failed to send alert email: {}", e.what());
    } catch (...) {
        result.status = DeliveryStatus::Failed;
        result.error = "unknown error";
        spdlog::error("Failed to send alert email: unknown error");
    }

    return result;
}
