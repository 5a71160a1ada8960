#pragma once
#include "config.hpp"
#include "mail_transport.hpp"
#include "types.hpp"
#include <memory>
#include <string>

class AlertNotifier {
public:
    explicit AlertNotifier(std::shared_ptr<MailTransport> transport);

    // Sends the "page is down" alert. Disabled config is a successful no-op.
    // Never throws: delivery problems come back as DeliveryStatus::Failed.
    DeliveryResult notify(const EmailConfig& email, const std::string& url, const std::string& expected_text);

private:
    std::shared_ptr<MailTransport> transport_;
};
