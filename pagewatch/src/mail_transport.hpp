#pragma once
#include "config.hpp"
#include <stdexcept>
#include <string>
#include <vector>

class MailError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Delivers one message. Implementations throw MailError on any failure.
class MailTransport {
public:
    virtual ~MailTransport() = default;

    virtual void send(const SmtpSettings& settings,
                      const std::string& from,
                      const std::vector<std::string>& to,
                      const std::string& subject,
                      const std::string& body) = 0;
};
