#pragma once
#include "mail_transport.hpp"

// Process-wide libcurl initialization, one instance in main()
struct CurlGlobal {
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;
};

// SMTP submission over libcurl: STARTTLS is mandatory, then AUTH with the configured credentials.
class SmtpTransport : public MailTransport {
public:
    void send(const SmtpSettings& settings,
              const std::string& from,
              const std::vector<std::string>& to,
              const std::string& subject,
              const std::string& body) override;
};

// Bare address for the SMTP envelope: "Ops <ops@example.com>" -> "<ops@example.com>"
std::string envelope_address(const std::string& address);
