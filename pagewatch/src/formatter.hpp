#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace Formatter {

std::string format_alert_body(const std::string& url, const std::string& expected_text);

// RFC 5322 plain text message with CRLF line endings, ready for SMTP DATA.
// Non-ASCII header text is sent as RFC 2047 encoded words; a CR or LF in
// from, to or subject throws MailError.
std::string format_mime_message(const std::string& from,
                                const std::vector<std::string>& to,
                                const std::string& subject,
                                const std::string& body,
                                std::chrono::system_clock::time_point date);

} // namespace Formatter
