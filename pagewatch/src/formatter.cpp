#include "formatter.hpp"
#include "mail_transport.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <sstream>

namespace {

// Raw bytes per encoded word; keeps each word under the 75 character limit
constexpr size_t kEncodedWordBytes = 45;

void reject_line_breaks(const char* header, const std::string& value) {
    if (value.find_first_of("\r\n") != std::string::npos) {
        throw MailError(fmt::format("{} header value contains a line break", header));
    }
}

bool is_ascii(const std::string& text) {
    for (unsigned char c : text) {
        if (c >= 0x80) {
            return false;
        }
    }
    return true;
}

std::string encode_words(const std::string& text) {
    std::string encoded;
    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = std::min(pos + kEncodedWordBytes, text.size());
        // Never split a UTF-8 sequence across two words
        while (end < text.size() && end > pos + 1 &&
               (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
            --end;
        }
        if (!encoded.empty()) {
            encoded += "\r\n ";
        }
        encoded += "=?utf-8?B?" + util::base64_encode(text.substr(pos, end - pos)) + "?=";
        pos = end;
    }
    return encoded;
}

std::string encode_text(const std::string& text) {
    return is_ascii(text) ? text : encode_words(text);
}

// Only the display name of "Name <addr>" can be encoded
std::string encode_address(const std::string& address) {
    auto open = address.find('<');
    if (is_ascii(address) || open == std::string::npos || open == 0) {
        return address;
    }
    std::string name = util::trim(address.substr(0, open));
    if (name.size() >= 2 && name.front() == '"' && name.back() == '"') {
        name = name.substr(1, name.size() - 2);
    }
    return encode_text(name) + " " + address.substr(open);
}

} // namespace

namespace Formatter {

std::string format_alert_body(const std::string& url, const std::string& expected_text) {
    return fmt::format(
        "The application at {} does not show the expected message: '{}'.\n"
        "Please check the service.",
        url, expected_text
    );
}

std::string format_mime_message(const std::string& from,
                                const std::vector<std::string>& to,
                                const std::string& subject,
                                const std::string& body,
                                std::chrono::system_clock::time_point date) {
    reject_line_breaks("From", from);
    std::vector<std::string> recipients;
    for (const auto& address : to) {
        reject_line_breaks("To", address);
        recipients.push_back(encode_address(address));
    }
    reject_line_breaks("Subject", subject);

    std::string message;
    message += "Date: " + util::format_rfc5322_date(date) + "\r\n";
    message += "From: " + encode_address(from) + "\r\n";
    message += "To: " + util::join(recipients, ", ") + "\r\n";
    message += "Subject: " + encode_text(subject) + "\r\n";
    message += "MIME-Version: 1.0\r\n";
    message += "Content-Type: text/plain; charset=utf-8\r\n";
    message += "Content-Transfer-Encoding: 8bit\r\n";
    message += "\r\n";

    // Normalize body line endings to CRLF
    std::istringstream lines(body);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        message += line + "\r\n";
    }

    return message;
}

} // namespace Formatter
