#include "smtp_transport.hpp"
#include "formatter.hpp"
#include <curl/curl.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <memory>

namespace {

struct UploadState {
    const std::string* payload;
    size_t offset;
};

size_t read_payload(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* state = static_cast<UploadState*>(userdata);
    size_t room = size * nitems;
    size_t remaining = state->payload->size() - state->offset;
    size_t chunk = std::min(room, remaining);

    if (chunk > 0) {
        std::memcpy(buffer, state->payload->data() + state->offset, chunk);
        state->offset += chunk;
    }
    return chunk;
}

struct CurlEasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

template <typename T>
void set_option(CURL* handle, CURLoption option, T value) {
    CURLcode rc = curl_easy_setopt(handle, option, value);
    if (rc != CURLE_OK) {
        throw MailError(fmt::format("Setting curl option {} failed: {}",
                                    static_cast<int>(option), curl_easy_strerror(rc)));
    }
}

} // namespace

std::string envelope_address(const std::string& address) {
    auto open = address.find('<');
    auto close = address.find('>', open == std::string::npos ? 0 : open);
    if (open != std::string::npos && close != std::string::npos) {
        return address.substr(open, close - open + 1);
    }
    return "<" + address + ">";
}

CurlGlobal::CurlGlobal() {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        throw std::runtime_error("curl_global_init failed");
    }
}

CurlGlobal::~CurlGlobal() {
    curl_global_cleanup();
}

void SmtpTransport::send(const SmtpSettings& settings,
                         const std::string& from,
                         const std::vector<std::string>& to,
                         const std::string& subject,
                         const std::string& body) {
    if (settings.host.empty()) {
        throw MailError("SMTP host is not configured");
    }
    if (to.empty()) {
        throw MailError("No recipients configured");
    }

    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) {
        throw MailError("curl_easy_init failed");
    }

    std::unique_ptr<curl_slist, CurlSlistDeleter> recipients;
    for (const auto& address : to) {
        curl_slist* appended = curl_slist_append(recipients.get(), envelope_address(address).c_str());
        if (!appended) {
            throw MailError("Out of memory building recipient list");
        }
        recipients.release();
        recipients.reset(appended);
    }

    std::string payload = Formatter::format_mime_message(
        from, to, subject, body, std::chrono::system_clock::now());
    UploadState upload{&payload, 0};

    std::string server_url = fmt::format("smtp://{}:{}", settings.host, settings.port);
    std::string mail_from = envelope_address(from);

    CURL* handle = curl.get();
    set_option(handle, CURLOPT_URL, server_url.c_str());
    set_option(handle, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    if (!settings.username.empty()) {
        set_option(handle, CURLOPT_USERNAME, settings.username.c_str());
        set_option(handle, CURLOPT_PASSWORD, settings.password.c_str());
    }
    set_option(handle, CURLOPT_MAIL_FROM, mail_from.c_str());
    set_option(handle, CURLOPT_MAIL_RCPT, recipients.get());
    set_option(handle, CURLOPT_READFUNCTION, read_payload);
    set_option(handle, CURLOPT_READDATA, &upload);
    set_option(handle, CURLOPT_UPLOAD, 1L);
    set_option(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(settings.timeout_seconds));
    set_option(handle, CURLOPT_TIMEOUT, static_cast<long>(settings.timeout_seconds));
    set_option(handle, CURLOPT_NOSIGNAL, 1L);

    char error_buffer[CURL_ERROR_SIZE] = {0};
    set_option(handle, CURLOPT_ERRORBUFFER, error_buffer);

    spdlog::debug("Submitting alert to {} for {} recipient(s)", server_url, to.size());

    CURLcode rc = curl_easy_perform(handle);
    if (rc != CURLE_OK) {
        std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(rc);
        throw MailError(fmt::format("SMTP delivery via {} failed: {}", server_url, detail));
    }
}
