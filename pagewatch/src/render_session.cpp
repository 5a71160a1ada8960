#include "render_session.hpp"
#include <spdlog/spdlog.h>

RenderSession::RenderSession(std::unique_ptr<PageRenderer> renderer)
    : renderer_(std::move(renderer)) {
    if (!renderer_) {
        throw RenderError("Renderer factory returned no session");
    }
}

RenderSession::~RenderSession() {
    release();
}

RenderSession::RenderSession(RenderSession&& other) noexcept
    : renderer_(std::move(other.renderer_)) {}

RenderSession& RenderSession::operator=(RenderSession&& other) noexcept {
    if (this != &other) {
        release();
        renderer_ = std::move(other.renderer_);
    }
    return *this;
}

std::string RenderSession::open(const std::string& url) {
    return renderer_->open(url);
}

void RenderSession::release() noexcept {
    if (!renderer_) return;

    try {
        renderer_->close();
    } catch (const std::exception& e) {
        spdlog::warn("Failed to close browser session: {}", e.what());
    } catch (...) {
        spdlog::warn("Failed to close browser session: unknown error");
    }
    renderer_.reset();
}
