#pragma once
#include "page_renderer.hpp"
#include <memory>
#include <string>

// Owns a PageRenderer for the duration of one attempt and closes it on scope exit.
class RenderSession {
public:
    explicit RenderSession(std::unique_ptr<PageRenderer> renderer);
    ~RenderSession();

    RenderSession(RenderSession&& other) noexcept;
    RenderSession& operator=(RenderSession&& other) noexcept;

    // Non-copyable
    RenderSession(const RenderSession&) = delete;
    RenderSession& operator=(const RenderSession&) = delete;

    std::string open(const std::string& url);

private:
    void release() noexcept;

    std::unique_ptr<PageRenderer> renderer_;
};
