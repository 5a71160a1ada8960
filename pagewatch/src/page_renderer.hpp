#pragma once
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

class RenderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// One browser session. Implementations throw RenderError on any failure.
class PageRenderer {
public:
    virtual ~PageRenderer() = default;

    // Navigates to url and returns the rendered document text
    virtual std::string open(const std::string& url) = 0;

    // Releases the session. Must be safe to call once after a failed open().
    virtual void close() = 0;
};

// Creates a fresh session per attempt; throws RenderError if none can be started
using RendererFactory = std::function<std::unique_ptr<PageRenderer>()>;
