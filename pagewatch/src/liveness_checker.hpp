#pragma once
#include "page_renderer.hpp"
#include "types.hpp"
#include <string>

class LivenessChecker {
public:
    explicit LivenessChecker(RendererFactory renderer_factory);

    // One attempt: start a session, load url, look for expected_text (exact, case-sensitive).
    // Renderer failures are returned as Errored; the session is always closed.
    AttemptResult check(const std::string& url, const std::string& expected_text);

private:
    RendererFactory renderer_factory_;
};
