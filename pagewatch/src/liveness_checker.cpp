#include "liveness_checker.hpp"
#include "render_session.hpp"
#include <spdlog/spdlog.h>

LivenessChecker::LivenessChecker(RendererFactory renderer_factory)
    : renderer_factory_(std::move(renderer_factory)) {
    if (!renderer_factory_) {
        throw std::invalid_argument("LivenessChecker requires a renderer factory");
    }
}

AttemptResult LivenessChecker::check(const std::string& url, const std::string& expected_text) {
    try {
        RenderSession session(renderer_factory_());

        std::string document = session.open(url);
        spdlog::debug("Rendered {} ({} bytes)", url, document.size());

        if (document.find(expected_text) != std::string::npos) {
            return AttemptResult::alive();
        }
        return AttemptResult::not_alive();

    } catch (const RenderError& e) {
        spdlog::error("Browser error while loading page: {}", e.what());
        return AttemptResult::errored(e.what());
    }
}
