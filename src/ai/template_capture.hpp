#pragma once
// =============================================================================
// Template capture - cut a card image from the screen into the season library
// =============================================================================
// Saves <templates_dir>/<season>/<cost>/<name>.png and registers it under the
// season category so it is matchable immediately.
// =============================================================================
#include "ai/card_recognizer.hpp"
#include "ai/image.hpp"
#include "ai/screen_source.hpp"
#include "ai/template_library.hpp"
#include "autopick_log.hpp"
#include "result.hpp"

#include <string>

namespace autopick::ai {

struct CaptureRequest {
    std::string name;
    int cost = 1;
    Rect region;
};

struct CaptureConfig {
    bool allow_partial_clamp = true;   // clamp regions that stick out of the frame
};

// "name:cost:x,y,w,h"
autopick::Result<CaptureRequest> parseCaptureSpec(const std::string& spec);

class TemplateCapture {
public:
    TemplateCapture(ScreenSource& screen, TemplateLibrary& library,
                    const CardRecognizer& recognizer, const std::string& templates_dir,
                    log::Sink& sink, const CaptureConfig& cfg = {});

    // Returns the written file path
    autopick::Result<std::string> capture(const CaptureRequest& req);

    // Target path for a card of the active season
    std::string pathFor(const std::string& name, int cost) const;

private:
    ScreenSource& screen_;
    TemplateLibrary& library_;
    const CardRecognizer& recognizer_;
    std::string templates_dir_;
    log::Sink& log_;
    CaptureConfig cfg_;
};

} // namespace autopick::ai
