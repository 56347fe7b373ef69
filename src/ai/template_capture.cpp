// =============================================================================
// Template capture - screen ROI -> PNG -> TemplateLibrary
// =============================================================================
#include "ai/template_capture.hpp"

#include <cstdio>
#include <filesystem>

static constexpr const char* TAG = "TplCapture";

namespace fs = std::filesystem;

namespace autopick::ai {

autopick::Result<CaptureRequest> parseCaptureSpec(const std::string& spec) {
    size_t c1 = spec.find(':');
    size_t c2 = c1 == std::string::npos ? std::string::npos : spec.find(':', c1 + 1);
    if (c1 == std::string::npos || c2 == std::string::npos || c1 == 0) {
        return Err<CaptureRequest>("expected name:cost:x,y,w,h", ErrorCode::InvalidArgument);
    }

    CaptureRequest req;
    req.name = spec.substr(0, c1);

    int cost = 0;
    int x = 0, y = 0, w = 0, h = 0;
    if (std::sscanf(spec.substr(c1 + 1, c2 - c1 - 1).c_str(), "%d", &cost) != 1 ||
        std::sscanf(spec.substr(c2 + 1).c_str(), "%d,%d,%d,%d", &x, &y, &w, &h) != 4) {
        return Err<CaptureRequest>("bad numbers in capture spec: " + spec,
                                   ErrorCode::InvalidArgument);
    }
    if (cost < 1 || cost > 5) {
        return Err<CaptureRequest>("cost must be 1..5", ErrorCode::InvalidArgument);
    }
    if (w <= 0 || h <= 0) {
        return Err<CaptureRequest>("region w/h <= 0", ErrorCode::InvalidArgument);
    }

    req.cost = cost;
    req.region = Rect{x, y, w, h};
    return Ok(std::move(req));
}

TemplateCapture::TemplateCapture(ScreenSource& screen, TemplateLibrary& library,
                                 const CardRecognizer& recognizer,
                                 const std::string& templates_dir, log::Sink& sink,
                                 const CaptureConfig& cfg)
    : screen_(screen), library_(library), recognizer_(recognizer),
      templates_dir_(templates_dir), log_(sink), cfg_(cfg) {}

std::string TemplateCapture::pathFor(const std::string& name, int cost) const {
    return (fs::path(templates_dir_) / recognizer_.season() / std::to_string(cost) /
            (name + ".png")).string();
}

autopick::Result<std::string> TemplateCapture::capture(const CaptureRequest& req) {
    if (req.name.empty()) {
        return Err<std::string>("empty template name", ErrorCode::InvalidArgument);
    }
    if (req.cost < 1 || req.cost > 5) {
        return Err<std::string>("cost must be 1..5", ErrorCode::InvalidArgument);
    }

    Image full = screen_.captureFull();
    if (full.empty()) {
        return Err<std::string>("screen capture returned an empty image", ErrorCode::Recognition);
    }

    Rect roi = req.region;
    if (cfg_.allow_partial_clamp) {
        if (!clampRect(full.w, full.h, roi)) {
            return Err<std::string>("region outside the frame", ErrorCode::InvalidArgument);
        }
    } else if (roi.x < 0 || roi.y < 0 || roi.x + roi.w > full.w || roi.y + roi.h > full.h) {
        return Err<std::string>("region outside the frame", ErrorCode::InvalidArgument);
    }

    Image img = crop(full, roi);

    const std::string path = pathFor(req.name, req.cost);
    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        return Err<std::string>("cannot create " + fs::path(path).parent_path().string() +
                                ": " + ec.message(), ErrorCode::Io);
    }

    auto written = writeImagePng(path, img);
    if (written.is_err()) return written.error();

    auto reg = library_.registerImage(req.name, img, recognizer_.seasonCategory(req.cost), path);
    if (reg.is_err()) return reg.error();

    APLOG_INFO(log_, TAG, "captured %s (%d-cost) %dx%d -> %s",
               req.name.c_str(), req.cost, img.w, img.h, path.c_str());
    return Ok(path);
}

} // namespace autopick::ai
