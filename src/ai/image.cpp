// =============================================================================
// Image - crop / HSV / stb_image load + stb_image_write save
// =============================================================================
#include "ai/image.hpp"

// STB_IMAGE_IMPLEMENTATION / STB_IMAGE_WRITE_IMPLEMENTATION live in stb_impl.cpp
#include "stb_image.h"
#include "stb_image_write.h"

#include <algorithm>
#include <cstring>

namespace autopick::ai {

Image::Image(int width, int height, uint8_t r, uint8_t g, uint8_t b)
    : w(std::max(0, width)), h(std::max(0, height)) {
    pix.resize(pixelCount() * 3);
    for (size_t i = 0; i < pixelCount(); ++i) {
        pix[i * 3 + 0] = r;
        pix[i * 3 + 1] = g;
        pix[i * 3 + 2] = b;
    }
}

void Image::fill(const Rect& rIn, uint8_t red, uint8_t green, uint8_t blue) {
    Rect r = rIn;
    if (!clampRect(w, h, r)) return;
    for (int y = r.y; y < r.y + r.h; ++y) {
        for (int x = r.x; x < r.x + r.w; ++x) set(x, y, red, green, blue);
    }
}

bool clampRect(int frame_w, int frame_h, Rect& r) {
    int x0 = std::max(0, r.x);
    int y0 = std::max(0, r.y);
    int x1 = std::min(frame_w, r.x + r.w);
    int y1 = std::min(frame_h, r.y + r.h);
    int w = x1 - x0;
    int h = y1 - y0;
    if (w <= 0 || h <= 0) return false;
    r.x = x0;
    r.y = y0;
    r.w = w;
    r.h = h;
    return true;
}

Image crop(const Image& src, const Rect& roiIn) {
    Rect roi = roiIn;
    if (src.empty() || !clampRect(src.w, src.h, roi)) return {};

    Image out;
    out.w = roi.w;
    out.h = roi.h;
    out.pix.resize(out.pixelCount() * 3);
    const size_t row_bytes = (size_t)roi.w * 3;
    for (int y = 0; y < roi.h; ++y) {
        std::memcpy(&out.pix[(size_t)y * row_bytes], src.at(roi.x, roi.y + y), row_bytes);
    }
    return out;
}

// 8-bit HSV, hue halved to fit 0-180
Hsv rgbToHsv(uint8_t r, uint8_t g, uint8_t b) {
    int mx = std::max({r, g, b});
    int mn = std::min({r, g, b});
    int diff = mx - mn;

    Hsv out;
    out.v = (uint8_t)mx;
    out.s = mx == 0 ? 0 : (uint8_t)((255 * diff + mx / 2) / mx);
    if (diff == 0) {
        out.h = 0;
        return out;
    }

    float hue;
    if (mx == r)      hue = 60.0f * (float)(g - b) / (float)diff;
    else if (mx == g) hue = 120.0f + 60.0f * (float)(b - r) / (float)diff;
    else              hue = 240.0f + 60.0f * (float)(r - g) / (float)diff;
    if (hue < 0.0f) hue += 360.0f;

    int h = (int)(hue / 2.0f + 0.5f);
    if (h >= 180) h -= 180;
    out.h = (uint8_t)h;
    return out;
}

size_t countInRange(const Image& img, const HsvRange& range) {
    if (img.empty()) return 0;
    size_t n = 0;
    const size_t count = img.pixelCount();
    for (size_t i = 0; i < count; ++i) {
        const uint8_t* p = &img.pix[i * 3];
        if (range.contains(rgbToHsv(p[0], p[1], p[2]))) ++n;
    }
    return n;
}

autopick::Result<Image> loadImageFile(const std::string& path) {
    int w = 0, h = 0, channels = 0;
    unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels, 3);
    if (!data) {
        const char* reason = stbi_failure_reason();
        return Error("stbi_load failed: " + path + " (" + (reason ? reason : "?") + ")",
                     ErrorCode::Io);
    }

    Image img;
    img.w = w;
    img.h = h;
    img.pix.assign(data, data + (size_t)w * h * 3);
    stbi_image_free(data);
    return img;
}

bool readImageDimensions(const std::string& path, int& w, int& h) {
    int channels = 0;
    return stbi_info(path.c_str(), &w, &h, &channels) != 0;
}

autopick::Result<void> writeImagePng(const std::string& path, const Image& img) {
    if (img.empty()) {
        return autopick::Err<void>("invalid image", ErrorCode::InvalidArgument);
    }
    int ret = stbi_write_png(path.c_str(), img.w, img.h, 3, img.pix.data(), img.w * 3);
    if (ret == 0) {
        return autopick::Err<void>("stbi_write_png failed: " + path, ErrorCode::Io);
    }
    return autopick::Ok();
}

} // namespace autopick::ai
