#pragma once
// =============================================================================
// Image - packed RGB8 pixel buffer, ROI crop, HSV conversion, file I/O
// =============================================================================
#include "result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace autopick::ai {

struct Rect {
    int x = 0, y = 0, w = 0, h = 0;

    bool empty() const { return w <= 0 || h <= 0; }
    int centerX() const { return x + w / 2; }
    int centerY() const { return y + h / 2; }
    bool operator==(const Rect& o) const {
        return x == o.x && y == o.y && w == o.w && h == o.h;
    }
};

// RGB8, row-major, stride = w * 3
struct Image {
    int w = 0;
    int h = 0;
    std::vector<uint8_t> pix;

    Image() = default;
    Image(int width, int height, uint8_t r = 0, uint8_t g = 0, uint8_t b = 0);

    bool empty() const { return w <= 0 || h <= 0 || pix.empty(); }
    size_t pixelCount() const { return (size_t)w * (size_t)h; }

    const uint8_t* at(int x, int y) const { return &pix[((size_t)y * w + x) * 3]; }
    uint8_t* at(int x, int y) { return &pix[((size_t)y * w + x) * 3]; }

    void set(int x, int y, uint8_t r, uint8_t g, uint8_t b) {
        uint8_t* p = at(x, y);
        p[0] = r; p[1] = g; p[2] = b;
    }
    void fill(const Rect& r, uint8_t red, uint8_t green, uint8_t blue);
};

struct Hsv {
    uint8_t h = 0;   // 0-180
    uint8_t s = 0;   // 0-255
    uint8_t v = 0;   // 0-255
};

// Inclusive HSV band
struct HsvRange {
    Hsv lo;
    Hsv hi;
    bool contains(const Hsv& p) const {
        return p.h >= lo.h && p.h <= hi.h &&
               p.s >= lo.s && p.s <= hi.s &&
               p.v >= lo.v && p.v <= hi.v;
    }
};

// Clamp roi to [0,w)x[0,h); false if nothing remains
bool clampRect(int frame_w, int frame_h, Rect& roi);

// Copy of the clamped region; empty Image when the region is outside the frame
Image crop(const Image& src, const Rect& roi);

Hsv rgbToHsv(uint8_t r, uint8_t g, uint8_t b);

// Number of pixels whose HSV value lies in the band
size_t countInRange(const Image& img, const HsvRange& range);

// stb_image: PNG / JPG / BMP -> RGB8
autopick::Result<Image> loadImageFile(const std::string& path);

// Dimensions only (no decode)
bool readImageDimensions(const std::string& path, int& w, int& h);

// stb_image_write: RGB8 -> PNG
autopick::Result<void> writeImagePng(const std::string& path, const Image& img);

} // namespace autopick::ai
