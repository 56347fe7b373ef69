#pragma once
// =============================================================================
// Deterministic synthetic images shared by the recognition tests
// =============================================================================
#include <cstdint>
#include <filesystem>
#include <string>

#include "ai/image.hpp"

namespace autopick::test {

// LCG noise: same seed -> same image, different seeds are uncorrelated
inline ai::Image noiseImage(int w, int h, uint32_t seed) {
    ai::Image img(w, h);
    uint32_t s = seed * 2654435761u + 1u;
    for (auto& p : img.pix) {
        s = s * 1664525u + 1013904223u;
        p = (uint8_t)(s >> 24);
    }
    return img;
}

// Paste src into dst at (x, y)
inline void blit(ai::Image& dst, const ai::Image& src, int x, int y) {
    for (int yy = 0; yy < src.h; ++yy) {
        for (int xx = 0; xx < src.w; ++xx) {
            const uint8_t* p = src.at(xx, yy);
            dst.set(x + xx, y + yy, p[0], p[1], p[2]);
        }
    }
}

// 200x100 frame: noisy slots at (10,10) (60,10) (110,10), 40x40 each.
// With a currency strip along the bottom the frame reads as Shopping.
struct ShopFrame {
    static constexpr int kWidth = 200;
    static constexpr int kHeight = 100;
    static constexpr int kSlot = 40;

    static ai::Rect slot(int i) { return ai::Rect{10 + i * 50, 10, kSlot, kSlot}; }
    static ai::Image slotImage(int i) { return noiseImage(kSlot, kSlot, 100 + i); }

    static ai::Image make(bool shopping) {
        ai::Image frame(kWidth, kHeight, 20, 20, 60);
        for (int i = 0; i < 3; ++i) {
            blit(frame, slotImage(i), slot(i).x, slot(i).y);
        }
        if (shopping) {
            frame.fill(ai::Rect{0, 80, kWidth, 20}, 255, 200, 0);   // gold
        }
        return frame;
    }
};

// Fresh empty directory under the system temp dir
inline std::filesystem::path freshTempDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / ("autopick_" + name);
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace autopick::test
