#pragma once
// =============================================================================
// ScreenSource - on-demand pixel snapshots
// =============================================================================
// The platform capture primitive lives outside this library; implementations
// return an empty Image on failure and never throw.
// =============================================================================
#include "ai/image.hpp"

#include <mutex>

namespace autopick::ai {

class ScreenSource {
public:
    virtual ~ScreenSource() = default;

    virtual Image capture(const Rect& region) = 0;
    virtual Image captureFull() = 0;
};

// Serves crops of a stored frame (replay files, tests). Thread-safe.
class FrameScreenSource : public ScreenSource {
public:
    FrameScreenSource() = default;
    explicit FrameScreenSource(Image frame) : frame_(std::move(frame)) {}

    void setFrame(Image frame) {
        std::lock_guard<std::mutex> lock(mutex_);
        frame_ = std::move(frame);
    }

    Image capture(const Rect& region) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++capture_calls_;
        return crop(frame_, region);
    }

    Image captureFull() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++capture_calls_;
        return frame_;
    }

    int captureCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return capture_calls_;
    }

private:
    mutable std::mutex mutex_;
    Image frame_;
    int capture_calls_ = 0;
};

} // namespace autopick::ai
