#include "ai/actuator.hpp"
#include "event_bus.hpp"

static constexpr const char* TAG = "actuator";

namespace autopick::ai {

static uint32_t resolveSeed(uint32_t seed) {
    if (seed != 0) return seed;
    std::random_device rd;
    return rd();
}

Actuator::Actuator(log::Sink& sink, const ActuatorConfig& cfg)
    : log_(sink), cfg_(cfg), rng_(resolveSeed(cfg.seed)) {}

bool Actuator::isOnScreen(int x, int y) const {
    return x >= -cfg_.tolerance && x <= cfg_.screen_width + cfg_.tolerance &&
           y >= -cfg_.tolerance && y <= cfg_.screen_height + cfg_.tolerance;
}

bool Actuator::click(int x, int y) {
    if (!isOnScreen(x, y)) {
        APLOG_WARN(log_, TAG, "click target off-screen: (%d, %d)", x, y);
        return false;
    }
    bool ok = doClick(x, y);
    APLOG_DEBUG(log_, TAG, "click (%d, %d) -> %s", x, y, ok ? "ok" : "rejected");
    return ok;
}

bool Actuator::pick(int x, int y) {
    if (!isOnScreen(x, y)) {
        APLOG_WARN(log_, TAG, "card position off-screen: (%d, %d)", x, y);
        return false;
    }

    int tx = x, ty = y;
    if (cfg_.random_offset && cfg_.offset_range > 0) {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        std::uniform_int_distribution<int> dist(-cfg_.offset_range, cfg_.offset_range);
        tx += dist(rng_);
        ty += dist(rng_);
    }

    bool ok = doClick(tx, ty);
    if (ok) {
        APLOG_INFO(log_, TAG, "pick click at (%d, %d)", tx, ty);
    } else {
        APLOG_WARN(log_, TAG, "pick click rejected at (%d, %d)", tx, ty);
    }
    return ok;
}

TapEventActuator::TapEventActuator(EventBus& bus, log::Sink& sink, const ActuatorConfig& cfg)
    : Actuator(sink, cfg), bus_(bus) {}

bool TapEventActuator::doClick(int x, int y) {
    TapCommandEvent evt;
    evt.x = x;
    evt.y = y;
    evt.source = CommandSource::Auto;
    bus_.publish(evt);
    return true;
}

} // namespace autopick::ai
