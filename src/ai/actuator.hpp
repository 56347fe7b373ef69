#pragma once
// =============================================================================
// Actuator - pointer clicks with bounds checking and randomized pick offset
// =============================================================================
// The platform pointer primitive is supplied by a derived class through
// doClick(). Off-screen targets return false; nothing here throws.
// =============================================================================
#include "autopick_log.hpp"

#include <cstdint>
#include <mutex>
#include <random>

namespace autopick {
class EventBus;
}

namespace autopick::ai {

struct ActuatorConfig {
    int screen_width = 1920;
    int screen_height = 1080;
    int tolerance = 10;          // px allowed outside the screen edge
    bool random_offset = true;   // applied to pick() only
    int offset_range = 10;       // +/- px
    uint32_t seed = 0;           // 0 = std::random_device
};

class Actuator {
public:
    Actuator(log::Sink& sink, const ActuatorConfig& cfg = {});
    virtual ~Actuator() = default;

    Actuator(const Actuator&) = delete;
    Actuator& operator=(const Actuator&) = delete;

    // Plain click at (x, y)
    bool click(int x, int y);

    // Card pick: bounds check on the target, then click with a random offset
    bool pick(int x, int y);

    bool isOnScreen(int x, int y) const;
    const ActuatorConfig& config() const { return cfg_; }

protected:
    virtual bool doClick(int x, int y) = 0;

    log::Sink& log_;

private:
    ActuatorConfig cfg_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

// Publishes TapCommandEvent{source = Auto} for the pointer backend to execute
class TapEventActuator : public Actuator {
public:
    TapEventActuator(EventBus& bus, log::Sink& sink, const ActuatorConfig& cfg = {});

protected:
    bool doClick(int x, int y) override;

private:
    EventBus& bus_;
};

} // namespace autopick::ai
