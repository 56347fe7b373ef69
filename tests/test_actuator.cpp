// =============================================================================
// Unit tests for Actuator / TapEventActuator (src/ai/actuator.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include <cstdlib>
#include <vector>
#include "ai/actuator.hpp"
#include "event_bus.hpp"

using namespace autopick;
using namespace autopick::ai;

namespace {

class RecordingActuator : public Actuator {
public:
    using Actuator::Actuator;
    std::vector<std::pair<int, int>> clicks;
    bool accept = true;

protected:
    bool doClick(int x, int y) override {
        clicks.emplace_back(x, y);
        return accept;
    }
};

ActuatorConfig exactConfig() {
    ActuatorConfig cfg;
    cfg.random_offset = false;
    return cfg;
}

} // namespace

// ---------------------------------------------------------------------------
// Bounds: screen extents plus a 10 px tolerance
// ---------------------------------------------------------------------------
TEST(ActuatorTest, OnScreenTolerance) {
    log::NullSink sink;
    RecordingActuator a(sink, exactConfig());
    EXPECT_TRUE(a.isOnScreen(0, 0));
    EXPECT_TRUE(a.isOnScreen(-10, -10));
    EXPECT_TRUE(a.isOnScreen(1930, 1090));
    EXPECT_FALSE(a.isOnScreen(-11, 500));
    EXPECT_FALSE(a.isOnScreen(500, 1091));
}

TEST(ActuatorTest, OffScreenReturnsFalseWithoutClicking) {
    log::MemorySink sink;
    RecordingActuator a(sink, exactConfig());
    EXPECT_FALSE(a.click(5000, 10));
    EXPECT_FALSE(a.pick(-100, 10));
    EXPECT_TRUE(a.clicks.empty());
    EXPECT_EQ(sink.count(log::Level::Warn), 2u);
}

TEST(ActuatorTest, ClickIsExactAndReportsBackend) {
    log::NullSink sink;
    RecordingActuator a(sink, exactConfig());
    EXPECT_TRUE(a.click(100, 200));
    ASSERT_EQ(a.clicks.size(), 1u);
    EXPECT_EQ(a.clicks[0], std::make_pair(100, 200));

    a.accept = false;
    EXPECT_FALSE(a.pick(100, 200));
}

// ---------------------------------------------------------------------------
// pick() applies a bounded random offset
// ---------------------------------------------------------------------------
TEST(ActuatorTest, PickOffsetWithinRange) {
    log::NullSink sink;
    ActuatorConfig cfg;
    cfg.offset_range = 10;
    cfg.seed = 1234;
    RecordingActuator a(sink, cfg);

    bool moved = false;
    for (int i = 0; i < 50; ++i) {
        ASSERT_TRUE(a.pick(500, 600));
        const auto& c = a.clicks.back();
        EXPECT_LE(std::abs(c.first - 500), 10);
        EXPECT_LE(std::abs(c.second - 600), 10);
        if (c.first != 500 || c.second != 600) moved = true;
    }
    EXPECT_TRUE(moved);
}

TEST(ActuatorTest, NoOffsetWhenDisabled) {
    log::NullSink sink;
    RecordingActuator a(sink, exactConfig());
    ASSERT_TRUE(a.pick(500, 600));
    EXPECT_EQ(a.clicks.back(), std::make_pair(500, 600));
}

// ---------------------------------------------------------------------------
// TapEventActuator publishes an automatic tap command
// ---------------------------------------------------------------------------
TEST(TapEventActuatorTest, PublishesTapCommand) {
    log::NullSink sink;
    EventBus bus(sink);
    std::vector<TapCommandEvent> taps;
    auto sub = bus.subscribe<TapCommandEvent>(
        [&](const TapCommandEvent& e) { taps.push_back(e); });

    TapEventActuator a(bus, sink, exactConfig());
    EXPECT_TRUE(a.click(42, 84));
    EXPECT_FALSE(a.click(-50, 84));

    ASSERT_EQ(taps.size(), 1u);
    EXPECT_EQ(taps[0].x, 42);
    EXPECT_EQ(taps[0].y, 84);
    EXPECT_EQ(taps[0].source, CommandSource::Auto);
}
