// =============================================================================
// Unit tests for config_loader.hpp
// Tests: defaults, section parsing, clamping, bad input, component configs
// =============================================================================
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include "config_loader.hpp"

using namespace autopick;
using namespace autopick::config;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static void writeTmpJson(const char* path, const char* content) {
    std::ofstream f(path);
    f << content;
}

// ---------------------------------------------------------------------------
// Defaults
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, DefaultValues) {
    AppConfig cfg;
    EXPECT_EQ(cfg.automation.detect_interval_ms, 300);
    EXPECT_EQ(cfg.automation.pick_cooldown_ms,   500);
    EXPECT_EQ(cfg.automation.stop_timeout_ms,    2000);
    EXPECT_TRUE(cfg.automation.random_offset);
    EXPECT_EQ(cfg.automation.offset_range,       10);
    EXPECT_EQ(cfg.recognition.templates_dir,     "resources/cards");
    EXPECT_EQ(cfg.recognition.season,            "s13");
    EXPECT_FLOAT_EQ(cfg.recognition.slot_threshold, 0.70f);
    EXPECT_EQ(cfg.recognition.shop_regions.size(), 5u);
    EXPECT_TRUE(cfg.recognition.phase_region.empty());
    EXPECT_EQ(cfg.strategy.active,               "priority");
    EXPECT_EQ(cfg.strategy.max_cost,             5);
    EXPECT_TRUE(cfg.strategy.prefer_higher_cost);
    EXPECT_EQ(cfg.log.log_path,                  "autopick.log");
}

TEST(ConfigLoaderTest, LoadConfigMissingFileReturnsDefaults) {
    log::MemorySink sink;
    AppConfig cfg = loadConfig("__nonexistent_autopick_config.json", sink);
    EXPECT_EQ(cfg.recognition.season, "s13");
    EXPECT_EQ(cfg.log.log_path, "autopick.log");
    EXPECT_EQ(sink.count(log::Level::Warn), 1u);
}

TEST(ConfigLoaderTest, ParseErrorReturnsDefaults) {
    log::MemorySink sink;
    AppConfig cfg = parseConfig("{ \"automation\": { ", sink);
    EXPECT_EQ(cfg.automation.detect_interval_ms, 300);
    EXPECT_EQ(sink.count(log::Level::Error), 1u);

    AppConfig arr = parseConfig("[1, 2, 3]", sink);
    EXPECT_EQ(arr.strategy.active, "priority");
}

// ---------------------------------------------------------------------------
// Full file
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadsAllSections) {
    const char* path = "autopick_test_config.json";
    writeTmpJson(path, R"({
        "automation": {"detect_interval_ms": 250, "pick_cooldown_ms": 800,
                       "random_offset": false, "screen_width": 2560, "auto_start": true},
        "recognition": {"templates_dir": "cards", "season": "s14", "slot_threshold": 0.75,
                        "shop_regions": [[0, 0, 100, 120], {"x": 100, "y": 0, "w": 100, "h": 120}],
                        "phase_region": [0, 900, 400, 100]},
        "strategy": {"active": "target_comp", "priority_list": ["Ahri", "Jinx"],
                     "max_cost": 3, "prefer_higher_cost": false,
                     "cost_weights": {"1": 0.5, "5": 3.0},
                     "target_comp": ["Vi"], "decks": {"rebels": ["Jinx", "Vi"]}},
        "cards": [{"name": "Ahri", "cost": 3, "classes": ["Mage"], "season": "s14"},
                  {"name": "Vi", "cost": 1, "classes": ["Brawler"]}],
        "log": {"log_path": "run.log", "level": "debug"}
    })");

    log::MemorySink sink;
    AppConfig cfg = loadConfig(path, sink);
    std::remove(path);

    EXPECT_EQ(cfg.automation.detect_interval_ms, 250);
    EXPECT_EQ(cfg.automation.pick_cooldown_ms, 800);
    EXPECT_FALSE(cfg.automation.random_offset);
    EXPECT_EQ(cfg.automation.screen_width, 2560);
    EXPECT_EQ(cfg.automation.screen_height, 1080);
    EXPECT_TRUE(cfg.automation.auto_start);

    EXPECT_EQ(cfg.recognition.templates_dir, "cards");
    EXPECT_EQ(cfg.recognition.season, "s14");
    EXPECT_FLOAT_EQ(cfg.recognition.slot_threshold, 0.75f);
    ASSERT_EQ(cfg.recognition.shop_regions.size(), 2u);
    EXPECT_EQ(cfg.recognition.shop_regions[1], (ai::Rect{100, 0, 100, 120}));
    EXPECT_EQ(cfg.recognition.phase_region, (ai::Rect{0, 900, 400, 100}));

    EXPECT_EQ(cfg.strategy.active, "target_comp");
    ASSERT_EQ(cfg.strategy.priority_list.size(), 2u);
    EXPECT_EQ(cfg.strategy.max_cost, 3);
    EXPECT_FALSE(cfg.strategy.prefer_higher_cost);
    EXPECT_FLOAT_EQ(cfg.strategy.cost_weights.at(5), 3.0f);
    EXPECT_EQ(cfg.strategy.decks.at("rebels").size(), 2u);

    ASSERT_EQ(cfg.cards.size(), 2u);
    EXPECT_EQ(cfg.cards[0].classes.count("Mage"), 1u);
    EXPECT_EQ(cfg.log.log_path, "run.log");
    EXPECT_EQ(cfg.log.level, "debug");
}

// ---------------------------------------------------------------------------
// Per-key fallback and clamping
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, WrongTypesFallBackPerKey) {
    log::MemorySink sink;
    AppConfig cfg = parseConfig(R"({"automation": {"detect_interval_ms": "fast",
                                                   "pick_cooldown_ms": 700}})", sink);
    EXPECT_EQ(cfg.automation.detect_interval_ms, 300);
    EXPECT_EQ(cfg.automation.pick_cooldown_ms, 700);
    EXPECT_TRUE(sink.contains("detect_interval_ms"));
}

TEST(ConfigLoaderTest, IntervalsClampToMinimum) {
    log::NullSink sink;
    AppConfig cfg = parseConfig(R"({"automation": {"detect_interval_ms": 10,
                                                   "pick_cooldown_ms": 0}})", sink);
    EXPECT_EQ(cfg.automation.detect_interval_ms, 100);
    EXPECT_EQ(cfg.automation.pick_cooldown_ms, 100);
}

TEST(ConfigLoaderTest, InvalidRegionsAndWeightsSkipped) {
    log::MemorySink sink;
    AppConfig cfg = parseConfig(R"({
        "recognition": {"shop_regions": [[1, 2, 3], [0, 0, 10, 10], "x"]},
        "strategy": {"cost_weights": {"one": 2.0, "2": 1.5}},
        "cards": [{"cost": 2}, {"name": "Vi"}]
    })", sink);
    EXPECT_EQ(cfg.recognition.shop_regions.size(), 1u);
    EXPECT_EQ(cfg.strategy.cost_weights.size(), 1u);
    EXPECT_FLOAT_EQ(cfg.strategy.cost_weights.at(2), 1.5f);
    ASSERT_EQ(cfg.cards.size(), 1u);
    EXPECT_EQ(cfg.cards[0].name, "Vi");
    EXPECT_GE(sink.count(log::Level::Warn), 4u);
}

// ---------------------------------------------------------------------------
// Component configs
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, ComponentConfigs) {
    AppConfig cfg;
    cfg.automation.detect_interval_ms = 400;
    cfg.automation.offset_range = 4;
    cfg.recognition.season = "s14";
    cfg.cards.push_back(CardEntry{"Ahri", {"Mage"}, "s14"});
    cfg.cards.push_back(CardEntry{"Vi", {"Brawler"}, ""});
    cfg.cards.push_back(CardEntry{"Old", {"Legacy"}, "s12"});

    EXPECT_EQ(toControllerConfig(cfg).detect_interval_ms, 400);
    EXPECT_EQ(toActuatorConfig(cfg).offset_range, 4);
    EXPECT_EQ(toRecognizerConfig(cfg).season, "s14");

    auto classes = cardClasses(cfg, "s14");
    EXPECT_EQ(classes.size(), 2u);
    EXPECT_EQ(classes.count("Old"), 0u);
    EXPECT_EQ(classes.at("Vi").count("Brawler"), 1u);
}
