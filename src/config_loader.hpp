#pragma once
// =============================================================================
// AutoPick Config Loader
// =============================================================================
// Loads settings from a JSON file with nlohmann/json. Missing file or parse
// error -> defaults; missing keys fall back per key.
// =============================================================================

#include <algorithm>
#include <fstream>
#include <iterator>
#include <map>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "autopick_log.hpp"
#include "ai/actuator.hpp"
#include "ai/automation_controller.hpp"
#include "ai/card_recognizer.hpp"
#include "ai/image.hpp"

namespace autopick {
namespace config {

struct AutomationConfig {
    int detect_interval_ms = 300;
    int pick_cooldown_ms = 500;
    int stop_timeout_ms = 2000;
    int pause_poll_ms = 100;
    bool random_offset = true;
    int offset_range = 10;
    int screen_width = 1920;
    int screen_height = 1080;
    bool auto_start = false;
};

struct RecognitionConfig {
    std::string templates_dir = "resources/cards";
    std::string season = "s13";
    float slot_threshold = 0.70f;
    float matcher_threshold = 0.80f;
    double shop_ratio = 0.02;
    std::vector<ai::Rect> shop_regions = ai::defaultShopRegions();
    ai::Rect phase_region;
};

struct StrategyConfig {
    std::string active = "priority";
    std::vector<std::string> priority_list;
    int max_cost = 5;
    bool prefer_higher_cost = true;
    std::map<int, float> cost_weights;
    std::vector<std::string> target_comp;
    std::map<std::string, std::vector<std::string>> decks;
};

struct CardEntry {
    std::string name;
    std::set<std::string> classes;
    std::string season;
};

struct LogConfig {
    std::string log_path = "autopick.log";
    std::string level = "info";
};

struct AppConfig {
    AutomationConfig automation;
    RecognitionConfig recognition;
    StrategyConfig strategy;
    std::vector<CardEntry> cards;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def, log::Sink* sink = nullptr) {
    if (!j.contains(section) || !j[section].is_object()) return def;
    const auto& s = j[section];
    if (!s.contains(key)) return def;
    try {
        return s[key].get<T>();
    } catch (const nlohmann::json::exception& e) {
        if (sink) {
            APLOG_WARN(*sink, "config", "%s.%s: %s (using default)",
                       section.c_str(), key.c_str(), e.what());
        }
    }
    return def;
}

// {"x":..,"y":..,"w":..,"h":..} or [x, y, w, h]
inline bool parseRect(const nlohmann::json& j, ai::Rect& out) {
    if (j.is_array() && j.size() == 4 && std::all_of(j.begin(), j.end(),
            [](const nlohmann::json& v) { return v.is_number_integer(); })) {
        out = ai::Rect{j[0].get<int>(), j[1].get<int>(), j[2].get<int>(), j[3].get<int>()};
        return true;
    }
    if (j.is_object() && j.contains("x") && j.contains("y") &&
        j.contains("w") && j.contains("h")) {
        out = ai::Rect{j.value("x", 0), j.value("y", 0), j.value("w", 0), j.value("h", 0)};
        return true;
    }
    return false;
}

inline void parseRecognition(const nlohmann::json& j, RecognitionConfig& rc, log::Sink& sink) {
    rc.templates_dir = jsonGet<std::string>(j, "recognition", "templates_dir", rc.templates_dir, &sink);
    rc.season = jsonGet<std::string>(j, "recognition", "season", rc.season, &sink);
    rc.slot_threshold = jsonGet<float>(j, "recognition", "slot_threshold", rc.slot_threshold, &sink);
    rc.matcher_threshold = jsonGet<float>(j, "recognition", "matcher_threshold", rc.matcher_threshold, &sink);
    rc.shop_ratio = jsonGet<double>(j, "recognition", "shop_ratio", rc.shop_ratio, &sink);

    if (!j.contains("recognition")) return;
    const auto& r = j["recognition"];

    if (r.contains("shop_regions") && r["shop_regions"].is_array()) {
        std::vector<ai::Rect> regions;
        for (const auto& item : r["shop_regions"]) {
            ai::Rect rect;
            if (parseRect(item, rect) && !rect.empty()) {
                regions.push_back(rect);
            } else {
                APLOG_WARN(sink, "config", "recognition.shop_regions: invalid entry skipped");
            }
        }
        rc.shop_regions = std::move(regions);
    }
    if (r.contains("phase_region") && !parseRect(r["phase_region"], rc.phase_region)) {
        APLOG_WARN(sink, "config", "recognition.phase_region: invalid, using full screen");
        rc.phase_region = ai::Rect{};
    }
}

inline void parseStrategy(const nlohmann::json& j, StrategyConfig& sc, log::Sink& sink) {
    sc.active = jsonGet<std::string>(j, "strategy", "active", sc.active, &sink);
    sc.priority_list = jsonGet<std::vector<std::string>>(j, "strategy", "priority_list", sc.priority_list, &sink);
    sc.max_cost = jsonGet<int>(j, "strategy", "max_cost", sc.max_cost, &sink);
    sc.prefer_higher_cost = jsonGet<bool>(j, "strategy", "prefer_higher_cost", sc.prefer_higher_cost, &sink);
    sc.target_comp = jsonGet<std::vector<std::string>>(j, "strategy", "target_comp", sc.target_comp, &sink);
    sc.decks = jsonGet<std::map<std::string, std::vector<std::string>>>(j, "strategy", "decks", sc.decks, &sink);

    // keys are cost tiers as strings: {"1": 1.0, "5": 3.0}
    auto weights = jsonGet<std::map<std::string, float>>(j, "strategy", "cost_weights", {}, &sink);
    for (const auto& kv : weights) {
        int cost = 0;
        try {
            cost = std::stoi(kv.first);
        } catch (const std::exception&) {
            APLOG_WARN(sink, "config", "strategy.cost_weights: bad cost '%s'", kv.first.c_str());
            continue;
        }
        sc.cost_weights[cost] = kv.second;
    }
}

inline void parseCards(const nlohmann::json& j, std::vector<CardEntry>& cards, log::Sink& sink) {
    if (!j.contains("cards")) return;
    if (!j["cards"].is_array()) {
        APLOG_WARN(sink, "config", "cards: expected an array");
        return;
    }
    for (const auto& item : j["cards"]) {
        if (!item.is_object() || !item.contains("name") || !item["name"].is_string()) {
            APLOG_WARN(sink, "config", "cards: entry without a name skipped");
            continue;
        }
        CardEntry e;
        e.name = item["name"].get<std::string>();
        e.season = item.value("season", std::string());
        if (item.contains("classes") && item["classes"].is_array()) {
            for (const auto& c : item["classes"]) {
                if (c.is_string()) e.classes.insert(c.get<std::string>());
            }
        }
        cards.push_back(std::move(e));
    }
}

inline void clampTimings(AutomationConfig& ac) {
    ac.detect_interval_ms = std::max(ac.detect_interval_ms, ai::ControllerConfig::kMinIntervalMs);
    ac.pick_cooldown_ms = std::max(ac.pick_cooldown_ms, ai::ControllerConfig::kMinIntervalMs);
}

// Parse JSON text; parse errors -> defaults with an error log
inline AppConfig parseConfig(const std::string& text, log::Sink& sink) {
    AppConfig config;

    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            APLOG_ERROR(sink, "config", "top level must be an object, using defaults");
            return config;
        }

        auto& ac = config.automation;
        ac.detect_interval_ms = jsonGet<int>(j, "automation", "detect_interval_ms", 300, &sink);
        ac.pick_cooldown_ms = jsonGet<int>(j, "automation", "pick_cooldown_ms", 500, &sink);
        ac.stop_timeout_ms = jsonGet<int>(j, "automation", "stop_timeout_ms", 2000, &sink);
        ac.pause_poll_ms = jsonGet<int>(j, "automation", "pause_poll_ms", 100, &sink);
        ac.random_offset = jsonGet<bool>(j, "automation", "random_offset", true, &sink);
        ac.offset_range = jsonGet<int>(j, "automation", "offset_range", 10, &sink);
        ac.screen_width = jsonGet<int>(j, "automation", "screen_width", 1920, &sink);
        ac.screen_height = jsonGet<int>(j, "automation", "screen_height", 1080, &sink);
        ac.auto_start = jsonGet<bool>(j, "automation", "auto_start", false, &sink);
        clampTimings(ac);

        parseRecognition(j, config.recognition, sink);
        parseStrategy(j, config.strategy, sink);
        parseCards(j, config.cards, sink);

        config.log.log_path = jsonGet<std::string>(j, "log", "log_path", "autopick.log", &sink);
        config.log.level = jsonGet<std::string>(j, "log", "level", "info", &sink);

    } catch (const nlohmann::json::exception& e) {
        APLOG_ERROR(sink, "config", "JSON parse error: %s", e.what());
        return AppConfig{};
    }

    APLOG_INFO(sink, "config", "Loaded: season=%s, strategy=%s, %zu slot(s), %zu catalog card(s)",
               config.recognition.season.c_str(), config.strategy.active.c_str(),
               config.recognition.shop_regions.size(), config.cards.size());
    return config;
}

inline AppConfig loadConfig(const std::string& configPath, log::Sink& sink) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        APLOG_WARN(sink, "config", "%s not found, using defaults", configPath.c_str());
        return AppConfig{};
    }
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return parseConfig(text, sink);
}

// =============================================================================
// Component configs
// =============================================================================

inline ai::RecognizerConfig toRecognizerConfig(const AppConfig& c) {
    ai::RecognizerConfig rc;
    rc.templates_dir = c.recognition.templates_dir;
    rc.season = c.recognition.season;
    rc.slot_threshold = c.recognition.slot_threshold;
    rc.shop_ratio = c.recognition.shop_ratio;
    rc.shop_regions = c.recognition.shop_regions;
    rc.phase_region = c.recognition.phase_region;
    return rc;
}

inline ai::ControllerConfig toControllerConfig(const AppConfig& c) {
    ai::ControllerConfig cc;
    cc.detect_interval_ms = c.automation.detect_interval_ms;
    cc.pick_cooldown_ms = c.automation.pick_cooldown_ms;
    cc.stop_timeout_ms = c.automation.stop_timeout_ms;
    cc.pause_poll_ms = c.automation.pause_poll_ms;
    return cc;
}

inline ai::ActuatorConfig toActuatorConfig(const AppConfig& c) {
    ai::ActuatorConfig ac;
    ac.screen_width = c.automation.screen_width;
    ac.screen_height = c.automation.screen_height;
    ac.random_offset = c.automation.random_offset;
    ac.offset_range = c.automation.offset_range;
    return ac;
}

// Catalog entries of the given season (entries without a season apply to all)
inline std::map<std::string, std::set<std::string>> cardClasses(const AppConfig& c,
                                                                 const std::string& season) {
    std::map<std::string, std::set<std::string>> out;
    for (const auto& e : c.cards) {
        if (!e.season.empty() && e.season != season) continue;
        out[e.name] = e.classes;
    }
    return out;
}

} // namespace config
} // namespace autopick
