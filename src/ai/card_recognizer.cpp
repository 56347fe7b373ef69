#include "ai/card_recognizer.hpp"
#include "event_bus.hpp"

#include <filesystem>

static constexpr const char* TAG = "recognizer";

namespace fs = std::filesystem;

namespace autopick::ai {

std::vector<Rect> defaultShopRegions() {
    std::vector<Rect> regions;
    for (int i = 0; i < 5; ++i) {
        regions.push_back(Rect{200 + i * 200, 500, 150, 200});
    }
    return regions;
}

const HsvRange CardRecognizer::kCostBands[5] = {
    {{40, 200, 200}, {50, 255, 255}},    // 1: green
    {{20, 150, 200}, {30, 255, 255}},    // 2: yellow
    {{0, 100, 200}, {10, 200, 255}},     // 3: red
    {{120, 100, 200}, {140, 255, 255}},  // 4: purple
    {{0, 0, 200}, {180, 50, 255}},       // 5: white
};

const HsvRange CardRecognizer::kCurrencyBand = {{20, 100, 200}, {40, 255, 255}};

CardRecognizer::CardRecognizer(ScreenSource& screen, TemplateLibrary& library,
                               const TemplateMatcher& matcher, log::Sink& sink,
                               EventBus* bus, const RecognizerConfig& cfg)
    : screen_(screen), library_(library), matcher_(matcher), log_(sink),
      bus_(bus), cfg_(cfg) {}

std::string CardRecognizer::seasonCategory(int cost) const {
    return "card_" + cfg_.season + "_c" + std::to_string(cost);
}

// =============================================================================
// Templates
// =============================================================================

int CardRecognizer::loadSeasonTemplates() {
    const fs::path season_dir = fs::path(cfg_.templates_dir) / cfg_.season;
    int loaded = 0;

    std::error_code ec;
    if (!fs::is_directory(season_dir, ec)) {
        APLOG_WARN(log_, TAG, "season directory missing: %s", season_dir.string().c_str());
    } else {
        for (int cost = 1; cost <= 5; ++cost) {
            fs::path cost_dir = season_dir / std::to_string(cost);
            if (!fs::is_directory(cost_dir, ec)) continue;
            loaded += library_.load(cost_dir.string(), seasonCategory(cost));
        }
    }

    fs::path general_dir = fs::path(cfg_.templates_dir) / "general";
    if (fs::is_directory(general_dir, ec)) {
        loaded += library_.load(general_dir.string(), "general");
    }

    APLOG_INFO(log_, TAG, "season %s: %d template(s) loaded", cfg_.season.c_str(), loaded);
    return loaded;
}

int CardRecognizer::setSeason(const std::string& season) {
    std::string old = cfg_.season;
    cfg_.season = season;
    library_.clear();
    int loaded = loadSeasonTemplates();

    if (bus_) {
        SeasonChangedEvent evt;
        evt.old_season = old;
        evt.new_season = season;
        evt.templates_loaded = loaded;
        bus_->publish(evt);
    }
    return loaded;
}

// =============================================================================
// Color heuristics
// =============================================================================

int CardRecognizer::estimateCost(const Image& crop) {
    if (crop.empty()) return 1;

    int best_cost = 1;
    size_t best_count = 0;
    for (int i = 0; i < 5; ++i) {
        size_t n = countInRange(crop, kCostBands[i]);
        if (n > best_count) {
            best_count = n;
            best_cost = i + 1;
        }
    }
    return best_cost;
}

double CardRecognizer::currencyRatio(const Image& img) {
    if (img.empty()) return 0.0;
    return (double)countInRange(img, kCurrencyBand) / (double)img.pixelCount();
}

// =============================================================================
// Pipeline
// =============================================================================

GamePhase CardRecognizer::detectPhase(const Image& full,
                                      std::chrono::steady_clock::time_point now) {
    double ratio = cfg_.phase_region.empty()
        ? currencyRatio(full)
        : currencyRatio(crop(full, cfg_.phase_region));

    GamePhase detected = ratio > cfg_.shop_ratio ? GamePhase::Shopping : GamePhase::Lobby;
    GamePhase old = state_.phase;

    state_.is_active = detected == GamePhase::Shopping;
    if (state_.updatePhase(detected, now)) {
        APLOG_INFO(log_, TAG, "phase %s -> %s (currency %.3f)",
                   gamePhaseName(old), gamePhaseName(detected), ratio);
        publishPhaseChange(old, detected);
    }
    return detected;
}

std::vector<Card> CardRecognizer::recognizeCards() {
    std::vector<Card> cards;
    const std::string prefix = "card_" + cfg_.season + "_c";

    for (size_t i = 0; i < cfg_.shop_regions.size(); ++i) {
        const Rect& region = cfg_.shop_regions[i];
        Image slot = screen_.capture(region);
        if (slot.empty()) {
            APLOG_DEBUG(log_, TAG, "slot %zu: empty capture", i);
            continue;
        }

        auto matches = matcher_.matchAll(slot, cfg_.slot_threshold, prefix);

        const MatchResult* best = nullptr;
        for (const auto& kv : matches) {
            for (const auto& m : kv.second) {
                if (!best || m.score > best->score) best = &m;
            }
        }
        if (!best || best->score <= cfg_.slot_threshold) continue;

        Card card(best->template_name, estimateCost(slot), best->score);
        card.setPosition(region.centerX(), region.centerY());
        card.shop_index = (int)i;
        auto cat = catalog_.find(card.name);
        if (cat != catalog_.end()) card.classes = cat->second;

        APLOG_DEBUG(log_, TAG, "slot %zu: %s conf=%.3f", i, card.fullName().c_str(),
                    card.confidence);
        cards.push_back(std::move(card));
    }
    return cards;
}

autopick::Result<std::vector<Card>> CardRecognizer::refreshAndRecognize(
    std::chrono::steady_clock::time_point now) {
    Image full = screen_.captureFull();
    if (full.empty()) {
        return Err<std::vector<Card>>("screen capture returned an empty image",
                                      ErrorCode::Recognition);
    }

    GamePhase phase = detectPhase(full, now);
    if (phase != GamePhase::Shopping) {
        state_.replaceCards({});
        return Ok(std::vector<Card>{});
    }

    std::vector<Card> cards = recognizeCards();
    state_.replaceCards(cards);
    return Ok(std::move(cards));
}

std::pair<int, int> CardRecognizer::cardPosition(const Card& card) const {
    if (card.hasPosition()) return {card.x, card.y};
    if (card.shop_index && *card.shop_index >= 0 &&
        *card.shop_index < (int)cfg_.shop_regions.size()) {
        const Rect& r = cfg_.shop_regions[*card.shop_index];
        return {r.centerX(), r.centerY()};
    }
    return {0, 0};
}

RecognizerStats CardRecognizer::stats() const {
    RecognizerStats s;
    s.template_count = library_.size();
    s.slot_count = cfg_.shop_regions.size();
    s.recognized_count = state_.cards.size();
    s.phase = state_.phase;
    s.active = state_.is_active;
    s.season = cfg_.season;
    return s;
}

void CardRecognizer::publishPhaseChange(GamePhase old_phase, GamePhase new_phase) {
    if (!bus_) return;
    PhaseChangeEvent evt;
    evt.old_phase = old_phase;
    evt.new_phase = new_phase;
    bus_->publish(evt);
}

} // namespace autopick::ai
