#pragma once
// =============================================================================
// CardRecognizer - phase detection + per-slot template matching
// =============================================================================
// Per pass:
//   1. full snapshot -> currency hue ratio in the phase region -> Shopping/Lobby
//   2. Shopping only: crop every shop slot, best season template above
//      slot_threshold labels the slot, cost from the color-band heuristic
//   3. GameState card list replaced wholesale
// The estimated cost is a best-effort color approximation and can disagree
// with the matched template's real cost.
// =============================================================================
#include "ai/card.hpp"
#include "ai/game_state.hpp"
#include "ai/image.hpp"
#include "ai/screen_source.hpp"
#include "ai/template_library.hpp"
#include "ai/template_matcher.hpp"
#include "autopick_log.hpp"
#include "result.hpp"

#include <chrono>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace autopick {
class EventBus;
}

namespace autopick::ai {

// Five 150x200 slots along y=500 on a 1920x1080 screen
std::vector<Rect> defaultShopRegions();

struct RecognizerConfig {
    std::string templates_dir = "resources/cards";
    std::string season = "s13";
    float slot_threshold = 0.70f;   // best match must score above this
    double shop_ratio = 0.02;       // currency pixel fraction for Shopping
    std::vector<Rect> shop_regions = defaultShopRegions();
    Rect phase_region;              // empty = whole snapshot
};

struct RecognizerStats {
    size_t template_count = 0;
    size_t slot_count = 0;
    size_t recognized_count = 0;
    GamePhase phase = GamePhase::Unknown;
    bool active = false;
    std::string season;
};

class CardRecognizer {
public:
    // Cost bands in OpenCV 8-bit HSV (H 0-180), index 0 = cost 1
    static const HsvRange kCostBands[5];
    static const HsvRange kCurrencyBand;

    CardRecognizer(ScreenSource& screen, TemplateLibrary& library,
                   const TemplateMatcher& matcher, log::Sink& sink,
                   EventBus* bus = nullptr, const RecognizerConfig& cfg = {});

    // Load <templates_dir>/<season>/<1..5> and <templates_dir>/general.
    // Returns template count loaded.
    int loadSeasonTemplates();

    // Clears the library and reloads for the new season. The setters below
    // are not synchronized with a running AutomationController loop; go
    // through the controller's setters while it runs.
    int setSeason(const std::string& season);
    const std::string& season() const { return cfg_.season; }

    // Category holding season templates of one cost tier ("card_s13_c3")
    std::string seasonCategory(int cost) const;

    // Full pipeline on a fresh snapshot. Err(Recognition) on an empty capture.
    autopick::Result<std::vector<Card>> refreshAndRecognize(
        std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    // Phase from a full snapshot; updates GameState
    GamePhase detectPhase(const Image& full,
                          std::chrono::steady_clock::time_point now =
                              std::chrono::steady_clock::now());

    // Per-slot recognition (captures each slot from the ScreenSource)
    std::vector<Card> recognizeCards();

    // Card position, else its slot center, else (0, 0)
    std::pair<int, int> cardPosition(const Card& card) const;

    void setShopRegions(std::vector<Rect> regions) { cfg_.shop_regions = std::move(regions); }
    const std::vector<Rect>& shopRegions() const { return cfg_.shop_regions; }

    // name -> class tags
    void setCardCatalog(std::map<std::string, std::set<std::string>> catalog) {
        catalog_ = std::move(catalog);
    }

    void setSlotThreshold(float t) { cfg_.slot_threshold = t; }

    RecognizerStats stats() const;

    GameState& gameState() { return state_; }
    const GameState& gameState() const { return state_; }

    // Cost tier whose band covers strictly the most pixels; 1 if none match
    static int estimateCost(const Image& crop);

    // Fraction of pixels in the currency band (0 for an empty image)
    static double currencyRatio(const Image& img);

private:
    void publishPhaseChange(GamePhase old_phase, GamePhase new_phase);

    ScreenSource& screen_;
    TemplateLibrary& library_;
    const TemplateMatcher& matcher_;
    log::Sink& log_;
    EventBus* bus_;
    RecognizerConfig cfg_;
    std::map<std::string, std::set<std::string>> catalog_;
    GameState state_;
};

} // namespace autopick::ai
