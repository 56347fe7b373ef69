#include "ai/strategy.hpp"

#include <algorithm>

static constexpr const char* TAG = "strategy";

namespace autopick::ai {

const char* strategyKindName(StrategyKind k) {
    switch (k) {
        case StrategyKind::Priority:          return "priority";
        case StrategyKind::CostWeighted:      return "cost_weighted";
        case StrategyKind::TargetComposition: return "target_comp";
    }
    return "unknown";
}

// -----------------------------------------------------------------------------
// PriorityStrategy
// -----------------------------------------------------------------------------
std::optional<Card> PriorityStrategy::select(const std::vector<Card>& candidates,
                                             const GameState& /*state*/) const {
    if (candidates.empty() || priority_list_.empty()) return std::nullopt;

    const int len = (int)priority_list_.size();
    const Card* best = nullptr;
    int best_score = 0;

    for (const auto& card : candidates) {
        if (card.cost > max_cost_) continue;

        auto it = std::find(priority_list_.begin(), priority_list_.end(), card.name);
        if (it == priority_list_.end()) continue;

        int score = len - (int)(it - priority_list_.begin());
        if (prefer_higher_cost_) score += card.cost * kCostBonus;

        // strict '>' keeps the first of equal scores
        if (!best || score > best_score) {
            best = &card;
            best_score = score;
        }
    }

    if (!best) return std::nullopt;
    return *best;
}

// -----------------------------------------------------------------------------
// CostWeightedStrategy
// -----------------------------------------------------------------------------
float CostWeightedStrategy::weightFor(int cost) const {
    auto it = weights_.find(cost);
    return it != weights_.end() ? it->second : kDefaultWeight;
}

std::optional<Card> CostWeightedStrategy::select(const std::vector<Card>& candidates,
                                                 const GameState& /*state*/) const {
    const Card* best = nullptr;
    float best_score = 0.0f;

    for (const auto& card : candidates) {
        float score = weightFor(card.cost) + card.confidence * kConfidenceFactor;
        if (!best || score > best_score) {
            best = &card;
            best_score = score;
        }
    }

    if (!best) return std::nullopt;
    return *best;
}

// -----------------------------------------------------------------------------
// TargetCompositionStrategy
// -----------------------------------------------------------------------------
std::optional<Card> TargetCompositionStrategy::select(const std::vector<Card>& candidates,
                                                      const GameState& /*state*/) const {
    for (const auto& card : candidates) {
        if (targets_.count(card.name)) return card;
    }
    return std::nullopt;
}

// -----------------------------------------------------------------------------
// StrategyManager
// -----------------------------------------------------------------------------
StrategyManager::StrategyManager(log::Sink& sink) : log_(sink) {
    registerStrategy(std::make_unique<PriorityStrategy>());
    registerStrategy(std::make_unique<CostWeightedStrategy>());
    registerStrategy(std::make_unique<TargetCompositionStrategy>());
    active_id_ = "priority";
}

void StrategyManager::registerStrategy(std::unique_ptr<PickStrategy> strategy) {
    if (!strategy) return;
    std::string id = strategy->id();
    if (strategies_.count(id)) {
        APLOG_WARN(log_, TAG, "strategy '%s' already registered, replacing", id.c_str());
    }
    strategies_[id] = std::move(strategy);
    APLOG_DEBUG(log_, TAG, "registered strategy '%s'", id.c_str());
}

bool StrategyManager::setActive(const std::string& id) {
    if (!strategies_.count(id)) {
        APLOG_ERROR(log_, TAG, "unknown strategy: %s", id.c_str());
        return false;
    }
    if (active_id_ != id) {
        APLOG_INFO(log_, TAG, "active strategy: %s -> %s", active_id_.c_str(), id.c_str());
        active_id_ = id;
    }
    return true;
}

PickStrategy* StrategyManager::active() const {
    return find(active_id_);
}

PickStrategy* StrategyManager::find(const std::string& id) const {
    auto it = strategies_.find(id);
    return it != strategies_.end() ? it->second.get() : nullptr;
}

std::vector<std::string> StrategyManager::availableIds() const {
    std::vector<std::string> ids;
    ids.reserve(strategies_.size());
    for (const auto& kv : strategies_) ids.push_back(kv.first);
    return ids;
}

std::optional<StrategyInfo> StrategyManager::info(const std::string& id) const {
    const PickStrategy* s = find(id);
    if (!s) return std::nullopt;
    StrategyInfo out;
    out.id = s->id();
    out.name = s->name();
    out.description = s->description();
    out.kind = s->kind();
    return out;
}

std::optional<Card> StrategyManager::select(const std::vector<Card>& candidates,
                                            const GameState& state) const {
    const PickStrategy* s = active();
    if (!s) {
        APLOG_WARN(log_, TAG, "no active strategy");
        return std::nullopt;
    }
    return s->select(candidates, state);
}

} // namespace autopick::ai
