#pragma once
// =============================================================================
// Pick strategies - choose one card from the recognized shop list
// =============================================================================
// select() never mutates the candidate list; only the controller marks the
// chosen card as selected. Configuration entry points live on the concrete
// variants, reached through kind() + static_cast (see StrategyManager::as).
// =============================================================================
#include "ai/card.hpp"
#include "ai/game_state.hpp"
#include "autopick_log.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace autopick::ai {

enum class StrategyKind {
    Priority,
    CostWeighted,
    TargetComposition
};

const char* strategyKindName(StrategyKind k);

class PickStrategy {
public:
    virtual ~PickStrategy() = default;

    virtual StrategyKind kind() const = 0;
    virtual std::string id() const = 0;
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;

    virtual std::optional<Card> select(const std::vector<Card>& candidates,
                                       const GameState& state) const = 0;
};

// =============================================================================
// Priority list: score = (len - rank) + cost * kCostBonus (when preferred)
// =============================================================================
class PriorityStrategy : public PickStrategy {
public:
    static constexpr int kCostBonus = 10;
    static constexpr StrategyKind kKind = StrategyKind::Priority;

    explicit PriorityStrategy(int max_cost = 5, bool prefer_higher_cost = true)
        : max_cost_(max_cost), prefer_higher_cost_(prefer_higher_cost) {}

    StrategyKind kind() const override { return kKind; }
    std::string id() const override { return "priority"; }
    std::string name() const override { return "Priority"; }
    std::string description() const override {
        return "Picks the highest-ranked card from the priority list";
    }

    std::optional<Card> select(const std::vector<Card>& candidates,
                               const GameState& state) const override;

    void setPriorityList(std::vector<std::string> list) { priority_list_ = std::move(list); }
    const std::vector<std::string>& priorityList() const { return priority_list_; }

    void setMaxCost(int c) { max_cost_ = c; }
    int maxCost() const { return max_cost_; }
    void setPreferHigherCost(bool b) { prefer_higher_cost_ = b; }
    bool preferHigherCost() const { return prefer_higher_cost_; }

private:
    std::vector<std::string> priority_list_;
    int max_cost_;
    bool prefer_higher_cost_;
};

// =============================================================================
// Cost weights: score = weight(cost) + confidence * 0.1
// =============================================================================
class CostWeightedStrategy : public PickStrategy {
public:
    static constexpr float kDefaultWeight = 1.0f;
    static constexpr float kConfidenceFactor = 0.1f;
    static constexpr StrategyKind kKind = StrategyKind::CostWeighted;

    StrategyKind kind() const override { return kKind; }
    std::string id() const override { return "cost_weighted"; }
    std::string name() const override { return "Cost weighted"; }
    std::string description() const override {
        return "Picks by per-cost weight, confidence breaks ties";
    }

    std::optional<Card> select(const std::vector<Card>& candidates,
                               const GameState& state) const override;

    // Missing tiers keep the default weight
    void setCostWeights(std::map<int, float> weights) { weights_ = std::move(weights); }
    const std::map<int, float>& costWeights() const { return weights_; }
    float weightFor(int cost) const;

private:
    std::map<int, float> weights_;
};

// =============================================================================
// Target composition: first candidate (slot order) in the target set
// =============================================================================
class TargetCompositionStrategy : public PickStrategy {
public:
    static constexpr StrategyKind kKind = StrategyKind::TargetComposition;

    StrategyKind kind() const override { return kKind; }
    std::string id() const override { return "target_comp"; }
    std::string name() const override { return "Target composition"; }
    std::string description() const override {
        return "Picks the first shop card belonging to the target composition";
    }

    std::optional<Card> select(const std::vector<Card>& candidates,
                               const GameState& state) const override;

    void setTargetComposition(std::set<std::string> names) { targets_ = std::move(names); }
    const std::set<std::string>& targetComposition() const { return targets_; }

private:
    std::set<std::string> targets_;
};

// =============================================================================
// StrategyManager - id -> strategy registry with one active entry
// =============================================================================
struct StrategyInfo {
    std::string id;
    std::string name;
    std::string description;
    StrategyKind kind = StrategyKind::Priority;
};

class StrategyManager {
public:
    // Registers priority / cost_weighted / target_comp; priority is active
    explicit StrategyManager(log::Sink& sink);

    // Replaces an existing id with a warning
    void registerStrategy(std::unique_ptr<PickStrategy> strategy);

    bool setActive(const std::string& id);
    const std::string& activeId() const { return active_id_; }
    PickStrategy* active() const;

    PickStrategy* find(const std::string& id) const;
    std::vector<std::string> availableIds() const;
    std::optional<StrategyInfo> info(const std::string& id) const;

    // Variant-checked downcast; nullptr when the id is missing or of another kind
    template<typename T>
    T* as(const std::string& id) const {
        PickStrategy* s = find(id);
        if (!s || s->kind() != T::kKind) return nullptr;
        return static_cast<T*>(s);
    }

    // First registered strategy of the given variant
    template<typename T>
    T* firstOf() const {
        for (const auto& kv : strategies_) {
            if (kv.second->kind() == T::kKind) return static_cast<T*>(kv.second.get());
        }
        return nullptr;
    }

    std::optional<Card> select(const std::vector<Card>& candidates,
                               const GameState& state) const;

private:
    log::Sink& log_;
    std::map<std::string, std::unique_ptr<PickStrategy>> strategies_;
    std::string active_id_;
};

} // namespace autopick::ai
