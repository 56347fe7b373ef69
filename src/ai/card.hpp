#pragma once
// =============================================================================
// Card - one recognized shop card
// =============================================================================
// Identity is the card name alone: two Cards with the same name compare equal
// and hash identically whatever their cost / confidence / slot. Priority and
// target-composition membership tests rely on this.
// =============================================================================
#include <cstddef>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace autopick::ai {

enum class CardRarity {
    OneCost,
    TwoCost,
    ThreeCost,
    FourCost,
    FiveCost,
    Spatula,
    Unknown
};

// 1..5 -> matching tier, anything else -> Unknown
CardRarity rarityFromCost(int cost);

// Tier -> cost (Spatula = 0, Unknown = 0)
int rarityCost(CardRarity r);

// Display label ("1-cost" .. "5-cost", "spatula", "unknown")
const char* rarityLabel(CardRarity r);

struct Card {
    std::string name;
    int cost = 1;
    CardRarity rarity = CardRarity::OneCost;
    std::set<std::string> classes;
    float confidence = 0.0f;
    int x = 0, y = 0;                    // screen position (slot center)
    std::optional<int> shop_index;       // shop slot, unset for manual cards
    bool selected = false;

    Card() = default;
    explicit Card(std::string card_name, int card_cost = 1, float conf = 0.0f);

    // Recomputes rarity from cost
    void setCost(int c);
    void setPosition(int px, int py) { x = px; y = py; }
    bool hasPosition() const { return x != 0 || y != 0; }

    void select() { selected = true; }
    void deselect() { selected = false; }

    bool matchesPriority(const std::vector<std::string>& priorities) const;

    // "[3-cost] name"
    std::string fullName() const;
    // "[3-cost] name (Class/Class)"
    std::string toString() const;

    bool operator==(const Card& other) const { return name == other.name; }
    bool operator!=(const Card& other) const { return !(*this == other); }
};

struct CardHash {
    size_t operator()(const Card& c) const { return std::hash<std::string>{}(c.name); }
};

// Cost ordering (the card identity stays name-based)
inline bool lessByCost(const Card& a, const Card& b) { return a.cost < b.cost; }

} // namespace autopick::ai

namespace std {
template<>
struct hash<autopick::ai::Card> {
    size_t operator()(const autopick::ai::Card& c) const {
        return autopick::ai::CardHash{}(c);
    }
};
} // namespace std
