// =============================================================================
// Card - rarity table and formatting
// =============================================================================
#include "ai/card.hpp"

#include <algorithm>

namespace autopick::ai {

CardRarity rarityFromCost(int cost) {
    switch (cost) {
        case 1: return CardRarity::OneCost;
        case 2: return CardRarity::TwoCost;
        case 3: return CardRarity::ThreeCost;
        case 4: return CardRarity::FourCost;
        case 5: return CardRarity::FiveCost;
        default: return CardRarity::Unknown;
    }
}

int rarityCost(CardRarity r) {
    switch (r) {
        case CardRarity::OneCost:   return 1;
        case CardRarity::TwoCost:   return 2;
        case CardRarity::ThreeCost: return 3;
        case CardRarity::FourCost:  return 4;
        case CardRarity::FiveCost:  return 5;
        case CardRarity::Spatula:
        case CardRarity::Unknown:   return 0;
    }
    return 0;
}

const char* rarityLabel(CardRarity r) {
    switch (r) {
        case CardRarity::OneCost:   return "1-cost";
        case CardRarity::TwoCost:   return "2-cost";
        case CardRarity::ThreeCost: return "3-cost";
        case CardRarity::FourCost:  return "4-cost";
        case CardRarity::FiveCost:  return "5-cost";
        case CardRarity::Spatula:   return "spatula";
        case CardRarity::Unknown:   return "unknown";
    }
    return "unknown";
}

Card::Card(std::string card_name, int card_cost, float conf)
    : name(std::move(card_name)), cost(card_cost),
      rarity(rarityFromCost(card_cost)), confidence(conf) {}

void Card::setCost(int c) {
    cost = c;
    rarity = rarityFromCost(c);
}

bool Card::matchesPriority(const std::vector<std::string>& priorities) const {
    return std::find(priorities.begin(), priorities.end(), name) != priorities.end();
}

std::string Card::fullName() const {
    return std::string("[") + rarityLabel(rarity) + "] " + name;
}

std::string Card::toString() const {
    std::string out = fullName();
    if (classes.empty()) return out;
    out += " (";
    bool first = true;
    for (const auto& c : classes) {
        if (!first) out += "/";
        out += c;
        first = false;
    }
    out += ")";
    return out;
}

} // namespace autopick::ai
