#pragma once
// =============================================================================
// GameState - phase + currently recognized cards
// =============================================================================
// Recreated once per session. The card list is replaced wholesale on every
// recognition pass; nothing is tracked across frames.
// =============================================================================
#include "ai/card.hpp"

#include <chrono>
#include <optional>
#include <vector>

namespace autopick::ai {

enum class GamePhase {
    Unknown,
    Lobby,
    Shopping,
    Picking,
    Battling,
    GameOver,
    Paused
};

const char* gamePhaseName(GamePhase p);

struct GameState {
    GamePhase phase = GamePhase::Unknown;
    std::vector<Card> cards;
    bool is_active = false;
    std::optional<std::chrono::steady_clock::time_point> last_phase_change;

    // Returns true when the phase actually changed
    bool updatePhase(GamePhase new_phase,
                     std::chrono::steady_clock::time_point now =
                         std::chrono::steady_clock::now());

    bool setShopPhase();    // Shopping, active
    bool setLobbyPhase();   // Lobby, inactive
    bool setBattlePhase();  // Battling, inactive

    void replaceCards(std::vector<Card> recognized) { cards = std::move(recognized); }

    void reset() { *this = GameState{}; }
};

} // namespace autopick::ai
