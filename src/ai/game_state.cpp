#include "ai/game_state.hpp"

namespace autopick::ai {

const char* gamePhaseName(GamePhase p) {
    switch (p) {
        case GamePhase::Unknown:  return "UNKNOWN";
        case GamePhase::Lobby:    return "LOBBY";
        case GamePhase::Shopping: return "SHOPPING";
        case GamePhase::Picking:  return "PICKING";
        case GamePhase::Battling: return "BATTLING";
        case GamePhase::GameOver: return "GAME_OVER";
        case GamePhase::Paused:   return "PAUSED";
    }
    return "UNKNOWN";
}

bool GameState::updatePhase(GamePhase new_phase,
                            std::chrono::steady_clock::time_point now) {
    if (phase == new_phase) return false;
    phase = new_phase;
    last_phase_change = now;
    return true;
}

bool GameState::setShopPhase() {
    is_active = true;
    return updatePhase(GamePhase::Shopping);
}

bool GameState::setLobbyPhase() {
    is_active = false;
    return updatePhase(GamePhase::Lobby);
}

bool GameState::setBattlePhase() {
    is_active = false;
    return updatePhase(GamePhase::Battling);
}

} // namespace autopick::ai
