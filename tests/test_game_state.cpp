// =============================================================================
// Unit tests for GameState (src/ai/game_state.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "ai/game_state.hpp"

using namespace autopick::ai;
using namespace std::chrono;

TEST(GameStateTest, Defaults) {
    GameState s;
    EXPECT_EQ(s.phase, GamePhase::Unknown);
    EXPECT_TRUE(s.cards.empty());
    EXPECT_FALSE(s.is_active);
    EXPECT_FALSE(s.last_phase_change.has_value());
}

// ---------------------------------------------------------------------------
// updatePhase reports change and stamps the time only on change
// ---------------------------------------------------------------------------
TEST(GameStateTest, UpdatePhaseStampsTime) {
    GameState s;
    auto t0 = steady_clock::time_point(seconds(10));
    EXPECT_TRUE(s.updatePhase(GamePhase::Shopping, t0));
    ASSERT_TRUE(s.last_phase_change.has_value());
    EXPECT_EQ(*s.last_phase_change, t0);

    auto t1 = t0 + seconds(1);
    EXPECT_FALSE(s.updatePhase(GamePhase::Shopping, t1));
    EXPECT_EQ(*s.last_phase_change, t0);
}

TEST(GameStateTest, PhaseHelpersSetActiveFlag) {
    GameState s;
    EXPECT_TRUE(s.setShopPhase());
    EXPECT_TRUE(s.is_active);
    EXPECT_EQ(s.phase, GamePhase::Shopping);

    EXPECT_TRUE(s.setBattlePhase());
    EXPECT_FALSE(s.is_active);
    EXPECT_EQ(s.phase, GamePhase::Battling);

    EXPECT_TRUE(s.setLobbyPhase());
    EXPECT_FALSE(s.setLobbyPhase());
    EXPECT_STREQ(gamePhaseName(s.phase), "LOBBY");
}

// ---------------------------------------------------------------------------
// Card list replacement is wholesale: old cards and flags vanish
// ---------------------------------------------------------------------------
TEST(GameStateTest, ReplaceCardsIsWholesale) {
    GameState s;
    Card a("A", 1);
    a.select();
    s.replaceCards({a, Card("B", 2)});
    ASSERT_EQ(s.cards.size(), 2u);
    EXPECT_TRUE(s.cards[0].selected);

    s.replaceCards({Card("A", 1)});
    ASSERT_EQ(s.cards.size(), 1u);
    EXPECT_FALSE(s.cards[0].selected);

    s.reset();
    EXPECT_TRUE(s.cards.empty());
    EXPECT_EQ(s.phase, GamePhase::Unknown);
}
