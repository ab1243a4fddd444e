/// @file test_game_state.cpp
/// Tests for game-state classification and its precedence.

#include <kibitz/game_state.hpp>
#include <kibitz/init.hpp>
#include <kibitz/rules.hpp>

#include <gtest/gtest.h>

namespace kibitz {

class GameStateTest : public ::testing::Test {
   public:
    static void SetUpTestSuite() { init(); }

   protected:
    static GameState state(const char* fen) { return classify_state(Position::from_fen(fen)); }
};

TEST_F(GameStateTest, EachState) {
    EXPECT_EQ(classify_state(Position::initial()), GameState::Normal);
    EXPECT_EQ(state("4k3/8/8/8/1b6/8/8/4K2R w K - 0 1"), GameState::Check);
    EXPECT_EQ(state("r1bqkb1r/pppp1Qpp/2n2n2/4p3/2B1P3/8/PPPP1PPP/RNB1K1NR b KQkq - 0 4"),
              GameState::Checkmate);
    EXPECT_EQ(state("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1"), GameState::Stalemate);
    EXPECT_EQ(state("4k3/8/8/8/8/8/8/4KB2 w - - 0 1"), GameState::InsufficientMaterial);
    EXPECT_EQ(state("4k3/8/8/8/8/8/8/R3K3 b - - 100 70"), GameState::Draw);
}

TEST_F(GameStateTest, RepetitionIsDraw) {
    Position pos = Position::initial();
    for (const char* uci : {"b1c3", "b8c6", "c3b1", "c6b8", "b1c3", "b8c6", "c3b1", "c6b8"}) {
        pos = rules::apply(pos, Move::from_uci(uci));
    }
    EXPECT_EQ(classify_state(pos), GameState::Draw);
}

TEST_F(GameStateTest, CheckmateBeatsFiftyMoveRule) {
    EXPECT_EQ(state("r1bqkb1r/pppp1Qpp/2n2n2/4p3/2B1P3/8/PPPP1PPP/RNB1K1NR b KQkq - 100 60"),
              GameState::Checkmate);
}

TEST_F(GameStateTest, StalemateBeatsInsufficientMaterial) {
    // King and bishop against king, Black to move and stalemated.
    EXPECT_EQ(state("7k/5K2/6B1/8/8/8/8/8 b - - 0 1"), GameState::Stalemate);
}

TEST_F(GameStateTest, InsufficientMaterialBeatsCheck) {
    // A lone bishop gives check but can never mate.
    EXPECT_EQ(state("4k3/8/8/1B6/8/8/8/4K3 b - - 0 1"), GameState::InsufficientMaterial);
}

TEST_F(GameStateTest, TerminalStates) {
    EXPECT_TRUE(is_terminal(GameState::Checkmate));
    EXPECT_TRUE(is_terminal(GameState::Stalemate));
    EXPECT_TRUE(is_terminal(GameState::InsufficientMaterial));
    EXPECT_TRUE(is_terminal(GameState::Draw));
    EXPECT_FALSE(is_terminal(GameState::Check));
    EXPECT_FALSE(is_terminal(GameState::Normal));
}

TEST_F(GameStateTest, Names) {
    EXPECT_EQ(to_string(GameState::InsufficientMaterial), "INSUFFICIENT_MATERIAL");
    EXPECT_EQ(to_string(GameState::Checkmate), "CHECKMATE");
    EXPECT_EQ(to_string(GameState::Normal), "NORMAL");
}

}  // namespace kibitz
