/// @file game_state.cpp
/// Game-state classification.

#include <kibitz/game_state.hpp>

#include <kibitz/rules.hpp>

namespace kibitz {

GameState classify_state(const Position& pos) {
    const bool in_check = rules::is_check(pos);
    const bool no_moves = rules::legal_moves(pos).empty();

    if (no_moves)
        return in_check ? GameState::Checkmate : GameState::Stalemate;
    if (rules::has_insufficient_material(pos))
        return GameState::InsufficientMaterial;
    if (rules::is_fifty_move_draw(pos) || rules::is_repetition_draw(pos))
        return GameState::Draw;
    return in_check ? GameState::Check : GameState::Normal;
}

std::string_view to_string(GameState s) noexcept {
    switch (s) {
        case GameState::Normal:
            return "NORMAL";
        case GameState::Check:
            return "CHECK";
        case GameState::Checkmate:
            return "CHECKMATE";
        case GameState::Stalemate:
            return "STALEMATE";
        case GameState::InsufficientMaterial:
            return "INSUFFICIENT_MATERIAL";
        case GameState::Draw:
            return "DRAW";
    }
    return "UNKNOWN";
}

}  // namespace kibitz
