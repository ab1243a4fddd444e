#pragma once

/// @file game_state.hpp
/// Reportable game status derived from the rules.

#include <kibitz/position.hpp>

#include <string_view>

namespace kibitz {

enum class GameState : std::uint8_t {
    Normal,
    Check,
    Checkmate,
    Stalemate,
    InsufficientMaterial,
    Draw,  ///< Fifty-move rule or threefold repetition.
};

/// Checked in precedence order: checkmate, stalemate, insufficient material,
/// draw, check, normal.
[[nodiscard]] GameState classify_state(const Position& pos);

/// True for every state in which the game is over.
[[nodiscard]] constexpr bool is_terminal(GameState s) noexcept {
    return s == GameState::Checkmate || s == GameState::Stalemate ||
           s == GameState::InsufficientMaterial || s == GameState::Draw;
}

[[nodiscard]] std::string_view to_string(GameState s) noexcept;

}  // namespace kibitz
