#pragma once

/// @file rules.hpp
/// Chess rules as the evaluators consume them: legal moves, successor
/// positions, terminal-state tests and notation.
///
/// Everything here is a pure function of its arguments.

#include <kibitz/movegen.hpp>
#include <kibitz/position.hpp>

#include <string>
#include <string_view>

namespace kibitz::rules {

/// Plies without a pawn move or capture after which the game is drawn.
inline constexpr int kFiftyMoveHalfmoves = 100;

[[nodiscard]] inline MoveList legal_moves(const Position& pos) {
    return movegen::legal(pos);
}

/// Successor after `m`, which may come from parsed text (flag unknown).
/// Throws IllegalMove when no legal move of `pos` has the same squares.
[[nodiscard]] Position apply(const Position& pos, Move m);

/// The legal move of `pos` matching `m` on from/to/promotion. Throws IllegalMove.
[[nodiscard]] Move resolve(const Position& pos, Move m);

[[nodiscard]] bool is_check(const Position& pos);
[[nodiscard]] bool is_checkmate(const Position& pos);
[[nodiscard]] bool is_stalemate(const Position& pos);

/// Neither side can ever deliver mate: bare kings, a single minor piece, or
/// bishops only, all on squares of one color.
[[nodiscard]] bool has_insufficient_material(const Position& pos);

[[nodiscard]] bool is_fifty_move_draw(const Position& pos);
[[nodiscard]] bool is_repetition_draw(const Position& pos);

/// FEN, the board interchange format.
[[nodiscard]] std::string to_portable_notation(const Position& pos);

/// UCI long algebraic, e.g. "e7e8q".
[[nodiscard]] std::string move_to_notation(Move m);

/// Standard algebraic notation with disambiguation and check/mate suffix.
/// `m` must be legal in `pos`.
[[nodiscard]] std::string move_to_san(const Position& pos, Move m);

/// Parse UCI ("g1f3") or SAN ("Nf3", "O-O", "exd5", "e8=Q+") into the legal
/// move it names. Throws IllegalMove.
[[nodiscard]] Move parse_move(const Position& pos, std::string_view text);

}  // namespace kibitz::rules
