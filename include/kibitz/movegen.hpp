#pragma once

/// @file movegen.hpp
/// Legal move generation.
///
/// The enumeration order is fixed (pawns, knights, bishops, rooks, queens,
/// king, castling; squares ascending within each group), so callers can use
/// it as a stable tie-break.

#include <kibitz/position.hpp>

#include <cstdint>

namespace kibitz::movegen {

/// Moves that obey piece movement but may leave the mover's king in check.
[[nodiscard]] MoveList pseudo_legal(const Position& pos);

/// Strictly legal moves for the side to move.
[[nodiscard]] MoveList legal(const Position& pos);

/// Pseudo-legal move count for `side`, as if it were that side's turn.
/// Castling and en passant are left out. Used as a mobility measure.
[[nodiscard]] int mobility(const Position& pos, Color side);

/// Leaf count at `depth` plies, for validating the generator.
[[nodiscard]] std::uint64_t perft(const Position& pos, int depth);

}  // namespace kibitz::movegen
