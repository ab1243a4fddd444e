#pragma once

/// @file heuristic.hpp
/// Hand-tuned static evaluation: material, piece-square tables, mobility,
/// king safety and pawn structure. All weights are fixed constants.

#include <kibitz/evaluation.hpp>
#include <kibitz/position.hpp>

namespace kibitz::heuristic {

/// Per-term contributions, White minus Black, in pawns.
struct Breakdown {
    double material = 0.0;
    double piece_square = 0.0;
    double mobility = 0.0;
    double king_safety = 0.0;
    double pawn_structure = 0.0;

    [[nodiscard]] double total() const noexcept {
        return material + piece_square + mobility + king_safety + pawn_structure;
    }
};

[[nodiscard]] Breakdown breakdown(const Position& pos);

/// Positional score, ignoring whether the game is over. Works for any valid
/// position, bare kings included.
[[nodiscard]] double score(const Position& pos);

/// Full evaluation: terminal states are scored from the rules, everything
/// else by `score`. Source is always Heuristic.
[[nodiscard]] EvaluationResult evaluate(const Position& pos);

}  // namespace kibitz::heuristic
