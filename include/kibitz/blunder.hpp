#pragma once

/// @file blunder.hpp
/// Blunder detection for a single played move.

#include <kibitz/advisor.hpp>
#include <kibitz/blended.hpp>

#include <vector>

namespace kibitz {

inline constexpr double kDefaultBlunderThreshold = -2.0;

struct BlunderReport {
    Move move{};
    bool is_blunder = false;
    double eval_before = 0.0;  ///< Mover-relative score before the move.
    double eval_after = 0.0;   ///< Mover-relative score after the move.
    double threshold = kDefaultBlunderThreshold;
    /// Better moves, best first, the played move excluded. Filled only for
    /// blunders.
    std::vector<MoveCandidate> alternatives;

    [[nodiscard]] double delta() const noexcept { return eval_after - eval_before; }
};

namespace blunder {

/// Judge `move` played in `before` and leading to `after`.
///
/// A move is a blunder when eval_after - eval_before < threshold, unless no
/// legal move scores better than it: the best available move is never a
/// blunder. Throws IllegalMove when `move` is not legal in `before`, and
/// InvalidPosition when `after` is not the position it produces.
[[nodiscard]] BlunderReport check(const BlendedEvaluator& evaluator, const Position& before,
                                  Move move, const Position& after, double threshold,
                                  int max_alternatives);

/// Same, deriving the post-move position.
[[nodiscard]] BlunderReport check(const BlendedEvaluator& evaluator, const Position& before,
                                  Move move, double threshold, int max_alternatives);

/// Reports for every legal move of `pos` that would be a blunder, in
/// move-generation order. Empty when the game is over.
[[nodiscard]] std::vector<BlunderReport> scan(const BlendedEvaluator& evaluator,
                                              const Position& pos, double threshold,
                                              int max_alternatives);

}  // namespace blunder

}  // namespace kibitz
