#pragma once

/// @file advisor.hpp
/// One-ply move ranking.

#include <kibitz/blended.hpp>
#include <kibitz/move.hpp>
#include <kibitz/position.hpp>

#include <string>
#include <vector>

namespace kibitz {

struct MoveCandidate {
    Move move{};
    std::string uci;
    std::string san;
    double resulting_score = 0.0;     ///< Successor's score from the mover's side.
    double delta_from_current = 0.0;  ///< resulting_score minus the current mover-relative score.
    Source source = Source::Heuristic;
};

namespace advisor {

/// Every legal move scored and sorted best-first for the side to move.
/// Equal scores keep move-generation order. Empty when the game is over.
[[nodiscard]] std::vector<MoveCandidate> rank(const BlendedEvaluator& evaluator,
                                              const Position& pos);

/// The first `k` entries of `rank`. Throws std::invalid_argument for k <= 0.
[[nodiscard]] std::vector<MoveCandidate> suggest(const BlendedEvaluator& evaluator,
                                                 const Position& pos, int k);

}  // namespace advisor

}  // namespace kibitz
