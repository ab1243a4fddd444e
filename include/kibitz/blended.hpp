#pragma once

/// @file blended.hpp
/// Weighted blend of the learned and heuristic evaluators.

#include <kibitz/evaluation.hpp>
#include <kibitz/learned.hpp>
#include <kibitz/position.hpp>

namespace kibitz {

struct BlendWeights {
    double ml = 0.70;
    double heuristic = 0.30;
};

/// score = ml * learned + heuristic * heuristic_score when the model gives a
/// prediction (source Blended), otherwise the heuristic score alone (source
/// Heuristic). Terminal positions are scored from the rules and never
/// reach the model.
class BlendedEvaluator {
   public:
    BlendedEvaluator() = default;
    explicit BlendedEvaluator(LearnedEvaluator learned, BlendWeights weights = {});

    [[nodiscard]] EvaluationResult evaluate(const Position& pos) const;

    /// Same as evaluate, with the game state already known.
    [[nodiscard]] EvaluationResult evaluate(const Position& pos, GameState state) const;

    [[nodiscard]] bool model_available() const noexcept { return learned_.available(); }
    [[nodiscard]] const LearnedEvaluator& learned() const noexcept { return learned_; }
    [[nodiscard]] const BlendWeights& weights() const noexcept { return weights_; }

   private:
    LearnedEvaluator learned_;
    BlendWeights weights_;
};

}  // namespace kibitz
