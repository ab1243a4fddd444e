/// @file blended.cpp
/// Blended evaluation with heuristic fallback.

#include <kibitz/blended.hpp>

#include <kibitz/heuristic.hpp>

#include <utility>

namespace kibitz {

BlendedEvaluator::BlendedEvaluator(LearnedEvaluator learned, BlendWeights weights)
    : learned_(std::move(learned)), weights_(weights) {}

EvaluationResult BlendedEvaluator::evaluate(const Position& pos) const {
    return evaluate(pos, classify_state(pos));
}

EvaluationResult BlendedEvaluator::evaluate(const Position& pos, GameState state) const {
    if (auto terminal = terminal_result(state, pos.side_to_move()))
        return *terminal;

    const double h = heuristic::score(pos);
    if (const auto ml = learned_.evaluate(pos)) {
        const double s = weights_.ml * *ml + weights_.heuristic * h;
        return {s, classify(s), Source::Blended};
    }
    return {h, classify(h), Source::Heuristic};
}

}  // namespace kibitz
