/// @file advisor.cpp
/// Move ranking.

#include <kibitz/advisor.hpp>

#include <kibitz/game_state.hpp>
#include <kibitz/rules.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace kibitz::advisor {

std::vector<MoveCandidate> rank(const BlendedEvaluator& evaluator, const Position& pos) {
    const GameState state = classify_state(pos);
    if (is_terminal(state))
        return {};

    const Color mover = pos.side_to_move();
    const double current = relative_to(mover, evaluator.evaluate(pos, state).score);
    const MoveList moves = rules::legal_moves(pos);

    std::vector<MoveCandidate> ranked;
    ranked.reserve(static_cast<std::size_t>(moves.size()));
    for (const Move& m : moves) {
        const EvaluationResult child = evaluator.evaluate(pos.apply(m));
        MoveCandidate c;
        c.move = m;
        c.uci = rules::move_to_notation(m);
        c.san = rules::move_to_san(pos, m);
        c.resulting_score = relative_to(mover, child.score);
        c.delta_from_current = c.resulting_score - current;
        c.source = child.source;
        ranked.push_back(std::move(c));
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const MoveCandidate& a, const MoveCandidate& b) {
                         return a.resulting_score > b.resulting_score;
                     });
    return ranked;
}

std::vector<MoveCandidate> suggest(const BlendedEvaluator& evaluator, const Position& pos, int k) {
    if (k <= 0) {
        throw std::invalid_argument("suggest: k must be positive, got " + std::to_string(k));
    }
    std::vector<MoveCandidate> ranked = rank(evaluator, pos);
    if (ranked.size() > static_cast<std::size_t>(k))
        ranked.resize(static_cast<std::size_t>(k));
    return ranked;
}

}  // namespace kibitz::advisor
