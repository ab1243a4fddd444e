/// @file blunder.cpp
/// Blunder detection.

#include <kibitz/blunder.hpp>

#include <kibitz/errors.hpp>
#include <kibitz/rules.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace kibitz::blunder {

namespace {

void require_positive(int max_alternatives) {
    if (max_alternatives <= 0) {
        throw std::invalid_argument("blunder check: max_alternatives must be positive, got " +
                                    std::to_string(max_alternatives));
    }
}

/// Apply the best-move exemption and collect alternatives. `ranked` is the
/// full ranking of the pre-move position.
void judge(BlunderReport& report, const std::vector<MoveCandidate>& ranked,
           int max_alternatives) {
    report.is_blunder = report.delta() < report.threshold;
    if (!report.is_blunder)
        return;

    if (ranked.empty() || ranked.front().move == report.move ||
        report.eval_after >= ranked.front().resulting_score) {
        report.is_blunder = false;
        return;
    }
    for (const MoveCandidate& c : ranked) {
        if (static_cast<int>(report.alternatives.size()) >= max_alternatives)
            break;
        if (c.move == report.move || c.resulting_score <= report.eval_after)
            continue;
        report.alternatives.push_back(c);
    }
}

}  // namespace

BlunderReport check(const BlendedEvaluator& evaluator, const Position& before, Move move,
                    const Position& after, double threshold, int max_alternatives) {
    require_positive(max_alternatives);
    const Move played = rules::resolve(before, move);
    const Position successor = before.apply(played);
    if (!successor.same_state(after)) {
        throw InvalidPosition("position after " + played.uci() + " does not follow from " +
                              before.to_fen() + ": got " + after.to_fen());
    }

    const Color mover = before.side_to_move();
    BlunderReport report;
    report.move = played;
    report.threshold = threshold;
    report.eval_before = relative_to(mover, evaluator.evaluate(before).score);
    // The derived successor carries the game history; `after` may not.
    report.eval_after = relative_to(mover, evaluator.evaluate(successor).score);

    if (report.delta() < threshold) {
        judge(report, advisor::rank(evaluator, before), max_alternatives);
    }
    return report;
}

BlunderReport check(const BlendedEvaluator& evaluator, const Position& before, Move move,
                    double threshold, int max_alternatives) {
    const Move played = rules::resolve(before, move);
    return check(evaluator, before, played, before.apply(played), threshold, max_alternatives);
}

std::vector<BlunderReport> scan(const BlendedEvaluator& evaluator, const Position& pos,
                                double threshold, int max_alternatives) {
    require_positive(max_alternatives);
    const std::vector<MoveCandidate> ranked = advisor::rank(evaluator, pos);
    if (ranked.empty())
        return {};

    const double before = relative_to(pos.side_to_move(), evaluator.evaluate(pos).score);
    std::vector<BlunderReport> blunders;
    for (const Move& m : rules::legal_moves(pos)) {
        const auto it = std::find_if(ranked.begin(), ranked.end(),
                                     [&](const MoveCandidate& c) { return c.move == m; });
        BlunderReport report;
        report.move = m;
        report.threshold = threshold;
        report.eval_before = before;
        report.eval_after = it->resulting_score;
        judge(report, ranked, max_alternatives);
        if (report.is_blunder)
            blunders.push_back(std::move(report));
    }
    return blunders;
}

}  // namespace kibitz::blunder
