/// @file evaluation.cpp
/// Classification bands and terminal scores.

#include <kibitz/evaluation.hpp>

#include <cmath>

namespace kibitz {

namespace {

constexpr double kSlightAdvantageBand = 1.0;
constexpr double kAdvantageBand = 2.0;
constexpr double kWinningBand = 3.0;

}  // namespace

Classification classify(double score) noexcept {
    const double magnitude = std::fabs(score);
    if (magnitude < kSlightAdvantageBand)
        return Classification::Equal;
    if (magnitude < kAdvantageBand)
        return Classification::SlightAdvantage;
    if (magnitude <= kWinningBand)
        return Classification::Advantage;
    return Classification::Winning;
}

std::optional<EvaluationResult> terminal_result(GameState state, Color side_to_move) noexcept {
    switch (state) {
        case GameState::Checkmate:
            // The side to move is the one mated.
            return EvaluationResult{side_to_move == Color::White ? -kMateScore : kMateScore,
                                    Classification::Mate, Source::Heuristic};
        case GameState::Stalemate:
        case GameState::InsufficientMaterial:
        case GameState::Draw:
            return EvaluationResult{0.0, Classification::Equal, Source::Heuristic};
        case GameState::Normal:
        case GameState::Check:
            break;
    }
    return std::nullopt;
}

std::string_view to_string(Classification c) noexcept {
    switch (c) {
        case Classification::Equal:
            return "EQUAL";
        case Classification::SlightAdvantage:
            return "SLIGHT_ADVANTAGE";
        case Classification::Advantage:
            return "ADVANTAGE";
        case Classification::Winning:
            return "WINNING";
        case Classification::Mate:
            return "MATE";
    }
    return "UNKNOWN";
}

std::string_view to_string(Source s) noexcept {
    switch (s) {
        case Source::Heuristic:
            return "HEURISTIC";
        case Source::Blended:
            return "BLENDED";
    }
    return "UNKNOWN";
}

}  // namespace kibitz
