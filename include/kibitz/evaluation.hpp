#pragma once

/// @file evaluation.hpp
/// Evaluation result shared by all evaluators.
///
/// Scores are in pawns from White's point of view: positive favors White,
/// negative favors Black, whoever is to move.

#include <kibitz/game_state.hpp>
#include <kibitz/types.hpp>

#include <optional>
#include <string_view>

namespace kibitz {

/// Magnitude of a checkmated position's score.
inline constexpr double kMateScore = 10'000.0;

enum class Classification : std::uint8_t {
    Equal,
    SlightAdvantage,
    Advantage,
    Winning,
    Mate,
};

/// Which evaluators produced a score.
enum class Source : std::uint8_t {
    Heuristic,
    Blended,
};

struct EvaluationResult {
    double score = 0.0;
    Classification classification = Classification::Equal;
    Source source = Source::Heuristic;

    /// The side the score favors; empty for Equal.
    [[nodiscard]] std::optional<Color> favors() const noexcept {
        if (classification == Classification::Equal || score == 0.0)
            return std::nullopt;
        return score > 0.0 ? Color::White : Color::Black;
    }

    [[nodiscard]] bool operator==(const EvaluationResult&) const noexcept = default;
};

/// Band for the score of a position that is not checkmate. Mate is never
/// inferred from magnitude.
[[nodiscard]] Classification classify(double score) noexcept;

/// Score and classification fixed by a terminal state: mate for checkmate,
/// zero for draws. Empty for states where play continues.
[[nodiscard]] std::optional<EvaluationResult> terminal_result(GameState state,
                                                              Color side_to_move) noexcept;

/// Convert a White-relative score to `side`'s point of view.
[[nodiscard]] constexpr double relative_to(Color side, double white_score) noexcept {
    return side == Color::White ? white_score : -white_score;
}

[[nodiscard]] std::string_view to_string(Classification c) noexcept;
[[nodiscard]] std::string_view to_string(Source s) noexcept;

}  // namespace kibitz
