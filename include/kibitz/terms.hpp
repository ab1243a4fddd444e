#pragma once

/// @file terms.hpp
/// Per-side positional measurements shared by the heuristic evaluator and
/// the feature extractor. All values are raw counts or pawn units for one
/// side; combining them into a score is the caller's business.

#include <kibitz/position.hpp>

namespace kibitz::terms {

// ── Weights (pawn units) ────────────────────────────────────────────────────

inline constexpr double kPieceValue[kNumPieceTypes] = {1.00, 3.20, 3.30, 5.00, 9.00, 0.0};

inline constexpr double kMobilityWeight = 0.05;
inline constexpr double kShieldPawnBonus = 0.15;
inline constexpr double kKingZoneAttackPenalty = 0.10;
inline constexpr double kDoubledPawnPenalty = 0.20;
inline constexpr double kIsolatedPawnPenalty = 0.15;
inline constexpr double kPassedPawnBonus = 0.20;
inline constexpr double kPassedPawnRankBonus = 0.05;
inline constexpr double kProtectedPawnBonus = 0.05;

/// At most this many pieces on the board (kings included) is an endgame.
inline constexpr int kEndgamePieceCount = 12;

// ── Material ────────────────────────────────────────────────────────────────

/// Material of `c` in pawns, king excluded.
[[nodiscard]] double material(const Board& board, Color c) noexcept;

[[nodiscard]] bool is_endgame(const Board& board) noexcept;

/// Pieces on the board over 32: 1.0 at the start, falling towards 0.
[[nodiscard]] double game_phase(const Board& board) noexcept;

// ── Pawn structure ──────────────────────────────────────────────────────────

struct PawnStructure {
    int doubled = 0;         ///< Extra pawns on files holding more than one.
    int isolated = 0;        ///< Pawns with no friendly pawn on an adjacent file.
    int passed = 0;          ///< Pawns with no enemy pawn ahead on this or adjacent files.
    int passed_advance = 0;  ///< Ranks advanced from the start, summed over passed pawns.
    int protected_ = 0;      ///< Pawns defended by a friendly pawn.
};

[[nodiscard]] PawnStructure pawn_structure(const Board& board, Color c) noexcept;

/// Weighted pawn-structure score for one side.
[[nodiscard]] double pawn_score(const PawnStructure& ps) noexcept;

// ── King ────────────────────────────────────────────────────────────────────

/// Friendly pawns on the three files around the king, one or two ranks ahead.
[[nodiscard]] int king_shield(const Board& board, Color c) noexcept;

/// Squares of the king and its neighbourhood attacked by the opponent.
[[nodiscard]] int king_zone_attacks(const Position& pos, Color c) noexcept;

/// Shield bonus minus attack penalty for `c`'s king. 0 without a king.
[[nodiscard]] double king_safety(const Position& pos, Color c) noexcept;

/// Manhattan distance of the king from the board centre: 1.0 on d4, 7.0 in a corner.
[[nodiscard]] double king_center_distance(const Board& board, Color c) noexcept;

}  // namespace kibitz::terms
