#pragma once

/// @file features.hpp
/// Fixed-length numeric summary of a position, the learned model's input.
///
/// The schema is versioned: a model names the schema it was trained on and
/// lists the features in order, and the loader rejects any disagreement.

#include <kibitz/position.hpp>

#include <array>
#include <string_view>

namespace kibitz::features {

inline constexpr std::string_view kSchemaName = "kibitz.features.v1";

enum Index : int {
    MaterialBalance,
    MaterialWhite,
    MaterialBlack,
    MobilityWhite,
    MobilityBlack,
    KingSafetyWhite,
    KingSafetyBlack,
    KingCenterDistanceWhite,
    KingCenterDistanceBlack,
    DoubledPawns,
    IsolatedPawns,
    PassedPawns,
    PawnStructureScore,
    SideToMove,
    CheckStatus,
    GamePhase,
    kNumFeatures,
};

inline constexpr std::array<std::string_view, kNumFeatures> kNames = {
    "material_balance",
    "material_white",
    "material_black",
    "mobility_white",
    "mobility_black",
    "king_safety_white",
    "king_safety_black",
    "king_center_distance_white",
    "king_center_distance_black",
    "doubled_pawns",
    "isolated_pawns",
    "passed_pawns",
    "pawn_structure_score",
    "side_to_move",
    "check_status",
    "game_phase",
};

using FeatureVector = std::array<double, kNumFeatures>;

/// Signed features are White minus Black. side_to_move is +1 for White and
/// -1 for Black; check_status is 1 when the side to move is in check.
[[nodiscard]] FeatureVector extract(const Position& pos);

}  // namespace kibitz::features
