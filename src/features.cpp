/// @file features.cpp
/// Feature extraction for kibitz.features.v1.

#include <kibitz/features.hpp>

#include <kibitz/movegen.hpp>
#include <kibitz/terms.hpp>

namespace kibitz::features {

FeatureVector extract(const Position& pos) {
    const Board& board = pos.board();
    const terms::PawnStructure wp = terms::pawn_structure(board, Color::White);
    const terms::PawnStructure bp = terms::pawn_structure(board, Color::Black);

    FeatureVector f{};
    f[MaterialWhite] = terms::material(board, Color::White);
    f[MaterialBlack] = terms::material(board, Color::Black);
    f[MaterialBalance] = f[MaterialWhite] - f[MaterialBlack];

    f[MobilityWhite] = movegen::mobility(pos, Color::White);
    f[MobilityBlack] = movegen::mobility(pos, Color::Black);

    f[KingSafetyWhite] = terms::king_safety(pos, Color::White);
    f[KingSafetyBlack] = terms::king_safety(pos, Color::Black);
    f[KingCenterDistanceWhite] = terms::king_center_distance(board, Color::White);
    f[KingCenterDistanceBlack] = terms::king_center_distance(board, Color::Black);

    f[DoubledPawns] = wp.doubled - bp.doubled;
    f[IsolatedPawns] = wp.isolated - bp.isolated;
    f[PassedPawns] = wp.passed - bp.passed;
    f[PawnStructureScore] = terms::pawn_score(wp) - terms::pawn_score(bp);

    f[SideToMove] = color_sign(pos.side_to_move());
    f[CheckStatus] = pos.is_in_check() ? 1.0 : 0.0;
    f[GamePhase] = terms::game_phase(board);
    return f;
}

}  // namespace kibitz::features
