/// @file terms.cpp
/// Material, pawn-structure and king measurements.

#include <kibitz/terms.hpp>

#include <kibitz/attacks.hpp>

#include <cmath>

namespace kibitz::terms {

double material(const Board& board, Color c) noexcept {
    double total = 0.0;
    for (int i = 0; i < kNumPieceTypes; ++i) {
        total += kPieceValue[i] * board.count(c, static_cast<PieceType>(i + 1));
    }
    return total;
}

bool is_endgame(const Board& board) noexcept {
    return popcount(board.occupied_all()) <= kEndgamePieceCount;
}

double game_phase(const Board& board) noexcept {
    return popcount(board.occupied_all()) / 32.0;
}

PawnStructure pawn_structure(const Board& board, Color c) noexcept {
    const Bitboard own = board.pieces(c, PieceType::Pawn);
    const Bitboard enemy = board.pieces(opposite(c), PieceType::Pawn);
    PawnStructure ps;

    for (int f = 0; f < 8; ++f) {
        const int on_file = popcount(own & file_bb(f));
        if (on_file == 0)
            continue;
        if (on_file > 1)
            ps.doubled += on_file - 1;
        if ((own & adjacent_files_bb(f)) == 0)
            ps.isolated += on_file;
    }

    // Squares attacked by own pawns hold the protected ones.
    const Bitboard forward = shift_forward(c, own);
    const Bitboard defended = shift_east(forward) | shift_west(forward);
    ps.protected_ = popcount(own & defended);

    Bitboard pawns = own;
    while (pawns) {
        const Square sq = pop_lsb(pawns);
        if (passed_span_bb(c, sq) & enemy)
            continue;
        ++ps.passed;
        ps.passed_advance += relative_rank(c, sq) - 1;
    }
    return ps;
}

double pawn_score(const PawnStructure& ps) noexcept {
    return -kDoubledPawnPenalty * ps.doubled - kIsolatedPawnPenalty * ps.isolated +
           kPassedPawnBonus * ps.passed + kPassedPawnRankBonus * ps.passed_advance +
           kProtectedPawnBonus * ps.protected_;
}

int king_shield(const Board& board, Color c) noexcept {
    const Square ksq = board.king_square(c);
    if (ksq == kNoSquare)
        return 0;

    const Bitboard files = file_bb(file_of(ksq)) | adjacent_files_bb(file_of(ksq));
    Bitboard ranks = kEmptyBB;
    const int dir = c == Color::White ? 1 : -1;
    for (int step = 1; step <= 2; ++step) {
        const int r = rank_of(ksq) + dir * step;
        if (r >= 0 && r < 8)
            ranks |= rank_bb(r);
    }
    return popcount(board.pieces(c, PieceType::Pawn) & files & ranks);
}

int king_zone_attacks(const Position& pos, Color c) noexcept {
    const Square ksq = pos.board().king_square(c);
    if (ksq == kNoSquare)
        return 0;

    Bitboard zone = attacks::king(ksq) | square_bb(ksq);
    int attacked = 0;
    while (zone) {
        if (pos.is_square_attacked(pop_lsb(zone), opposite(c)))
            ++attacked;
    }
    return attacked;
}

double king_safety(const Position& pos, Color c) noexcept {
    if (pos.board().king_square(c) == kNoSquare)
        return 0.0;
    return kShieldPawnBonus * king_shield(pos.board(), c) -
           kKingZoneAttackPenalty * king_zone_attacks(pos, c);
}

double king_center_distance(const Board& board, Color c) noexcept {
    const Square ksq = board.king_square(c);
    if (ksq == kNoSquare)
        return 0.0;
    return std::fabs(3.5 - file_of(ksq)) + std::fabs(3.5 - rank_of(ksq));
}

}  // namespace kibitz::terms
