/// @file heuristic.cpp
/// Heuristic evaluator.

#include <kibitz/heuristic.hpp>

#include <kibitz/movegen.hpp>
#include <kibitz/terms.hpp>

namespace kibitz::heuristic {

namespace {

// ── Piece-square tables (centipawns) ────────────────────────────────────────
// Written as seen from White with rank 8 on the first row. A White piece on
// `sq` reads entry `sq ^ 56`; a Black piece reads entry `sq`.

// clang-format off
constexpr int kPawnTable[64] = {
     0,  0,  0,  0,  0,  0,  0,  0,
    50, 50, 50, 50, 50, 50, 50, 50,
    10, 10, 20, 30, 30, 20, 10, 10,
     5,  5, 10, 25, 25, 10,  5,  5,
     0,  0,  0, 20, 20,  0,  0,  0,
     5, -5,-10,  0,  0,-10, -5,  5,
     5, 10, 10,-20,-20, 10, 10,  5,
     0,  0,  0,  0,  0,  0,  0,  0,
};

constexpr int kKnightTable[64] = {
    -50,-40,-30,-30,-30,-30,-40,-50,
    -40,-20,  0,  0,  0,  0,-20,-40,
    -30,  0, 10, 15, 15, 10,  0,-30,
    -30,  5, 15, 20, 20, 15,  5,-30,
    -30,  0, 15, 20, 20, 15,  0,-30,
    -30,  5, 10, 15, 15, 10,  5,-30,
    -40,-20,  0,  5,  5,  0,-20,-40,
    -50,-40,-30,-30,-30,-30,-40,-50,
};

constexpr int kBishopTable[64] = {
    -20,-10,-10,-10,-10,-10,-10,-20,
    -10,  0,  0,  0,  0,  0,  0,-10,
    -10,  0,  5, 10, 10,  5,  0,-10,
    -10,  5,  5, 10, 10,  5,  5,-10,
    -10,  0, 10, 10, 10, 10,  0,-10,
    -10, 10, 10, 10, 10, 10, 10,-10,
    -10,  5,  0,  0,  0,  0,  5,-10,
    -20,-10,-10,-10,-10,-10,-10,-20,
};

constexpr int kRookTable[64] = {
      0,  0,  0,  0,  0,  0,  0,  0,
      5, 10, 10, 10, 10, 10, 10,  5,
     -5,  0,  0,  0,  0,  0,  0, -5,
     -5,  0,  0,  0,  0,  0,  0, -5,
     -5,  0,  0,  0,  0,  0,  0, -5,
     -5,  0,  0,  0,  0,  0,  0, -5,
     -5,  0,  0,  0,  0,  0,  0, -5,
      0,  0,  0,  5,  5,  0,  0,  0,
};

constexpr int kQueenTable[64] = {
    -20,-10,-10, -5, -5,-10,-10,-20,
    -10,  0,  0,  0,  0,  0,  0,-10,
    -10,  0,  5,  5,  5,  5,  0,-10,
     -5,  0,  5,  5,  5,  5,  0, -5,
      0,  0,  5,  5,  5,  5,  0, -5,
    -10,  5,  5,  5,  5,  5,  0,-10,
    -10,  0,  5,  0,  0,  0,  0,-10,
    -20,-10,-10, -5, -5,-10,-10,-20,
};

constexpr int kKingMiddlegameTable[64] = {
    -30,-40,-40,-50,-50,-40,-40,-30,
    -30,-40,-40,-50,-50,-40,-40,-30,
    -30,-40,-40,-50,-50,-40,-40,-30,
    -30,-40,-40,-50,-50,-40,-40,-30,
    -20,-30,-30,-40,-40,-30,-30,-20,
    -10,-20,-20,-20,-20,-20,-20,-10,
     20, 20,  0,  0,  0,  0, 20, 20,
     20, 30, 10,  0,  0, 10, 30, 20,
};

constexpr int kKingEndgameTable[64] = {
    -50,-40,-30,-20,-20,-30,-40,-50,
    -30,-20,-10,  0,  0,-10,-20,-30,
    -30,-10, 20, 30, 30, 20,-10,-30,
    -30,-10, 30, 40, 40, 30,-10,-30,
    -30,-10, 30, 40, 40, 30,-10,-30,
    -30,-10, 20, 30, 30, 20,-10,-30,
    -30,-30,  0,  0,  0,  0,-30,-30,
    -50,-30,-30,-30,-30,-30,-30,-50,
};
// clang-format on

const int* table_for(PieceType pt, bool endgame) noexcept {
    switch (pt) {
        case PieceType::Pawn:
            return kPawnTable;
        case PieceType::Knight:
            return kKnightTable;
        case PieceType::Bishop:
            return kBishopTable;
        case PieceType::Rook:
            return kRookTable;
        case PieceType::Queen:
            return kQueenTable;
        case PieceType::King:
            return endgame ? kKingEndgameTable : kKingMiddlegameTable;
        case PieceType::None:
            break;
    }
    return nullptr;
}

/// Piece-square sum, White minus Black, in pawns.
double piece_square(const Board& board) noexcept {
    const bool endgame = terms::is_endgame(board);
    int cp = 0;
    Bitboard occ = board.occupied_all();
    while (occ) {
        const Square sq = pop_lsb(occ);
        const Piece p = board.piece_at(sq);
        const int* table = table_for(p.type, endgame);
        if (p.color == Color::White) {
            cp += table[mirror(sq)];
        } else {
            cp -= table[sq];
        }
    }
    return cp / 100.0;
}

}  // namespace

Breakdown breakdown(const Position& pos) {
    const Board& board = pos.board();
    Breakdown b;
    b.material = terms::material(board, Color::White) - terms::material(board, Color::Black);
    b.piece_square = piece_square(board);
    b.mobility = terms::kMobilityWeight * (movegen::mobility(pos, Color::White) -
                                           movegen::mobility(pos, Color::Black));
    b.king_safety =
        terms::king_safety(pos, Color::White) - terms::king_safety(pos, Color::Black);
    b.pawn_structure =
        terms::pawn_score(terms::pawn_structure(board, Color::White)) -
        terms::pawn_score(terms::pawn_structure(board, Color::Black));
    return b;
}

double score(const Position& pos) {
    return breakdown(pos).total();
}

EvaluationResult evaluate(const Position& pos) {
    if (auto terminal = terminal_result(classify_state(pos), pos.side_to_move()))
        return *terminal;
    const double s = score(pos);
    return {s, classify(s), Source::Heuristic};
}

}  // namespace kibitz::heuristic
