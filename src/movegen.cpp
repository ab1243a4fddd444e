/// @file movegen.cpp
/// Bitboard move generation.

#include <kibitz/movegen.hpp>

#include <kibitz/attacks.hpp>

namespace kibitz::movegen {

namespace {

constexpr PieceType kPromotions[] = {PieceType::Queen, PieceType::Rook, PieceType::Bishop,
                                     PieceType::Knight};

/// Push every move from `targets`, each found `offset` squares ahead of its origin.
void push_pawn_targets(MoveList& ml, Bitboard targets, int offset, MoveFlag flag,
                       Bitboard promo_rank) {
    while (targets) {
        const Square to = pop_lsb(targets);
        const auto from = static_cast<Square>(to - offset);
        if (square_bb(to) & promo_rank) {
            for (PieceType pt : kPromotions) ml.push({from, to, MoveFlag::Promotion, pt});
        } else {
            ml.push({from, to, flag});
        }
    }
}

void gen_pawn_moves(const Position& pos, Color us, MoveList& ml) {
    const Board& board = pos.board();
    const Bitboard pawns = board.pieces(us, PieceType::Pawn);
    const Bitboard empty = ~board.occupied_all();
    const Bitboard enemy = board.occupied(opposite(us));
    const bool white = us == Color::White;
    const Bitboard promo_rank = white ? kRank8 : kRank1;
    const int up = white ? 8 : -8;

    const Bitboard single = shift_forward(us, pawns) & empty;
    const Bitboard dbl = shift_forward(us, single & (white ? kRank3 : kRank6)) & empty;
    push_pawn_targets(ml, single, up, MoveFlag::Normal, promo_rank);
    push_pawn_targets(ml, dbl, 2 * up, MoveFlag::DoublePawn, promo_rank);

    // Captures towards the a-file, then towards the h-file.
    const Bitboard west = (white ? shift_nw(pawns) : shift_sw(pawns)) & enemy;
    const Bitboard east = (white ? shift_ne(pawns) : shift_se(pawns)) & enemy;
    push_pawn_targets(ml, west, white ? 7 : -9, MoveFlag::Normal, promo_rank);
    push_pawn_targets(ml, east, white ? 9 : -7, MoveFlag::Normal, promo_rank);

    if (pos.en_passant() != kNoSquare && us == pos.side_to_move()) {
        Bitboard takers = attacks::pawn(opposite(us), pos.en_passant()) & pawns;
        while (takers) {
            ml.push({pop_lsb(takers), pos.en_passant(), MoveFlag::EnPassant});
        }
    }
}

void gen_piece_moves(const Position& pos, Color us, PieceType pt, MoveList& ml) {
    const Board& board = pos.board();
    const Bitboard own = board.occupied(us);
    const Bitboard occ = board.occupied_all();
    Bitboard pieces = board.pieces(us, pt);
    while (pieces) {
        const Square from = pop_lsb(pieces);
        Bitboard targets = attacks::of(pt, from, occ) & ~own;
        while (targets) {
            ml.push({from, pop_lsb(targets)});
        }
    }
}

void gen_castling(const Position& pos, MoveList& ml) {
    const Color us = pos.side_to_move();
    const Color them = opposite(us);
    const Board& board = pos.board();
    const int rank = us == Color::White ? 0 : 7;
    const Square king = make_square(4, rank);

    if (pos.is_square_attacked(king, them))
        return;

    if (pos.castling() & kingside_right(us)) {
        const Square f = make_square(5, rank);
        const Square g = make_square(6, rank);
        if (board.is_empty(f) && board.is_empty(g) && !pos.is_square_attacked(f, them) &&
            !pos.is_square_attacked(g, them)) {
            ml.push({king, g, MoveFlag::CastleKingside});
        }
    }

    if (pos.castling() & queenside_right(us)) {
        const Square b = make_square(1, rank);
        const Square c = make_square(2, rank);
        const Square d = make_square(3, rank);
        if (board.is_empty(b) && board.is_empty(c) && board.is_empty(d) &&
            !pos.is_square_attacked(c, them) && !pos.is_square_attacked(d, them)) {
            ml.push({king, c, MoveFlag::CastleQueenside});
        }
    }
}

MoveList generate(const Position& pos, Color us, bool with_castling) {
    MoveList ml;
    gen_pawn_moves(pos, us, ml);
    for (PieceType pt : {PieceType::Knight, PieceType::Bishop, PieceType::Rook, PieceType::Queen,
                         PieceType::King}) {
        gen_piece_moves(pos, us, pt, ml);
    }
    if (with_castling) {
        gen_castling(pos, ml);
    }
    return ml;
}

}  // namespace

MoveList pseudo_legal(const Position& pos) {
    return generate(pos, pos.side_to_move(), true);
}

MoveList legal(const Position& pos) {
    const Color us = pos.side_to_move();
    MoveList result;
    for (const Move& m : pseudo_legal(pos)) {
        if (!pos.apply(m).is_in_check(us)) {
            result.push(m);
        }
    }
    return result;
}

int mobility(const Position& pos, Color side) {
    const MoveList ml = generate(pos, side, false);
    return ml.size();
}

std::uint64_t perft(const Position& pos, int depth) {
    if (depth <= 0)
        return 1;
    const MoveList moves = legal(pos);
    if (depth == 1)
        return static_cast<std::uint64_t>(moves.size());
    std::uint64_t nodes = 0;
    for (const Move& m : moves) {
        nodes += perft(pos.apply(m), depth - 1);
    }
    return nodes;
}

}  // namespace kibitz::movegen
