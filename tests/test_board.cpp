/// @file test_board.cpp
/// Tests for bitboard helpers, Board, attack tables and Zobrist keys.

#include <kibitz/attacks.hpp>
#include <kibitz/bitboard.hpp>
#include <kibitz/board.hpp>
#include <kibitz/init.hpp>
#include <kibitz/zobrist.hpp>

#include <gtest/gtest.h>

#include <set>

namespace kibitz {

// ── Bitboard helpers ────────────────────────────────────────────────────────

TEST(Bitboard, PopLsbWalksSquaresInOrder) {
    Bitboard b = square_bb(C3) | square_bb(A1) | square_bb(H8);
    EXPECT_EQ(popcount(b), 3);
    EXPECT_EQ(pop_lsb(b), A1);
    EXPECT_EQ(pop_lsb(b), C3);
    EXPECT_EQ(pop_lsb(b), H8);
    EXPECT_EQ(b, kEmptyBB);
}

TEST(Bitboard, ShiftsDoNotWrap) {
    EXPECT_EQ(shift_east(square_bb(H4)), kEmptyBB);
    EXPECT_EQ(shift_west(square_bb(A4)), kEmptyBB);
    EXPECT_EQ(shift_ne(square_bb(H2)), kEmptyBB);
    EXPECT_EQ(shift_forward(Color::Black, square_bb(E7)), square_bb(E6));
}

TEST(Bitboard, AdjacentFiles) {
    EXPECT_EQ(adjacent_files_bb(0), file_bb(1));
    EXPECT_EQ(adjacent_files_bb(4), file_bb(3) | file_bb(5));
}

TEST(Bitboard, PassedSpanLooksAhead) {
    const Bitboard white = passed_span_bb(Color::White, E5);
    EXPECT_TRUE(test_bit(white, D6));
    EXPECT_TRUE(test_bit(white, E8));
    EXPECT_TRUE(test_bit(white, F7));
    EXPECT_FALSE(test_bit(white, E4));
    EXPECT_FALSE(test_bit(white, C6));

    const Bitboard black = passed_span_bb(Color::Black, A4);
    EXPECT_TRUE(test_bit(black, B1));
    EXPECT_FALSE(test_bit(black, A5));
    EXPECT_EQ(popcount(black), 6);
}

TEST(Bitboard, LightSquares) {
    EXPECT_TRUE(test_bit(kLightSquares, B1));
    EXPECT_TRUE(test_bit(kLightSquares, H1));
    EXPECT_FALSE(test_bit(kLightSquares, A1));
    EXPECT_FALSE(test_bit(kLightSquares, H8));
    EXPECT_EQ(popcount(kLightSquares), 32);
}

// ── Board ───────────────────────────────────────────────────────────────────

TEST(Board, PutAndRemoveKeepViewsInSync) {
    Board b;
    b.put_piece(D4, Piece{Color::White, PieceType::Knight});
    b.put_piece(E5, Piece{Color::Black, PieceType::Pawn});

    EXPECT_EQ(b.piece_at(D4), (Piece{Color::White, PieceType::Knight}));
    EXPECT_EQ(b.count(Color::White, PieceType::Knight), 1);
    EXPECT_EQ(b.occupied_all(), square_bb(D4) | square_bb(E5));

    b.remove_piece(D4);
    EXPECT_TRUE(b.is_empty(D4));
    EXPECT_EQ(b.pieces(Color::White, PieceType::Knight), kEmptyBB);
    EXPECT_EQ(b.occupied(Color::White), kEmptyBB);
}

TEST(Board, KingSquareMissing) {
    Board b;
    EXPECT_EQ(b.king_square(Color::White), kNoSquare);
    b.put_piece(G1, Piece{Color::White, PieceType::King});
    EXPECT_EQ(b.king_square(Color::White), G1);
}

TEST(Board, EqualityComparesPlacement) {
    Board a;
    Board b;
    EXPECT_EQ(a, b);
    a.put_piece(A1, Piece{Color::White, PieceType::Rook});
    EXPECT_FALSE(a == b);
    b.put_piece(A1, Piece{Color::White, PieceType::Rook});
    EXPECT_EQ(a, b);
}

// ── Attacks ─────────────────────────────────────────────────────────────────

class AttacksTest : public ::testing::Test {
   public:
    static void SetUpTestSuite() { init(); }
};

TEST_F(AttacksTest, LeaperCounts) {
    EXPECT_EQ(popcount(attacks::knight(A1)), 2);
    EXPECT_EQ(popcount(attacks::knight(D4)), 8);
    EXPECT_EQ(popcount(attacks::king(H8)), 3);
    EXPECT_EQ(attacks::pawn(Color::White, E4), square_bb(D5) | square_bb(F5));
    EXPECT_EQ(attacks::pawn(Color::Black, A5), square_bb(B4));
}

TEST_F(AttacksTest, RookStopsAtBlockers) {
    const Bitboard occ = square_bb(D6) | square_bb(F4);
    const Bitboard a = attacks::rook(D4, occ);
    EXPECT_TRUE(test_bit(a, D6));
    EXPECT_FALSE(test_bit(a, D7));
    EXPECT_TRUE(test_bit(a, F4));
    EXPECT_FALSE(test_bit(a, G4));
    EXPECT_TRUE(test_bit(a, A4));
    EXPECT_TRUE(test_bit(a, D1));
}

TEST_F(AttacksTest, BishopOnEmptyBoard) {
    EXPECT_EQ(popcount(attacks::bishop(A1, kEmptyBB)), 7);
    EXPECT_EQ(popcount(attacks::bishop(D4, kEmptyBB)), 13);
}

TEST_F(AttacksTest, QueenIsRookPlusBishop) {
    const Bitboard occ = square_bb(C6) | square_bb(E2) | square_bb(B4);
    EXPECT_EQ(attacks::queen(D4, occ), attacks::rook(D4, occ) | attacks::bishop(D4, occ));
    EXPECT_EQ(attacks::of(PieceType::Queen, D4, occ), attacks::queen(D4, occ));
    EXPECT_EQ(attacks::of(PieceType::Knight, D4, occ), attacks::knight(D4));
}

// ── Zobrist ─────────────────────────────────────────────────────────────────

TEST(Zobrist, KeysAreDistinct) {
    std::set<std::uint64_t> keys;
    for (Square sq = 0; sq < 64; ++sq) {
        keys.insert(zobrist::piece_key(Piece{Color::White, PieceType::Pawn}, sq));
        keys.insert(zobrist::piece_key(Piece{Color::Black, PieceType::King}, sq));
    }
    keys.insert(zobrist::black_to_move_key());
    EXPECT_EQ(keys.size(), 129u);
}

TEST(Zobrist, EnPassantKeyDependsOnFileOnly) {
    EXPECT_EQ(zobrist::en_passant_key(E3), zobrist::en_passant_key(E6));
    EXPECT_NE(zobrist::en_passant_key(E3), zobrist::en_passant_key(D3));
}

}  // namespace kibitz
