#pragma once

/// @file board.hpp
/// Piece placement: per-piece bitboards plus a mailbox for square lookups.

#include <kibitz/bitboard.hpp>
#include <kibitz/piece.hpp>
#include <kibitz/types.hpp>

namespace kibitz {

class Board {
   public:
    /// Place a piece on an empty square.
    void put_piece(Square sq, Piece p) noexcept {
        set_bit(pieces_[color_index(p.color)][piece_index(p.type)], sq);
        set_bit(occupied_[color_index(p.color)], sq);
        mailbox_[sq] = p;
    }

    /// Remove the piece on an occupied square.
    void remove_piece(Square sq) noexcept {
        Piece p = mailbox_[sq];
        clear_bit(pieces_[color_index(p.color)][piece_index(p.type)], sq);
        clear_bit(occupied_[color_index(p.color)], sq);
        mailbox_[sq] = kNoPiece;
    }

    [[nodiscard]] Piece piece_at(Square sq) const noexcept { return mailbox_[sq]; }

    [[nodiscard]] bool is_empty(Square sq) const noexcept { return mailbox_[sq].is_none(); }

    [[nodiscard]] Bitboard pieces(Color c, PieceType pt) const noexcept {
        return pieces_[color_index(c)][piece_index(pt)];
    }

    /// Pieces of type `pt` of both colors.
    [[nodiscard]] Bitboard pieces(PieceType pt) const noexcept {
        return pieces(Color::White, pt) | pieces(Color::Black, pt);
    }

    [[nodiscard]] int count(Color c, PieceType pt) const noexcept {
        return popcount(pieces(c, pt));
    }

    [[nodiscard]] Bitboard occupied(Color c) const noexcept {
        return occupied_[color_index(c)];
    }

    [[nodiscard]] Bitboard occupied_all() const noexcept { return occupied_[0] | occupied_[1]; }

    /// King square of `c`, or kNoSquare when that side has no king.
    [[nodiscard]] Square king_square(Color c) const noexcept {
        Bitboard k = pieces(c, PieceType::King);
        return k ? lsb(k) : kNoSquare;
    }

    [[nodiscard]] bool operator==(const Board& other) const noexcept {
        for (int sq = 0; sq < 64; ++sq) {
            if (mailbox_[sq] != other.mailbox_[sq])
                return false;
        }
        return true;
    }

   private:
    Bitboard pieces_[2][kNumPieceTypes]{};
    Bitboard occupied_[2]{};
    Piece mailbox_[64]{kNoPiece};
};

}  // namespace kibitz
