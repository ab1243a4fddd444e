#pragma once

/// @file position.hpp
/// Immutable chess position: board, side to move, castling and en passant
/// rights, clocks, and the keys of earlier positions for repetition checks.
///
/// A position is never changed after construction; `apply` derives the
/// successor. Attack queries need `kibitz::init()` to have run.

#include <kibitz/board.hpp>
#include <kibitz/move.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kibitz {

inline constexpr std::string_view kStartingFen =
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

class Position {
   public:
    /// Standard starting position.
    [[nodiscard]] static Position initial();

    /// Parse and validate a FEN string. Throws InvalidPosition when the text
    /// is malformed or describes a board that cannot arise in a game.
    [[nodiscard]] static Position from_fen(std::string_view fen);

    [[nodiscard]] std::string to_fen() const;

    /// Successor position after `m`. `m` must come from movegen::legal(*this);
    /// use rules::apply for moves of unknown origin.
    [[nodiscard]] Position apply(Move m) const;

    [[nodiscard]] const Board& board() const noexcept { return board_; }
    [[nodiscard]] Color side_to_move() const noexcept { return side_to_move_; }
    [[nodiscard]] CastlingRights castling() const noexcept { return castling_; }
    [[nodiscard]] Square en_passant() const noexcept { return en_passant_; }
    [[nodiscard]] int halfmove_clock() const noexcept { return halfmove_clock_; }
    [[nodiscard]] int fullmove_number() const noexcept { return fullmove_number_; }
    [[nodiscard]] std::uint64_t key() const noexcept { return key_; }

    /// Is `sq` attacked by any piece of color `by`?
    [[nodiscard]] bool is_square_attacked(Square sq, Color by) const noexcept;

    /// Number of pieces of color `by` attacking `sq`.
    [[nodiscard]] int attacker_count(Square sq, Color by) const noexcept;

    [[nodiscard]] bool is_in_check() const noexcept { return is_in_check(side_to_move_); }
    [[nodiscard]] bool is_in_check(Color c) const noexcept;

    /// Occurrences of the current board state since the last pawn move or
    /// capture, the current one included.
    [[nodiscard]] int repetition_count() const noexcept;

    /// Same placement, side, rights and clocks; history is ignored. An en
    /// passant square no pawn can capture on does not count.
    [[nodiscard]] bool same_state(const Position& other) const noexcept;

   private:
    Position() = default;

    void validate() const;
    [[nodiscard]] std::uint64_t compute_key() const noexcept;

    Board board_;
    Color side_to_move_ = Color::White;
    CastlingRights castling_ = kCastlingNone;
    Square en_passant_ = kNoSquare;
    int halfmove_clock_ = 0;
    int fullmove_number_ = 1;
    std::uint64_t key_ = 0;
    std::vector<std::uint64_t> earlier_keys_;  ///< Since the last irreversible move.
};

}  // namespace kibitz
