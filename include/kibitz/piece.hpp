#pragma once

/// @file piece.hpp
/// Piece value object (color + type).

#include <kibitz/types.hpp>

namespace kibitz {

struct Piece {
    Color color;
    PieceType type;

    [[nodiscard]] constexpr bool operator==(const Piece&) const noexcept = default;

    [[nodiscard]] constexpr bool is_none() const noexcept { return type == PieceType::None; }

    /// FEN letter: uppercase for White, lowercase for Black.
    [[nodiscard]] constexpr char fen_char() const noexcept {
        constexpr char kWhite[] = " PNBRQK";
        constexpr char kBlack[] = " pnbrqk";
        return (color == Color::White ? kWhite : kBlack)[static_cast<int>(type)];
    }

    /// Returns a piece of type None for characters outside "PNBRQKpnbrqk".
    [[nodiscard]] static constexpr Piece from_fen_char(char ch) noexcept {
        constexpr char kLetters[] = "PNBRQK";
        const bool black = ch >= 'a' && ch <= 'z';
        const char upper = black ? static_cast<char>(ch - 'a' + 'A') : ch;
        for (int i = 0; i < kNumPieceTypes; ++i) {
            if (kLetters[i] == upper) {
                return {black ? Color::Black : Color::White, static_cast<PieceType>(i + 1)};
            }
        }
        return {Color::White, PieceType::None};
    }
};

inline constexpr Piece kNoPiece{Color::White, PieceType::None};

/// Uppercase SAN letter for a piece type ('\0' for pawns and None).
[[nodiscard]] constexpr char san_letter(PieceType pt) noexcept {
    constexpr char kLetters[] = {'\0', '\0', 'N', 'B', 'R', 'Q', 'K'};
    return kLetters[static_cast<int>(pt)];
}

}  // namespace kibitz
