#pragma once

/// @file types.hpp
/// Squares, colors, piece types and castling rights.

#include <cstdint>
#include <string>
#include <string_view>

namespace kibitz {

// ── Color ───────────────────────────────────────────────────────────────────
enum class Color : std::uint8_t { White = 0, Black = 1 };

inline constexpr int kNumColors = 2;

[[nodiscard]] constexpr Color opposite(Color c) noexcept {
    return c == Color::White ? Color::Black : Color::White;
}
[[nodiscard]] constexpr int color_index(Color c) noexcept {
    return static_cast<int>(c);
}
/// +1 for White, -1 for Black.
[[nodiscard]] constexpr int color_sign(Color c) noexcept {
    return c == Color::White ? 1 : -1;
}

// ── Square ──────────────────────────────────────────────────────────────────
// a1=0, b1=1, ..., h1=7, a2=8, ..., h8=63
using Square = std::uint8_t;

inline constexpr Square kNoSquare = 64;

[[nodiscard]] constexpr int file_of(Square sq) noexcept {
    return sq & 7;
}
[[nodiscard]] constexpr int rank_of(Square sq) noexcept {
    return sq >> 3;
}
[[nodiscard]] constexpr Square make_square(int file, int rank) noexcept {
    return static_cast<Square>(rank * 8 + file);
}
[[nodiscard]] constexpr bool on_board(int file, int rank) noexcept {
    return file >= 0 && file < 8 && rank >= 0 && rank < 8;
}

/// Rank counted from `c`'s own back rank: 0 for the first rank, 7 for the last.
[[nodiscard]] constexpr int relative_rank(Color c, Square sq) noexcept {
    return c == Color::White ? rank_of(sq) : 7 - rank_of(sq);
}

/// Vertical mirror (a1 <-> a8). Used to read White-oriented tables for Black.
[[nodiscard]] constexpr Square mirror(Square sq) noexcept {
    return static_cast<Square>(sq ^ 56);
}

[[nodiscard]] constexpr char file_char(Square sq) noexcept {
    return static_cast<char>('a' + file_of(sq));
}
[[nodiscard]] constexpr char rank_char(Square sq) noexcept {
    return static_cast<char>('1' + rank_of(sq));
}

[[nodiscard]] inline std::string square_name(Square sq) {
    return {file_char(sq), rank_char(sq)};
}

/// "e4" -> E4. Returns kNoSquare for anything that is not a square name.
[[nodiscard]] inline Square parse_square(std::string_view name) {
    if (name.size() != 2)
        return kNoSquare;
    const int f = name[0] - 'a';
    const int r = name[1] - '1';
    return on_board(f, r) ? make_square(f, r) : kNoSquare;
}

// clang-format off
enum SquareConstants : Square {
    A1, B1, C1, D1, E1, F1, G1, H1,
    A2, B2, C2, D2, E2, F2, G2, H2,
    A3, B3, C3, D3, E3, F3, G3, H3,
    A4, B4, C4, D4, E4, F4, G4, H4,
    A5, B5, C5, D5, E5, F5, G5, H5,
    A6, B6, C6, D6, E6, F6, G6, H6,
    A7, B7, C7, D7, E7, F7, G7, H7,
    A8, B8, C8, D8, E8, F8, G8, H8,
};
// clang-format on

// ── PieceType ───────────────────────────────────────────────────────────────
enum class PieceType : std::uint8_t {
    None = 0,
    Pawn = 1,
    Knight = 2,
    Bishop = 3,
    Rook = 4,
    Queen = 5,
    King = 6,
};

inline constexpr int kNumPieceTypes = 6;

/// Pawn=0 .. King=5; indexes per-piece tables.
[[nodiscard]] constexpr int piece_index(PieceType pt) noexcept {
    return static_cast<int>(pt) - 1;
}

// ── CastlingRights ──────────────────────────────────────────────────────────
enum CastlingRights : std::uint8_t {
    kCastlingNone = 0,
    kWhiteKingside = 1,
    kWhiteQueenside = 2,
    kBlackKingside = 4,
    kBlackQueenside = 8,
    kWhiteBoth = kWhiteKingside | kWhiteQueenside,
    kBlackBoth = kBlackKingside | kBlackQueenside,
    kCastlingAll = kWhiteBoth | kBlackBoth,
};

[[nodiscard]] constexpr CastlingRights operator|(CastlingRights a, CastlingRights b) noexcept {
    return static_cast<CastlingRights>(static_cast<int>(a) | static_cast<int>(b));
}
[[nodiscard]] constexpr CastlingRights operator&(CastlingRights a, CastlingRights b) noexcept {
    return static_cast<CastlingRights>(static_cast<int>(a) & static_cast<int>(b));
}
constexpr CastlingRights& operator|=(CastlingRights& a, CastlingRights b) noexcept {
    a = a | b;
    return a;
}

[[nodiscard]] constexpr CastlingRights kingside_right(Color c) noexcept {
    return c == Color::White ? kWhiteKingside : kBlackKingside;
}
[[nodiscard]] constexpr CastlingRights queenside_right(Color c) noexcept {
    return c == Color::White ? kWhiteQueenside : kBlackQueenside;
}

}  // namespace kibitz
