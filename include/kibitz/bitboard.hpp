#pragma once

/// @file bitboard.hpp
/// 64-bit square sets and the fixed masks the rules layer and the evaluators share.

#include <kibitz/types.hpp>

#include <bit>
#include <cstdint>

namespace kibitz {

using Bitboard = std::uint64_t;

inline constexpr Bitboard kEmptyBB = 0ULL;

[[nodiscard]] constexpr Bitboard square_bb(Square sq) noexcept {
    return 1ULL << sq;
}

[[nodiscard]] constexpr int popcount(Bitboard b) noexcept {
    return std::popcount(b);
}

/// Index of the least significant set bit. `b` must be non-empty.
[[nodiscard]] constexpr Square lsb(Bitboard b) noexcept {
    return static_cast<Square>(std::countr_zero(b));
}

/// Return and clear the least significant set bit.
[[nodiscard]] constexpr Square pop_lsb(Bitboard& b) noexcept {
    Square sq = lsb(b);
    b &= b - 1;
    return sq;
}

[[nodiscard]] constexpr bool test_bit(Bitboard b, Square sq) noexcept {
    return (b >> sq) & 1;
}

constexpr void set_bit(Bitboard& b, Square sq) noexcept {
    b |= square_bb(sq);
}

constexpr void clear_bit(Bitboard& b, Square sq) noexcept {
    b &= ~square_bb(sq);
}

// ── Files, ranks, colors ────────────────────────────────────────────────────

// clang-format off
inline constexpr Bitboard kFileA = 0x0101010101010101ULL;
inline constexpr Bitboard kFileH = kFileA << 7;

inline constexpr Bitboard kRank1 = 0x00000000000000FFULL;
inline constexpr Bitboard kRank3 = kRank1 << 16;
inline constexpr Bitboard kRank6 = kRank1 << 40;
inline constexpr Bitboard kRank8 = kRank1 << 56;

/// Squares where (file + rank) is odd: b1, a2, ..., the light squares.
inline constexpr Bitboard kLightSquares = 0x55AA55AA55AA55AAULL;
// clang-format on

[[nodiscard]] constexpr Bitboard file_bb(int f) noexcept {
    return kFileA << f;
}
[[nodiscard]] constexpr Bitboard rank_bb(int r) noexcept {
    return kRank1 << (r * 8);
}

/// Files next to `f` (one or two of them).
[[nodiscard]] constexpr Bitboard adjacent_files_bb(int f) noexcept {
    Bitboard b = kEmptyBB;
    if (f > 0)
        b |= file_bb(f - 1);
    if (f < 7)
        b |= file_bb(f + 1);
    return b;
}

/// All squares strictly in front of `sq` from `c`'s point of view, on
/// the same and adjacent files. A pawn with no enemy pawn here is passed.
[[nodiscard]] constexpr Bitboard passed_span_bb(Color c, Square sq) noexcept {
    Bitboard files = file_bb(file_of(sq)) | adjacent_files_bb(file_of(sq));
    Bitboard ahead = kEmptyBB;
    if (c == Color::White) {
        for (int r = rank_of(sq) + 1; r < 8; ++r) ahead |= rank_bb(r);
    } else {
        for (int r = rank_of(sq) - 1; r >= 0; --r) ahead |= rank_bb(r);
    }
    return files & ahead;
}

// ── Shifts ──────────────────────────────────────────────────────────────────

[[nodiscard]] constexpr Bitboard shift_north(Bitboard b) noexcept {
    return b << 8;
}
[[nodiscard]] constexpr Bitboard shift_south(Bitboard b) noexcept {
    return b >> 8;
}
[[nodiscard]] constexpr Bitboard shift_east(Bitboard b) noexcept {
    return (b << 1) & ~kFileA;
}
[[nodiscard]] constexpr Bitboard shift_west(Bitboard b) noexcept {
    return (b >> 1) & ~kFileH;
}
[[nodiscard]] constexpr Bitboard shift_ne(Bitboard b) noexcept {
    return (b << 9) & ~kFileA;
}
[[nodiscard]] constexpr Bitboard shift_nw(Bitboard b) noexcept {
    return (b << 7) & ~kFileH;
}
[[nodiscard]] constexpr Bitboard shift_se(Bitboard b) noexcept {
    return (b >> 7) & ~kFileA;
}
[[nodiscard]] constexpr Bitboard shift_sw(Bitboard b) noexcept {
    return (b >> 9) & ~kFileH;
}

/// One step towards the opponent's back rank for color `c`.
[[nodiscard]] constexpr Bitboard shift_forward(Color c, Bitboard b) noexcept {
    return c == Color::White ? shift_north(b) : shift_south(b);
}

}  // namespace kibitz
