#pragma once

/// @file attacks.hpp
/// Attack sets for every piece type.
///
/// Knight, king and pawn sets come from compile-time tables. Slider sets use
/// magic bitboards whose multipliers are searched once by `attacks::init()`;
/// call it (normally through `kibitz::init()`) before any slider lookup.

#include <kibitz/bitboard.hpp>
#include <kibitz/types.hpp>

namespace kibitz::attacks {

namespace detail {

struct LeaperTables {
    Bitboard knight[64]{};
    Bitboard king[64]{};
    Bitboard pawn[2][64]{};
};

constexpr Bitboard leaper_set(Square sq, const int (*deltas)[2], int count) noexcept {
    Bitboard set = kEmptyBB;
    for (int i = 0; i < count; ++i) {
        int f = file_of(sq) + deltas[i][0];
        int r = rank_of(sq) + deltas[i][1];
        if (on_board(f, r))
            set |= square_bb(make_square(f, r));
    }
    return set;
}

constexpr LeaperTables build_leapers() noexcept {
    constexpr int kKnight[8][2] = {{1, 2}, {2, 1}, {2, -1}, {1, -2},
                                   {-1, -2}, {-2, -1}, {-2, 1}, {-1, 2}};
    constexpr int kKing[8][2] = {{1, 0}, {1, 1}, {0, 1}, {-1, 1},
                                 {-1, 0}, {-1, -1}, {0, -1}, {1, -1}};
    constexpr int kWhitePawn[2][2] = {{-1, 1}, {1, 1}};
    constexpr int kBlackPawn[2][2] = {{-1, -1}, {1, -1}};

    LeaperTables t{};
    for (int sq = 0; sq < 64; ++sq) {
        auto s = static_cast<Square>(sq);
        t.knight[sq] = leaper_set(s, kKnight, 8);
        t.king[sq] = leaper_set(s, kKing, 8);
        t.pawn[0][sq] = leaper_set(s, kWhitePawn, 2);
        t.pawn[1][sq] = leaper_set(s, kBlackPawn, 2);
    }
    return t;
}

inline constexpr LeaperTables kLeapers = build_leapers();

}  // namespace detail

/// Build the slider lookup tables. Idempotent, not thread-safe on its own.
void init();

[[nodiscard]] constexpr Bitboard knight(Square sq) noexcept {
    return detail::kLeapers.knight[sq];
}

[[nodiscard]] constexpr Bitboard king(Square sq) noexcept {
    return detail::kLeapers.king[sq];
}

/// Squares a pawn of color `c` standing on `sq` attacks.
[[nodiscard]] constexpr Bitboard pawn(Color c, Square sq) noexcept {
    return detail::kLeapers.pawn[color_index(c)][sq];
}

[[nodiscard]] Bitboard bishop(Square sq, Bitboard occupancy) noexcept;
[[nodiscard]] Bitboard rook(Square sq, Bitboard occupancy) noexcept;

[[nodiscard]] inline Bitboard queen(Square sq, Bitboard occupancy) noexcept {
    return bishop(sq, occupancy) | rook(sq, occupancy);
}

/// Attack set of any non-pawn piece type.
[[nodiscard]] Bitboard of(PieceType pt, Square sq, Bitboard occupancy) noexcept;

}  // namespace kibitz::attacks
