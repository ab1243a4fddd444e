#pragma once

/// @file zobrist.hpp
/// Zobrist keys. Positions use them to count repetitions of a board state.

#include <kibitz/piece.hpp>
#include <kibitz/types.hpp>

#include <cstdint>

namespace kibitz::zobrist {

namespace detail {

[[nodiscard]] constexpr std::uint64_t splitmix64(std::uint64_t state) noexcept {
    std::uint64_t z = state + 0x9E3779B97F4A7C15ULL;
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

struct Keys {
    std::uint64_t piece[2][kNumPieceTypes][64]{};
    std::uint64_t black_to_move{};
    std::uint64_t castling[16]{};
    std::uint64_t en_passant_file[8]{};
};

constexpr Keys build_keys() noexcept {
    constexpr std::uint64_t kSeed = 0x6B6962697A2D7631ULL;  // "kibitz-1"
    Keys k{};
    std::uint64_t n = kSeed;
    for (auto& per_color : k.piece) {
        for (auto& per_type : per_color) {
            for (auto& key : per_type) key = splitmix64(n++);
        }
    }
    k.black_to_move = splitmix64(n++);
    for (auto& key : k.castling) key = splitmix64(n++);
    for (auto& key : k.en_passant_file) key = splitmix64(n++);
    return k;
}

inline constexpr Keys kKeys = build_keys();

}  // namespace detail

[[nodiscard]] constexpr std::uint64_t piece_key(Piece p, Square sq) noexcept {
    return detail::kKeys.piece[color_index(p.color)][piece_index(p.type)][sq];
}

[[nodiscard]] constexpr std::uint64_t black_to_move_key() noexcept {
    return detail::kKeys.black_to_move;
}

[[nodiscard]] constexpr std::uint64_t castling_key(CastlingRights cr) noexcept {
    return detail::kKeys.castling[static_cast<int>(cr) & 0xF];
}

[[nodiscard]] constexpr std::uint64_t en_passant_key(Square ep) noexcept {
    return detail::kKeys.en_passant_file[file_of(ep)];
}

}  // namespace kibitz::zobrist
