/// @file attacks.cpp
/// Magic bitboard tables for bishops and rooks.
///
/// Multipliers are found at init time by a seeded sparse-random search, so the
/// tables are identical on every run.

#include <kibitz/attacks.hpp>

#include <algorithm>
#include <cstdint>
#include <vector>

namespace kibitz::attacks {

namespace {

constexpr int kBishopDirs[4][2] = {{1, 1}, {1, -1}, {-1, 1}, {-1, -1}};
constexpr int kRookDirs[4][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};

/// xorshift64* generator; sparse() has few bits set, which makes good magics.
class MagicRng {
   public:
    explicit MagicRng(std::uint64_t seed) : state_(seed) {}

    std::uint64_t sparse() { return next() & next() & next(); }

   private:
    std::uint64_t next() {
        state_ ^= state_ >> 12;
        state_ ^= state_ << 25;
        state_ ^= state_ >> 27;
        return state_ * 0x2545F4914F6CDD1DULL;
    }

    std::uint64_t state_;
};

/// Walk the four rays from `sq`, stopping on (and including) the first blocker.
Bitboard slide(Square sq, Bitboard occupancy, const int (&dirs)[4][2]) {
    Bitboard set = kEmptyBB;
    for (const auto& d : dirs) {
        int f = file_of(sq) + d[0];
        int r = rank_of(sq) + d[1];
        while (on_board(f, r)) {
            Square s = make_square(f, r);
            set_bit(set, s);
            if (test_bit(occupancy, s))
                break;
            f += d[0];
            r += d[1];
        }
    }
    return set;
}

/// Occupancy squares that can change the attack set: the rays minus their last square.
Bitboard relevant_mask(Square sq, const int (&dirs)[4][2]) {
    Bitboard mask = kEmptyBB;
    for (const auto& d : dirs) {
        int f = file_of(sq) + d[0];
        int r = rank_of(sq) + d[1];
        while (on_board(f + d[0], r + d[1])) {
            set_bit(mask, make_square(f, r));
            f += d[0];
            r += d[1];
        }
    }
    return mask;
}

struct Magic {
    Bitboard mask = kEmptyBB;
    std::uint64_t multiplier = 0;
    int shift = 64;
    std::size_t offset = 0;

    [[nodiscard]] std::size_t index(Bitboard occupancy) const noexcept {
        return offset + static_cast<std::size_t>(((occupancy & mask) * multiplier) >> shift);
    }
};

class SliderTable {
   public:
    void build(const int (&dirs)[4][2], MagicRng& rng) {
        table_.clear();
        for (int sq = 0; sq < 64; ++sq) {
            build_square(static_cast<Square>(sq), dirs, rng);
        }
    }

    [[nodiscard]] Bitboard lookup(Square sq, Bitboard occupancy) const noexcept {
        return table_[magics_[sq].index(occupancy)];
    }

   private:
    void build_square(Square sq, const int (&dirs)[4][2], MagicRng& rng) {
        Magic& m = magics_[sq];
        m.mask = relevant_mask(sq, dirs);
        const int bits = popcount(m.mask);
        m.shift = 64 - bits;
        m.offset = table_.size();

        // Carry-Rippler enumeration of every subset of the mask.
        std::vector<Bitboard> occupancies;
        std::vector<Bitboard> expected;
        Bitboard subset = kEmptyBB;
        do {
            occupancies.push_back(subset);
            expected.push_back(slide(sq, subset, dirs));
            subset = (subset - m.mask) & m.mask;
        } while (subset != kEmptyBB);

        const std::size_t size = std::size_t{1} << bits;
        std::vector<Bitboard> slots(size);
        std::vector<bool> used(size);
        for (;;) {
            m.multiplier = rng.sparse();
            if (popcount((m.mask * m.multiplier) & 0xFF00000000000000ULL) < 6)
                continue;

            std::fill(used.begin(), used.end(), false);
            bool collision = false;
            for (std::size_t i = 0; i < occupancies.size() && !collision; ++i) {
                auto slot = static_cast<std::size_t>(((occupancies[i] & m.mask) * m.multiplier) >>
                                                     m.shift);
                if (!used[slot]) {
                    used[slot] = true;
                    slots[slot] = expected[i];
                } else if (slots[slot] != expected[i]) {
                    collision = true;
                }
            }
            if (!collision)
                break;
        }
        table_.insert(table_.end(), slots.begin(), slots.end());
    }

    Magic magics_[64]{};
    std::vector<Bitboard> table_;
};

SliderTable g_bishops;
SliderTable g_rooks;
bool g_ready = false;

}  // namespace

void init() {
    if (g_ready)
        return;
    MagicRng rng(0x9D39247E33776D41ULL);
    g_bishops.build(kBishopDirs, rng);
    g_rooks.build(kRookDirs, rng);
    g_ready = true;
}

Bitboard bishop(Square sq, Bitboard occupancy) noexcept {
    return g_bishops.lookup(sq, occupancy);
}

Bitboard rook(Square sq, Bitboard occupancy) noexcept {
    return g_rooks.lookup(sq, occupancy);
}

Bitboard of(PieceType pt, Square sq, Bitboard occupancy) noexcept {
    switch (pt) {
        case PieceType::Knight:
            return knight(sq);
        case PieceType::Bishop:
            return bishop(sq, occupancy);
        case PieceType::Rook:
            return rook(sq, occupancy);
        case PieceType::Queen:
            return queen(sq, occupancy);
        case PieceType::King:
            return king(sq);
        default:
            return kEmptyBB;
    }
}

}  // namespace kibitz::attacks
