#pragma once

/// @file move.hpp
/// Move representation and the fixed-capacity MoveList.

#include <kibitz/types.hpp>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace kibitz {

enum class MoveFlag : std::uint8_t {
    Normal = 0,
    DoublePawn = 1,
    EnPassant = 2,
    CastleKingside = 3,
    CastleQueenside = 4,
    Promotion = 5,
};

struct Move {
    Square from_sq = 0;
    Square to_sq = 0;
    MoveFlag flag = MoveFlag::Normal;
    PieceType promotion = PieceType::None;

    [[nodiscard]] constexpr bool operator==(const Move&) const noexcept = default;

    /// Same from/to/promotion, ignoring the flag. Parsed UCI text carries no
    /// flag, so it is compared against generated moves this way.
    [[nodiscard]] constexpr bool same_squares(const Move& other) const noexcept {
        return from_sq == other.from_sq && to_sq == other.to_sq && promotion == other.promotion;
    }

    [[nodiscard]] constexpr bool is_null() const noexcept { return from_sq == to_sq; }

    [[nodiscard]] constexpr bool is_castle() const noexcept {
        return flag == MoveFlag::CastleKingside || flag == MoveFlag::CastleQueenside;
    }

    /// Long algebraic (UCI) notation, e.g. "e2e4", "e7e8q".
    [[nodiscard]] std::string uci() const {
        std::string s = square_name(from_sq) + square_name(to_sq);
        if (promotion != PieceType::None) {
            constexpr char kPromo[] = "  nbrq ";
            s += kPromo[static_cast<int>(promotion)];
        }
        return s;
    }

    /// Parse 4 or 5 character UCI text. Returns the null move when malformed.
    /// The flag is left Normal; resolve against a legal move list to get it.
    [[nodiscard]] static Move from_uci(std::string_view text) {
        if (text.size() != 4 && text.size() != 5)
            return {};
        Square from = parse_square(text.substr(0, 2));
        Square to = parse_square(text.substr(2, 2));
        if (from == kNoSquare || to == kNoSquare)
            return {};

        Move m{from, to, MoveFlag::Normal, PieceType::None};
        if (text.size() == 5) {
            switch (text[4]) {
                case 'n':
                    m.promotion = PieceType::Knight;
                    break;
                case 'b':
                    m.promotion = PieceType::Bishop;
                    break;
                case 'r':
                    m.promotion = PieceType::Rook;
                    break;
                case 'q':
                    m.promotion = PieceType::Queen;
                    break;
                default:
                    return {};
            }
            m.flag = MoveFlag::Promotion;
        }
        return m;
    }
};

inline constexpr Move kNullMove{};

// ── MoveList ────────────────────────────────────────────────────────────────

/// Fixed-capacity list; no legal chess position has more than 218 moves.
class MoveList {
   public:
    static constexpr int kMaxMoves = 256;

    constexpr void push(Move m) noexcept { moves_[count_++] = m; }
    [[nodiscard]] constexpr int size() const noexcept { return count_; }
    [[nodiscard]] constexpr bool empty() const noexcept { return count_ == 0; }

    [[nodiscard]] constexpr const Move& operator[](int i) const noexcept { return moves_[i]; }

    [[nodiscard]] constexpr const Move* begin() const noexcept { return moves_.data(); }
    [[nodiscard]] constexpr const Move* end() const noexcept { return moves_.data() + count_; }

    [[nodiscard]] constexpr bool contains(const Move& m) const noexcept {
        for (const Move& x : *this) {
            if (x == m)
                return true;
        }
        return false;
    }

   private:
    std::array<Move, kMaxMoves> moves_{};
    int count_ = 0;
};

}  // namespace kibitz
