/// @file rules.cpp
/// Terminal-state tests and move notation.

#include <kibitz/rules.hpp>

#include <kibitz/errors.hpp>

#include <string>

namespace kibitz::rules {

namespace {

/// SAN without the check/mate suffix.
std::string san_body(const Position& pos, Move m, const MoveList& legal) {
    if (m.flag == MoveFlag::CastleKingside)
        return "O-O";
    if (m.flag == MoveFlag::CastleQueenside)
        return "O-O-O";

    const Board& board = pos.board();
    const Piece mover = board.piece_at(m.from_sq);
    const bool capture = !board.is_empty(m.to_sq) || m.flag == MoveFlag::EnPassant;
    std::string san;

    if (mover.type == PieceType::Pawn) {
        if (capture) {
            san += file_char(m.from_sq);
        }
    } else {
        san += san_letter(mover.type);

        // Other pieces of the same kind that can also reach the target.
        bool ambiguous = false;
        bool same_file = false;
        bool same_rank = false;
        for (const Move& other : legal) {
            if (other.to_sq != m.to_sq || other.from_sq == m.from_sq ||
                board.piece_at(other.from_sq) != mover) {
                continue;
            }
            ambiguous = true;
            same_file |= file_of(other.from_sq) == file_of(m.from_sq);
            same_rank |= rank_of(other.from_sq) == rank_of(m.from_sq);
        }
        if (ambiguous) {
            if (!same_file) {
                san += file_char(m.from_sq);
            } else if (!same_rank) {
                san += rank_char(m.from_sq);
            } else {
                san += square_name(m.from_sq);
            }
        }
    }

    if (capture)
        san += 'x';
    san += square_name(m.to_sq);
    if (m.flag == MoveFlag::Promotion) {
        san += '=';
        san += san_letter(m.promotion);
    }
    return san;
}

std::string_view strip_annotations(std::string_view text) {
    while (!text.empty() &&
           (text.back() == '+' || text.back() == '#' || text.back() == '!' || text.back() == '?')) {
        text.remove_suffix(1);
    }
    return text;
}

PieceType piece_from_letter(char ch) noexcept {
    switch (ch) {
        case 'N': return PieceType::Knight;
        case 'B': return PieceType::Bishop;
        case 'R': return PieceType::Rook;
        case 'Q': return PieceType::Queen;
        case 'K': return PieceType::King;
        default: return PieceType::None;
    }
}

/// Looser SAN reading for hand-typed moves: extra disambiguation ("Ngf3"),
/// a promotion without '=' ("e8Q", "e8q"), a long form ("e2-e4") and an
/// absent capture mark are accepted. Returns the single legal move the text names, or a null move
/// when it names none or several.
Move match_loose_san(const Position& pos, std::string_view san, const MoveList& legal) {
    PieceType piece = PieceType::Pawn;
    if (!san.empty() && piece_from_letter(san.front()) != PieceType::None) {
        piece = piece_from_letter(san.front());
        san.remove_prefix(1);
    }

    PieceType promotion = PieceType::None;
    if (san.size() >= 3 && san[san.size() - 2] != 'x') {
        const char last = san.back();
        const char upper =
            (last >= 'a' && last <= 'z') ? static_cast<char>(last - 'a' + 'A') : last;
        const char before = san[san.size() - 2];
        if ((before == '=' || (before >= '1' && before <= '8')) &&
            piece_from_letter(upper) != PieceType::None) {
            promotion = piece_from_letter(upper);
            san.remove_suffix(before == '=' ? 2 : 1);
        }
    }

    if (san.size() < 2)
        return {};
    const Square target = parse_square(san.substr(san.size() - 2));
    if (target == kNoSquare)
        return {};
    san.remove_suffix(2);
    if (!san.empty() && (san.back() == 'x' || san.back() == '-'))
        san.remove_suffix(1);

    int from_file = -1;
    int from_rank = -1;
    for (const char ch : san) {
        if (ch >= 'a' && ch <= 'h' && from_file < 0) {
            from_file = ch - 'a';
        } else if (ch >= '1' && ch <= '8' && from_rank < 0) {
            from_rank = ch - '1';
        } else {
            return {};
        }
    }

    const Board& board = pos.board();
    Move found{};
    int matches = 0;
    for (const Move& m : legal) {
        if (m.is_castle() || m.to_sq != target || m.promotion != promotion ||
            board.piece_at(m.from_sq).type != piece) {
            continue;
        }
        if ((from_file >= 0 && file_of(m.from_sq) != from_file) ||
            (from_rank >= 0 && rank_of(m.from_sq) != from_rank)) {
            continue;
        }
        found = m;
        ++matches;
    }
    return matches == 1 ? found : Move{};
}

std::string_view trim(std::string_view text) {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\n' ||
                             text.back() == '\r')) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

Move resolve(const Position& pos, Move m) {
    for (const Move& candidate : legal_moves(pos)) {
        if (candidate.same_squares(m))
            return candidate;
    }
    throw IllegalMove("Illegal move " + m.uci() + " in " + pos.to_fen());
}

Position apply(const Position& pos, Move m) {
    return pos.apply(resolve(pos, m));
}

bool is_check(const Position& pos) {
    return pos.is_in_check();
}

bool is_checkmate(const Position& pos) {
    return pos.is_in_check() && legal_moves(pos).empty();
}

bool is_stalemate(const Position& pos) {
    return !pos.is_in_check() && legal_moves(pos).empty();
}

bool has_insufficient_material(const Position& pos) {
    const Board& board = pos.board();
    if (board.pieces(PieceType::Pawn) | board.pieces(PieceType::Rook) |
        board.pieces(PieceType::Queen)) {
        return false;
    }
    const Bitboard knights = board.pieces(PieceType::Knight);
    const Bitboard bishops = board.pieces(PieceType::Bishop);
    if (popcount(knights | bishops) <= 1)
        return true;
    if (knights)
        return false;
    return (bishops & kLightSquares) == 0 || (bishops & ~kLightSquares) == 0;
}

bool is_fifty_move_draw(const Position& pos) {
    return pos.halfmove_clock() >= kFiftyMoveHalfmoves && !is_checkmate(pos);
}

bool is_repetition_draw(const Position& pos) {
    return pos.repetition_count() >= 3;
}

std::string to_portable_notation(const Position& pos) {
    return pos.to_fen();
}

std::string move_to_notation(Move m) {
    return m.uci();
}

std::string move_to_san(const Position& pos, Move m) {
    std::string san = san_body(pos, m, legal_moves(pos));
    const Position next = pos.apply(m);
    if (next.is_in_check()) {
        san += legal_moves(next).empty() ? '#' : '+';
    }
    return san;
}

Move parse_move(const Position& pos, std::string_view text) {
    const std::string_view cleaned = strip_annotations(trim(text));
    if (cleaned.empty()) {
        throw IllegalMove("Empty move text");
    }
    const MoveList legal = legal_moves(pos);

    const Move uci = Move::from_uci(cleaned);
    if (!uci.is_null()) {
        for (const Move& m : legal) {
            if (m.same_squares(uci))
                return m;
        }
    }

    std::string wanted(cleaned);
    for (char& ch : wanted) {
        if (ch == '0')
            ch = 'O';  // "0-0" is common in hand-typed games
    }
    for (const Move& m : legal) {
        if (san_body(pos, m, legal) == wanted)
            return m;
    }
    const Move loose = match_loose_san(pos, wanted, legal);
    if (!loose.is_null())
        return loose;
    throw IllegalMove("Illegal or unrecognized move '" + std::string(text) + "' in " +
                      pos.to_fen());
}

}  // namespace kibitz::rules
