/// @file position.cpp
/// FEN parsing and validation, move application, attack queries.

#include <kibitz/position.hpp>

#include <kibitz/attacks.hpp>
#include <kibitz/errors.hpp>
#include <kibitz/init.hpp>
#include <kibitz/zobrist.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <string>
#include <vector>

namespace kibitz {

namespace {

std::vector<std::string_view> split_fields(std::string_view sv) {
    std::vector<std::string_view> fields;
    std::size_t i = 0;
    while (i < sv.size()) {
        while (i < sv.size() && sv[i] == ' ') ++i;
        if (i >= sv.size())
            break;
        std::size_t start = i;
        while (i < sv.size() && sv[i] != ' ') ++i;
        fields.push_back(sv.substr(start, i - start));
    }
    return fields;
}

int parse_clock(std::string_view sv, int min_val) {
    int val = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), val);
    if (ec != std::errc{} || ptr != sv.data() + sv.size() || val < min_val) {
        throw InvalidPosition("Invalid clock in FEN: " + std::string(sv));
    }
    return val;
}

/// Castling rights that survive a move touching `sq` (as origin or target).
constexpr std::array<CastlingRights, 64> make_castle_keep_masks() noexcept {
    std::array<CastlingRights, 64> masks{};
    for (auto& m : masks) m = kCastlingAll;
    masks[A1] = static_cast<CastlingRights>(kCastlingAll ^ kWhiteQueenside);
    masks[H1] = static_cast<CastlingRights>(kCastlingAll ^ kWhiteKingside);
    masks[E1] = static_cast<CastlingRights>(kCastlingAll ^ kWhiteBoth);
    masks[A8] = static_cast<CastlingRights>(kCastlingAll ^ kBlackQueenside);
    masks[H8] = static_cast<CastlingRights>(kCastlingAll ^ kBlackKingside);
    masks[E8] = static_cast<CastlingRights>(kCastlingAll ^ kBlackBoth);
    return masks;
}

constexpr auto kCastleKeep = make_castle_keep_masks();

}  // namespace

// ── Construction ────────────────────────────────────────────────────────────

Position Position::initial() {
    return from_fen(kStartingFen);
}

Position Position::from_fen(std::string_view fen) {
    init();  // validation below needs the slider tables

    auto fields = split_fields(fen);
    if (fields.size() < 4 || fields.size() > 6) {
        throw InvalidPosition("Invalid FEN (need 4-6 fields): " + std::string(fen));
    }

    Position pos;

    int rank = 7;
    int file = 0;
    for (char ch : fields[0]) {
        if (ch == '/') {
            if (file != 8 || rank == 0) {
                throw InvalidPosition("Invalid FEN board layout: " + std::string(fen));
            }
            --rank;
            file = 0;
        } else if (ch >= '1' && ch <= '8') {
            file += ch - '0';
            if (file > 8) {
                throw InvalidPosition("Invalid FEN rank width: " + std::string(fen));
            }
        } else {
            Piece p = Piece::from_fen_char(ch);
            if (p.is_none()) {
                throw InvalidPosition(std::string("Invalid FEN piece char: ") + ch);
            }
            if (file >= 8) {
                throw InvalidPosition("Invalid FEN rank width: " + std::string(fen));
            }
            pos.board_.put_piece(make_square(file, rank), p);
            ++file;
        }
    }
    if (rank != 0 || file != 8) {
        throw InvalidPosition("Invalid FEN board layout: " + std::string(fen));
    }

    if (fields[1] == "w") {
        pos.side_to_move_ = Color::White;
    } else if (fields[1] == "b") {
        pos.side_to_move_ = Color::Black;
    } else {
        throw InvalidPosition("Invalid FEN side to move: " + std::string(fields[1]));
    }

    if (fields[2] != "-") {
        for (char ch : fields[2]) {
            switch (ch) {
                case 'K':
                    pos.castling_ |= kWhiteKingside;
                    break;
                case 'Q':
                    pos.castling_ |= kWhiteQueenside;
                    break;
                case 'k':
                    pos.castling_ |= kBlackKingside;
                    break;
                case 'q':
                    pos.castling_ |= kBlackQueenside;
                    break;
                default:
                    throw InvalidPosition(std::string("Invalid FEN castling char: ") + ch);
            }
        }
    }

    if (fields[3] != "-") {
        pos.en_passant_ = parse_square(fields[3]);
        if (pos.en_passant_ == kNoSquare) {
            throw InvalidPosition("Invalid FEN en passant square: " + std::string(fields[3]));
        }
    }

    pos.halfmove_clock_ = fields.size() > 4 ? parse_clock(fields[4], 0) : 0;
    pos.fullmove_number_ = fields.size() > 5 ? parse_clock(fields[5], 1) : 1;

    pos.validate();
    pos.key_ = pos.compute_key();
    return pos;
}

void Position::validate() const {
    for (Color c : {Color::White, Color::Black}) {
        if (board_.count(c, PieceType::King) != 1) {
            throw InvalidPosition("Each side needs exactly one king: " + to_fen());
        }
    }
    if (board_.pieces(PieceType::Pawn) & (kRank1 | kRank8)) {
        throw InvalidPosition("Pawn on first or last rank: " + to_fen());
    }
    if (is_in_check(opposite(side_to_move_))) {
        throw InvalidPosition("Side not to move is in check: " + to_fen());
    }

    struct CastleRequirement {
        CastlingRights right;
        Square king;
        Square rook;
        Color color;
    };
    constexpr CastleRequirement kRequirements[] = {
        {kWhiteKingside, E1, H1, Color::White},
        {kWhiteQueenside, E1, A1, Color::White},
        {kBlackKingside, E8, H8, Color::Black},
        {kBlackQueenside, E8, A8, Color::Black},
    };
    for (const auto& req : kRequirements) {
        if (!(castling_ & req.right))
            continue;
        if (board_.piece_at(req.king) != Piece{req.color, PieceType::King} ||
            board_.piece_at(req.rook) != Piece{req.color, PieceType::Rook}) {
            throw InvalidPosition("Castling right without king and rook at home: " + to_fen());
        }
    }

    if (en_passant_ != kNoSquare) {
        // The target sits behind a pawn that just made a double step.
        const int expected_rank = side_to_move_ == Color::White ? 5 : 2;
        const int pawn_rank = side_to_move_ == Color::White ? 4 : 3;
        const Square pawn_sq = make_square(file_of(en_passant_), pawn_rank);
        if (rank_of(en_passant_) != expected_rank || !board_.is_empty(en_passant_) ||
            board_.piece_at(pawn_sq) != Piece{opposite(side_to_move_), PieceType::Pawn}) {
            throw InvalidPosition("Inconsistent en passant square: " + to_fen());
        }
    }
}

// ── Serialization ───────────────────────────────────────────────────────────

std::string Position::to_fen() const {
    std::string fen;
    fen.reserve(90);

    for (int rank = 7; rank >= 0; --rank) {
        int empty = 0;
        for (int file = 0; file < 8; ++file) {
            Piece p = board_.piece_at(make_square(file, rank));
            if (p.is_none()) {
                ++empty;
                continue;
            }
            if (empty > 0) {
                fen += static_cast<char>('0' + empty);
                empty = 0;
            }
            fen += p.fen_char();
        }
        if (empty > 0)
            fen += static_cast<char>('0' + empty);
        if (rank > 0)
            fen += '/';
    }

    fen += side_to_move_ == Color::White ? " w " : " b ";

    if (castling_ == kCastlingNone) {
        fen += '-';
    } else {
        if (castling_ & kWhiteKingside) fen += 'K';
        if (castling_ & kWhiteQueenside) fen += 'Q';
        if (castling_ & kBlackKingside) fen += 'k';
        if (castling_ & kBlackQueenside) fen += 'q';
    }

    fen += ' ';
    fen += en_passant_ == kNoSquare ? std::string("-") : square_name(en_passant_);
    fen += ' ' + std::to_string(halfmove_clock_) + ' ' + std::to_string(fullmove_number_);
    return fen;
}

// ── Move application ────────────────────────────────────────────────────────

Position Position::apply(Move m) const {
    Position next = *this;
    Board& board = next.board_;
    const Piece mover = board.piece_at(m.from_sq);
    const int home_rank = rank_of(m.from_sq);

    Square capture_sq = m.to_sq;
    if (m.flag == MoveFlag::EnPassant) {
        capture_sq = make_square(file_of(m.to_sq), home_rank);
    }
    const bool is_capture = !board.is_empty(capture_sq);
    if (is_capture) {
        board.remove_piece(capture_sq);
    }

    board.remove_piece(m.from_sq);
    board.put_piece(m.to_sq, m.flag == MoveFlag::Promotion ? Piece{mover.color, m.promotion} : mover);

    if (m.flag == MoveFlag::CastleKingside || m.flag == MoveFlag::CastleQueenside) {
        const bool kingside = m.flag == MoveFlag::CastleKingside;
        const Square rook_from = make_square(kingside ? 7 : 0, home_rank);
        const Square rook_to = make_square(kingside ? 5 : 3, home_rank);
        const Piece rook = board.piece_at(rook_from);
        board.remove_piece(rook_from);
        board.put_piece(rook_to, rook);
    }

    next.en_passant_ = kNoSquare;
    if (m.flag == MoveFlag::DoublePawn) {
        next.en_passant_ = make_square(file_of(m.from_sq), (home_rank + rank_of(m.to_sq)) / 2);
    }
    next.castling_ = castling_ & kCastleKeep[m.from_sq] & kCastleKeep[m.to_sq];

    const bool irreversible = mover.type == PieceType::Pawn || is_capture;
    next.halfmove_clock_ = irreversible ? 0 : halfmove_clock_ + 1;
    if (side_to_move_ == Color::Black) {
        ++next.fullmove_number_;
    }
    next.side_to_move_ = opposite(side_to_move_);

    if (irreversible) {
        next.earlier_keys_.clear();
    } else {
        next.earlier_keys_.push_back(key_);
    }
    next.key_ = next.compute_key();
    return next;
}

// ── Attack queries ──────────────────────────────────────────────────────────

int Position::attacker_count(Square sq, Color by) const noexcept {
    const Bitboard occ = board_.occupied_all();
    const Bitboard diagonal = board_.pieces(by, PieceType::Bishop) | board_.pieces(by, PieceType::Queen);
    const Bitboard straight = board_.pieces(by, PieceType::Rook) | board_.pieces(by, PieceType::Queen);

    Bitboard attackers = attacks::pawn(opposite(by), sq) & board_.pieces(by, PieceType::Pawn);
    attackers |= attacks::knight(sq) & board_.pieces(by, PieceType::Knight);
    attackers |= attacks::king(sq) & board_.pieces(by, PieceType::King);
    attackers |= attacks::bishop(sq, occ) & diagonal;
    attackers |= attacks::rook(sq, occ) & straight;
    return popcount(attackers);
}

bool Position::is_square_attacked(Square sq, Color by) const noexcept {
    return attacker_count(sq, by) > 0;
}

bool Position::is_in_check(Color c) const noexcept {
    const Square king = board_.king_square(c);
    return king != kNoSquare && is_square_attacked(king, opposite(c));
}

// ── Repetition ──────────────────────────────────────────────────────────────

int Position::repetition_count() const noexcept {
    return 1 + static_cast<int>(std::count(earlier_keys_.begin(), earlier_keys_.end(), key_));
}

bool Position::same_state(const Position& other) const noexcept {
    // The key covers the en passant square only when a pawn can capture on it.
    return key_ == other.key_ && board_ == other.board_ && side_to_move_ == other.side_to_move_ &&
           castling_ == other.castling_ && halfmove_clock_ == other.halfmove_clock_ &&
           fullmove_number_ == other.fullmove_number_;
}

std::uint64_t Position::compute_key() const noexcept {
    std::uint64_t key = zobrist::castling_key(castling_);
    if (side_to_move_ == Color::Black) {
        key ^= zobrist::black_to_move_key();
    }
    // Only an en passant square that can actually be captured on changes the state.
    if (en_passant_ != kNoSquare &&
        (attacks::pawn(opposite(side_to_move_), en_passant_) &
         board_.pieces(side_to_move_, PieceType::Pawn))) {
        key ^= zobrist::en_passant_key(en_passant_);
    }
    Bitboard occ = board_.occupied_all();
    while (occ) {
        Square sq = pop_lsb(occ);
        key ^= zobrist::piece_key(board_.piece_at(sq), sq);
    }
    return key;
}

}  // namespace kibitz
