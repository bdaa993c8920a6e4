/// @file position.cpp
/// Position implementation: constructors, FEN, make/unmake, attack queries.

#include <chessreview/position.hpp>

#include <chessreview/attacks.hpp>
#include <chessreview/movegen.hpp>

#include <charconv>
#include <stdexcept>
#include <string>
#include <vector>

namespace chessreview {

// ── Helpers ─────────────────────────────────────────────────────────────────

namespace {

auto split_spaces(std::string_view sv) -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    std::size_t i = 0;
    while (i < sv.size()) {
        while (i < sv.size() && sv[i] == ' ') ++i;
        if (i >= sv.size()) break;
        std::size_t start = i;
        while (i < sv.size() && sv[i] != ' ') ++i;
        parts.push_back(sv.substr(start, i - start));
    }
    return parts;
}

int parse_int(std::string_view sv, int min_val) {
    int val = 0;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), val);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        throw std::invalid_argument("Invalid integer in FEN: " + std::string(sv));
    }
    if (val < min_val) {
        throw std::invalid_argument("Integer out of range in FEN: " + std::string(sv));
    }
    return val;
}

Board parse_placement(std::string_view placement, std::string_view fen) {
    Board board;
    int rank = 7;
    int file = 0;

    for (char ch : placement) {
        if (ch == '/') {
            if (file != 8 || rank == 0) {
                throw std::invalid_argument("Invalid FEN board placement: " + std::string(fen));
            }
            --rank;
            file = 0;
        } else if (ch >= '1' && ch <= '8') {
            file += ch - '0';
            if (file > 8) {
                throw std::invalid_argument("Invalid FEN rank width: " + std::string(fen));
            }
        } else {
            Piece p = Piece::from_fen_char(ch);
            if (p.type == PieceType::None) {
                throw std::invalid_argument(std::string("Invalid FEN piece char: ") + ch);
            }
            if (file >= 8) {
                throw std::invalid_argument("Invalid FEN rank width: " + std::string(fen));
            }
            board.put_piece(make_square(file, rank), p);
            ++file;
        }
    }
    if (rank != 0 || file != 8) {
        throw std::invalid_argument("Invalid FEN board placement: " + std::string(fen));
    }
    return board;
}

}  // namespace

// ── Constructors ────────────────────────────────────────────────────────────

Position::Position(Board board, Color side, CastlingRights castling, Square ep, int halfmove,
                   int fullmove)
    : board_(board),
      side_to_move_(side),
      castling_(castling),
      en_passant_(ep),
      halfmove_clock_(halfmove),
      fullmove_number_(fullmove) {}

Position::Position() = default;

Position Position::initial() {
    return from_fen(kStartingFen);
}

Position Position::from_fen(std::string_view fen) {
    auto parts = split_spaces(fen);
    if (parts.size() < 4 || parts.size() > 6) {
        throw std::invalid_argument("Invalid FEN (need 4-6 fields): " + std::string(fen));
    }

    Board board = parse_placement(parts[0], fen);

    Color side = Color::White;
    if (parts[1] == "b") {
        side = Color::Black;
    } else if (parts[1] != "w") {
        throw std::invalid_argument("Invalid FEN side-to-move: " + std::string(parts[1]));
    }

    CastlingRights castling = kCastlingNone;
    if (parts[2] != "-") {
        for (char ch : parts[2]) {
            switch (ch) {
                case 'K':
                    castling |= kWhiteKingside;
                    break;
                case 'Q':
                    castling |= kWhiteQueenside;
                    break;
                case 'k':
                    castling |= kBlackKingside;
                    break;
                case 'q':
                    castling |= kBlackQueenside;
                    break;
                default:
                    throw std::invalid_argument(
                        std::string("Invalid castling char in FEN: ") + ch);
            }
        }
    }

    Square ep = kNoSquare;
    if (parts[3] != "-") {
        ep = parse_square(parts[3]);
        if (ep == kNoSquare) {
            throw std::invalid_argument("Invalid FEN en-passant square: " +
                                        std::string(parts[3]));
        }
    }

    int halfmove = (parts.size() > 4) ? parse_int(parts[4], 0) : 0;
    int fullmove = (parts.size() > 5) ? parse_int(parts[5], 1) : 1;

    return Position(board, side, castling, ep, halfmove, fullmove);
}

// ── Serialization ───────────────────────────────────────────────────────────

std::string Position::to_fen() const {
    std::string fen;
    fen.reserve(80);

    for (int rank = 7; rank >= 0; --rank) {
        if (rank < 7) fen += '/';
        int empty = 0;
        for (int file = 0; file < 8; ++file) {
            Piece p = board_.piece_at(make_square(file, rank));
            if (p == kNoPiece) {
                ++empty;
                continue;
            }
            if (empty > 0) {
                fen += static_cast<char>('0' + empty);
                empty = 0;
            }
            fen += p.fen_char();
        }
        if (empty > 0) fen += static_cast<char>('0' + empty);
    }

    fen += (side_to_move_ == Color::White) ? " w " : " b ";

    if (castling_ == kCastlingNone) {
        fen += '-';
    } else {
        if (castling_ & kWhiteKingside) fen += 'K';
        if (castling_ & kWhiteQueenside) fen += 'Q';
        if (castling_ & kBlackKingside) fen += 'k';
        if (castling_ & kBlackQueenside) fen += 'q';
    }

    fen += ' ';
    fen += (en_passant_ == kNoSquare) ? std::string("-") : square_name(en_passant_);
    fen += ' ' + std::to_string(halfmove_clock_) + ' ' + std::to_string(fullmove_number_);
    return fen;
}

// ── Move operations ─────────────────────────────────────────────────────────

void Position::make_move(Move m) {
    Piece piece = board_.piece_at(m.from_sq);
    Piece captured = captured_piece(m);
    Square capture_sq = m.to_sq;
    if (m.flag == MoveFlag::EnPassant) {
        capture_sq = make_square(file_of(m.to_sq), rank_of(m.from_sq));
    }

    history_.push_back({castling_, en_passant_, halfmove_clock_, captured});

    board_.remove_piece(m.from_sq);
    if (captured != kNoPiece) {
        board_.remove_piece(capture_sq);
    }

    Piece placed = piece;
    if (m.flag == MoveFlag::Promotion && m.promotion != PieceType::None) {
        placed = Piece{piece.color, m.promotion};
    }
    board_.put_piece(m.to_sq, placed);
    slide_castling_rook(m, false);

    if (m.flag == MoveFlag::DoublePawn) {
        en_passant_ =
            make_square(file_of(m.from_sq), (rank_of(m.from_sq) + rank_of(m.to_sq)) / 2);
    } else {
        en_passant_ = kNoSquare;
    }

    castling_ = castling_ & detail::kCastleMask[m.from_sq] & detail::kCastleMask[m.to_sq];

    if (piece.type == PieceType::Pawn || captured != kNoPiece) {
        halfmove_clock_ = 0;
    } else {
        ++halfmove_clock_;
    }
    if (side_to_move_ == Color::Black) {
        ++fullmove_number_;
    }
    side_to_move_ = opposite(side_to_move_);
}

void Position::unmake_move(Move m) {
    UndoInfo undo = history_.back();
    history_.pop_back();

    side_to_move_ = opposite(side_to_move_);
    if (side_to_move_ == Color::Black) {
        --fullmove_number_;
    }

    Piece placed = board_.piece_at(m.to_sq);
    Piece original = placed;
    if (m.flag == MoveFlag::Promotion) {
        original = Piece{placed.color, PieceType::Pawn};
    }
    board_.remove_piece(m.to_sq);
    board_.put_piece(m.from_sq, original);

    if (undo.captured != kNoPiece) {
        Square capture_sq = m.to_sq;
        if (m.flag == MoveFlag::EnPassant) {
            capture_sq = make_square(file_of(m.to_sq), rank_of(m.from_sq));
        }
        board_.put_piece(capture_sq, undo.captured);
    }
    slide_castling_rook(m, true);

    castling_ = undo.castling;
    en_passant_ = undo.en_passant;
    halfmove_clock_ = undo.halfmove_clock;
}

void Position::slide_castling_rook(Move m, bool undo) {
    if (!m.is_castle()) return;
    int r = rank_of(m.from_sq);
    bool kingside = m.flag == MoveFlag::CastleKingside;
    Square home = make_square(kingside ? 7 : 0, r);
    Square castled = make_square(kingside ? 5 : 3, r);
    Square from = undo ? castled : home;
    Square to = undo ? home : castled;
    Piece rook = board_.piece_at(from);
    board_.remove_piece(from);
    board_.put_piece(to, rook);
}

// ── Attack queries ──────────────────────────────────────────────────────────

Bitboard Position::attackers(Square sq, Color by) const noexcept {
    Bitboard occ = board_.occupied_all();

    // A pawn of `by` attacks `sq` iff it sits where an opposite-colored pawn on `sq` would attack.
    Bitboard result = pawn_attacks(opposite(by), sq) & board_.pieces(by, PieceType::Pawn);
    result |= knight_attacks(sq) & board_.pieces(by, PieceType::Knight);
    result |= king_attacks(sq) & board_.pieces(by, PieceType::King);

    Bitboard queens = board_.pieces(by, PieceType::Queen);
    result |= bishop_attacks(sq, occ) & (board_.pieces(by, PieceType::Bishop) | queens);
    result |= rook_attacks(sq, occ) & (board_.pieces(by, PieceType::Rook) | queens);
    return result;
}

Bitboard Position::attacks_from(Square sq) const noexcept {
    Piece p = board_.piece_at(sq);
    Bitboard occ = board_.occupied_all();
    switch (p.type) {
        case PieceType::Pawn:
            return pawn_attacks(p.color, sq);
        case PieceType::Knight:
            return knight_attacks(sq);
        case PieceType::Bishop:
            return bishop_attacks(sq, occ);
        case PieceType::Rook:
            return rook_attacks(sq, occ);
        case PieceType::Queen:
            return queen_attacks(sq, occ);
        case PieceType::King:
            return king_attacks(sq);
        default:
            return kEmptyBB;
    }
}

bool Position::is_in_check() const noexcept {
    return is_in_check(side_to_move_);
}

bool Position::is_in_check(Color c) const noexcept {
    Square king = board_.king_square(c);
    return king != kNoSquare && is_square_attacked(king, opposite(c));
}

// ── Move queries ────────────────────────────────────────────────────────────

Piece Position::captured_piece(Move m) const noexcept {
    if (m.flag == MoveFlag::EnPassant) {
        return board_.piece_at(make_square(file_of(m.to_sq), rank_of(m.from_sq)));
    }
    if (m.is_castle()) {
        return kNoPiece;
    }
    return board_.piece_at(m.to_sq);
}

bool Position::gives_check(Move m) const {
    Position after = *this;
    after.make_move(m);
    return after.is_in_check();
}

bool Position::is_checkmate() {
    return is_in_check() && movegen::legal(*this).empty();
}

bool Position::is_stalemate() {
    return !is_in_check() && movegen::legal(*this).empty();
}

}  // namespace chessreview
