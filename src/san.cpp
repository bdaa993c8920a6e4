/// @file san.cpp
/// SAN generation with disambiguation, and SAN/UCI parsing by matching legal moves.

#include <chessreview/san.hpp>

#include <chessreview/movegen.hpp>

#include <cctype>

namespace chessreview::san {

namespace {

constexpr char piece_letter(PieceType pt) noexcept {
    constexpr char kLetters[] = {'\0', '\0', 'N', 'B', 'R', 'Q', 'K'};
    return kLetters[static_cast<int>(pt)];
}

PieceType promotion_from_char(char c) noexcept {
    switch (std::tolower(static_cast<unsigned char>(c))) {
        case 'q':
            return PieceType::Queen;
        case 'r':
            return PieceType::Rook;
        case 'b':
            return PieceType::Bishop;
        case 'n':
            return PieceType::Knight;
        default:
            return PieceType::None;
    }
}

/// Strip whitespace, check/mate marks and annotation glyphs; map zero-castling to letters.
std::string normalize(std::string_view in) {
    std::size_t a = 0;
    std::size_t b = in.size();
    while (a < b && std::isspace(static_cast<unsigned char>(in[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(in[b - 1]))) --b;
    std::string s(in.substr(a, b - a));

    while (!s.empty()) {
        char c = s.back();
        if (c != '+' && c != '#' && c != '!' && c != '?') break;
        s.pop_back();
    }
    if (s == "0-0") s = "O-O";
    if (s == "0-0-0") s = "O-O-O";
    return s;
}

bool is_uci_like(std::string_view t) {
    if (t.size() != 4 && t.size() != 5) return false;
    if (parse_square(t.substr(0, 2)) == kNoSquare || parse_square(t.substr(2, 2)) == kNoSquare)
        return false;
    return t.size() == 4 || promotion_from_char(t[4]) != PieceType::None;
}

std::string disambiguation(const Position& pos, const MoveList& legal_moves, Move m) {
    const Piece mover = pos.piece_at(m.from_sq);
    bool ambiguous = false;
    bool same_file = false;
    bool same_rank = false;

    for (const Move& other : legal_moves) {
        if (other.to_sq != m.to_sq || other.from_sq == m.from_sq) continue;
        if (pos.piece_at(other.from_sq) != mover) continue;
        ambiguous = true;
        same_file |= file_of(other.from_sq) == file_of(m.from_sq);
        same_rank |= rank_of(other.from_sq) == rank_of(m.from_sq);
    }

    if (!ambiguous) return {};
    std::string from = square_name(m.from_sq);
    if (!same_file) return from.substr(0, 1);
    if (!same_rank) return from.substr(1, 1);
    return from;
}

}  // namespace

std::string to_san(const Position& pos, Move m) {
    Position work = pos;
    const MoveList legal_moves = movegen::legal(work);

    bool is_legal = false;
    for (const Move& candidate : legal_moves) {
        if (candidate == m) {
            is_legal = true;
            break;
        }
    }
    if (!is_legal) return {};

    std::string out;
    const PieceType pt = pos.piece_at(m.from_sq).type;

    if (m.flag == MoveFlag::CastleKingside) {
        out = "O-O";
    } else if (m.flag == MoveFlag::CastleQueenside) {
        out = "O-O-O";
    } else {
        const bool capture = pos.is_capture(m);
        if (pt == PieceType::Pawn) {
            if (capture) out += static_cast<char>('a' + file_of(m.from_sq));
        } else {
            out += piece_letter(pt);
            out += disambiguation(pos, legal_moves, m);
        }
        if (capture) out += 'x';
        out += square_name(m.to_sq);
        if (m.promotion != PieceType::None) {
            out += '=';
            out += piece_letter(m.promotion);
        }
    }

    work.make_move(m);
    if (work.is_in_check()) {
        out += movegen::legal(work).empty() ? '#' : '+';
    }
    return out;
}

std::optional<Move> from_san(const Position& pos, std::string_view text) {
    const std::string token = normalize(text);
    if (token.empty()) return std::nullopt;

    Position work = pos;
    const MoveList legal_moves = movegen::legal(work);

    if (is_uci_like(token)) {
        Square from = parse_square(std::string_view(token).substr(0, 2));
        Square to = parse_square(std::string_view(token).substr(2, 2));
        PieceType promo = token.size() == 5 ? promotion_from_char(token[4]) : PieceType::None;
        for (const Move& m : legal_moves) {
            if (m.from_sq == from && m.to_sq == to && m.promotion == promo) return m;
        }
        return std::nullopt;
    }

    for (const Move& m : legal_moves) {
        if (normalize(to_san(pos, m)) == token) return m;
    }
    return std::nullopt;
}

}  // namespace chessreview::san
