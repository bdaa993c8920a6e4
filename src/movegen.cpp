/// @file movegen.cpp
/// Move generation using bitboard set-wise pawn pushes and per-piece attack sets.

#include <chessreview/attacks.hpp>
#include <chessreview/movegen.hpp>

namespace chessreview::movegen {

namespace {

constexpr PieceType kPromotions[] = {PieceType::Queen, PieceType::Rook, PieceType::Bishop,
                                     PieceType::Knight};

/// Emit one move per target bit; `delta` is the signed distance from origin to target.
void emit_pawn_moves(MoveList& ml, Bitboard targets, int delta, Bitboard promo_rank,
                     MoveFlag flag = MoveFlag::Normal) {
    while (targets) {
        Square to = pop_lsb(targets);
        auto from = static_cast<Square>(to - delta);
        if (square_bb(to) & promo_rank) {
            for (PieceType pt : kPromotions) {
                ml.push({from, to, MoveFlag::Promotion, pt});
            }
        } else {
            ml.push({from, to, flag});
        }
    }
}

void gen_pawn_moves(const Position& pos, MoveList& ml) {
    const Color us = pos.side_to_move();
    const Color them = opposite(us);
    const Board& board = pos.board();
    const Bitboard pawns = board.pieces(us, PieceType::Pawn);
    const Bitboard empty = ~board.occupied_all();
    const Bitboard enemy = board.occupied(them);
    const bool white = us == Color::White;
    const Bitboard promo_rank = white ? kRank8 : kRank1;
    const int forward = white ? 8 : -8;

    Bitboard single = (white ? shift_north(pawns) : shift_south(pawns)) & empty;
    emit_pawn_moves(ml, single, forward, promo_rank);

    Bitboard mid_rank = white ? kRank3 : kRank6;
    Bitboard dbl = (white ? shift_north(single & mid_rank) : shift_south(single & mid_rank)) &
                   empty;
    emit_pawn_moves(ml, dbl, 2 * forward, kEmptyBB, MoveFlag::DoublePawn);

    // West-side and east-side captures.
    Bitboard cap_w = (white ? shift_nw(pawns) : shift_sw(pawns)) & enemy;
    emit_pawn_moves(ml, cap_w, white ? 7 : -9, promo_rank);
    Bitboard cap_e = (white ? shift_ne(pawns) : shift_se(pawns)) & enemy;
    emit_pawn_moves(ml, cap_e, white ? 9 : -7, promo_rank);

    if (pos.en_passant() != kNoSquare) {
        Square ep = pos.en_passant();
        Bitboard ep_attackers = pawn_attacks(them, ep) & pawns;
        while (ep_attackers) {
            ml.push({pop_lsb(ep_attackers), ep, MoveFlag::EnPassant});
        }
    }
}

void gen_piece_moves(const Position& pos, MoveList& ml) {
    const Color us = pos.side_to_move();
    const Bitboard friendly = pos.board().occupied(us);
    Bitboard pieces = friendly & ~pos.board().pieces(us, PieceType::Pawn);

    while (pieces) {
        Square from = pop_lsb(pieces);
        Bitboard targets = pos.attacks_from(from) & ~friendly;
        while (targets) {
            ml.push({from, pop_lsb(targets)});
        }
    }
}

void gen_castling(const Position& pos, MoveList& ml) {
    const Color us = pos.side_to_move();
    const Color them = opposite(us);
    const Board& board = pos.board();
    const Square king_sq = board.king_square(us);
    const int rank = (us == Color::White) ? 0 : 7;

    if (king_sq != make_square(4, rank) || pos.is_square_attacked(king_sq, them))
        return;

    const Piece rook{us, PieceType::Rook};
    auto clear_and_safe = [&](int rook_file, int empty_from, int empty_to, int safe_from,
                              int safe_to) {
        if (board.piece_at(make_square(rook_file, rank)) != rook) return false;
        for (int f = empty_from; f <= empty_to; ++f) {
            if (!board.is_empty(make_square(f, rank))) return false;
        }
        for (int f = safe_from; f <= safe_to; ++f) {
            if (pos.is_square_attacked(make_square(f, rank), them)) return false;
        }
        return true;
    };

    CastlingRights ks = (us == Color::White) ? kWhiteKingside : kBlackKingside;
    if ((pos.castling() & ks) && clear_and_safe(7, 5, 6, 5, 6)) {
        ml.push({king_sq, make_square(6, rank), MoveFlag::CastleKingside});
    }

    CastlingRights qs = (us == Color::White) ? kWhiteQueenside : kBlackQueenside;
    if ((pos.castling() & qs) && clear_and_safe(0, 1, 3, 2, 3)) {
        ml.push({king_sq, make_square(2, rank), MoveFlag::CastleQueenside});
    }
}

}  // namespace

// ── Public API ──────────────────────────────────────────────────────────────

MoveList pseudo_legal(const Position& pos) {
    MoveList ml;
    gen_pawn_moves(pos, ml);
    gen_piece_moves(pos, ml);
    gen_castling(pos, ml);
    return ml;
}

MoveList legal(Position& pos) {
    MoveList pseudo = pseudo_legal(pos);
    MoveList result;
    Color us = pos.side_to_move();

    for (const Move& m : pseudo) {
        pos.make_move(m);
        if (!pos.is_in_check(us)) {
            result.push(m);
        }
        pos.unmake_move(m);
    }
    return result;
}

std::uint64_t perft(Position& pos, int depth) {
    if (depth == 0)
        return 1;

    MoveList moves = legal(pos);
    if (depth == 1)
        return static_cast<std::uint64_t>(moves.size());

    std::uint64_t nodes = 0;
    for (const Move& m : moves) {
        pos.make_move(m);
        nodes += perft(pos, depth - 1);
        pos.unmake_move(m);
    }
    return nodes;
}

}  // namespace chessreview::movegen
