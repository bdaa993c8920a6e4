/// @file test_board.cpp
/// Tests for board.hpp: placement, removal and the bitboard/mailbox views.

#include <chessreview/board.hpp>

#include <gtest/gtest.h>

using namespace chessreview;

// ── Placement ───────────────────────────────────────────────────────────────

TEST(Board, DefaultIsEmpty) {
    Board b;
    EXPECT_EQ(b.occupied_all(), kEmptyBB);
    for (Square sq = 0; sq < 64; ++sq) {
        EXPECT_TRUE(b.is_empty(sq)) << square_name(sq);
    }
    EXPECT_EQ(b.king_square(Color::White), kNoSquare);
    EXPECT_EQ(b.king_square(Color::Black), kNoSquare);
}

TEST(Board, PutPieceUpdatesAllViews) {
    Board b;
    const Piece wn{Color::White, PieceType::Knight};
    b.put_piece(F3, wn);

    EXPECT_EQ(b.piece_at(F3), wn);
    EXPECT_FALSE(b.is_empty(F3));
    EXPECT_EQ(b.pieces(Color::White, PieceType::Knight), square_bb(F3));
    EXPECT_EQ(b.occupied(Color::White), square_bb(F3));
    EXPECT_EQ(b.occupied(Color::Black), kEmptyBB);
}

TEST(Board, RemovePiece) {
    Board b;
    b.put_piece(D8, Piece{Color::Black, PieceType::Queen});
    b.put_piece(E8, Piece{Color::Black, PieceType::King});
    b.remove_piece(D8);

    EXPECT_EQ(b.piece_at(D8), kNoPiece);
    EXPECT_EQ(b.pieces(Color::Black, PieceType::Queen), kEmptyBB);
    EXPECT_EQ(b.occupied(Color::Black), square_bb(E8));
}

TEST(Board, KingSquare) {
    Board b;
    b.put_piece(G1, Piece{Color::White, PieceType::King});
    b.put_piece(C7, Piece{Color::Black, PieceType::King});
    EXPECT_EQ(b.king_square(Color::White), G1);
    EXPECT_EQ(b.king_square(Color::Black), C7);
}

// ── Comparison ──────────────────────────────────────────────────────────────

TEST(Board, EqualityFollowsContents) {
    Board a;
    Board b;
    a.put_piece(A2, Piece{Color::White, PieceType::Pawn});
    EXPECT_FALSE(a == b);
    b.put_piece(A2, Piece{Color::White, PieceType::Pawn});
    EXPECT_TRUE(a == b);
    a.clear();
    b.remove_piece(A2);
    EXPECT_TRUE(a == b);
}
