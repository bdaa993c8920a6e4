/// @file test_bitboard.cpp
/// Tests for bitboard.hpp: bit operations, shifts and leaper tables.

#include <chessreview/bitboard.hpp>

#include <gtest/gtest.h>

using namespace chessreview;

// ── Bit operations ──────────────────────────────────────────────────────────

TEST(Bitboard, ScanForwardAndBackward) {
    Bitboard bb = square_bb(C3) | square_bb(F6) | square_bb(A8);
    EXPECT_EQ(popcount(bb), 3);
    EXPECT_EQ(lsb(bb), C3);
    EXPECT_EQ(msb(bb), A8);
    EXPECT_EQ(pop_lsb(bb), C3);
    EXPECT_EQ(pop_lsb(bb), F6);
    EXPECT_EQ(bb, square_bb(A8));
}

TEST(Bitboard, SetAndClear) {
    Bitboard bb = kEmptyBB;
    set_bit(bb, D4);
    EXPECT_TRUE(test_bit(bb, D4));
    clear_bit(bb, D4);
    EXPECT_EQ(bb, kEmptyBB);
}

// ── Shifts ──────────────────────────────────────────────────────────────────

TEST(Bitboard, ShiftsDropWrappedSquares) {
    EXPECT_EQ(shift_north(square_bb(E4)), square_bb(E5));
    EXPECT_EQ(shift_south(square_bb(E1)), kEmptyBB);
    EXPECT_EQ(shift_ne(square_bb(H4)), kEmptyBB);
    EXPECT_EQ(shift_nw(square_bb(A4)), kEmptyBB);
    EXPECT_EQ(shift_se(square_bb(D5)), square_bb(E4));
    EXPECT_EQ(shift_sw(square_bb(D5)), square_bb(C4));
}

// ── Leaper tables ───────────────────────────────────────────────────────────

TEST(Bitboard, KnightAttacks) {
    EXPECT_EQ(popcount(knight_attacks(E4)), 8);
    EXPECT_EQ(knight_attacks(A1), square_bb(B3) | square_bb(C2));
    EXPECT_EQ(popcount(knight_attacks(H8)), 2);
    EXPECT_FALSE(test_bit(knight_attacks(H1), A3));
}

TEST(Bitboard, KingAttacks) {
    EXPECT_EQ(popcount(king_attacks(E4)), 8);
    EXPECT_EQ(popcount(king_attacks(A1)), 3);
    EXPECT_FALSE(test_bit(king_attacks(H4), A5));
}

TEST(Bitboard, PawnAttacksByColor) {
    EXPECT_EQ(pawn_attacks(Color::White, E4), square_bb(D5) | square_bb(F5));
    EXPECT_EQ(pawn_attacks(Color::Black, E4), square_bb(D3) | square_bb(F3));
    EXPECT_EQ(pawn_attacks(Color::White, A2), square_bb(B3));
    EXPECT_EQ(pawn_attacks(Color::Black, H7), square_bb(G6));
}
