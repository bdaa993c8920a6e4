/// @file test_attacks.cpp
/// Tests for attacks.hpp: directions, line geometry and ray-scanned slider attacks.

#include <chessreview/attacks.hpp>

#include <gtest/gtest.h>

using namespace chessreview;

// ── Geometry ────────────────────────────────────────────────────────────────

TEST(Attacks, StepStopsAtEdges) {
    EXPECT_EQ(step(E4, Direction::NorthEast), F5);
    EXPECT_EQ(step(H4, Direction::East), kNoSquare);
    EXPECT_EQ(step(A5, Direction::SouthWest), kNoSquare);
    EXPECT_EQ(step(H8, Direction::North), kNoSquare);
    EXPECT_EQ(step(A1, Direction::South), kNoSquare);
}

TEST(Attacks, SameLine) {
    EXPECT_TRUE(same_line(A5, E1));
    EXPECT_TRUE(same_line(D8, E8));
    EXPECT_TRUE(same_line(E2, E7));
    EXPECT_FALSE(same_line(A1, B3));
    EXPECT_FALSE(same_line(C3, C3));
}

TEST(Attacks, DirectionBetween) {
    EXPECT_EQ(direction_between(E1, A5), Direction::NorthWest);
    EXPECT_EQ(direction_between(E8, D8), Direction::West);
    EXPECT_EQ(direction_between(E8, A4), Direction::SouthWest);
    EXPECT_EQ(direction_between(A1, H8), Direction::NorthEast);
    EXPECT_FALSE(direction_between(G1, F3).has_value());
}

TEST(Attacks, SlidesAlong) {
    EXPECT_TRUE(slides_along(PieceType::Bishop, Direction::SouthEast));
    EXPECT_FALSE(slides_along(PieceType::Bishop, Direction::North));
    EXPECT_TRUE(slides_along(PieceType::Rook, Direction::West));
    EXPECT_FALSE(slides_along(PieceType::Rook, Direction::NorthWest));
    EXPECT_TRUE(slides_along(PieceType::Queen, Direction::NorthWest));
    EXPECT_FALSE(slides_along(PieceType::Knight, Direction::North));
}

// ── Sliders ─────────────────────────────────────────────────────────────────

TEST(Attacks, RookOnEmptyBoard) {
    EXPECT_EQ(popcount(rook_attacks(D4, kEmptyBB)), 14);
    EXPECT_EQ(popcount(rook_attacks(A1, kEmptyBB)), 14);
}

TEST(Attacks, BishopOnEmptyBoard) {
    EXPECT_EQ(popcount(bishop_attacks(D4, kEmptyBB)), 13);
    EXPECT_EQ(popcount(bishop_attacks(A1, kEmptyBB)), 7);
    EXPECT_FALSE(test_bit(bishop_attacks(H4, kEmptyBB), A4));
}

TEST(Attacks, BlockersTruncateRays) {
    Bitboard occ = square_bb(D6) | square_bb(B4) | square_bb(D2);
    Bitboard r = rook_attacks(D4, occ);
    EXPECT_TRUE(test_bit(r, D6));   // blocker itself is attacked
    EXPECT_FALSE(test_bit(r, D7));  // beyond it is not
    EXPECT_TRUE(test_bit(r, B4));
    EXPECT_FALSE(test_bit(r, A4));
    EXPECT_TRUE(test_bit(r, D2));
    EXPECT_FALSE(test_bit(r, D1));
    EXPECT_TRUE(test_bit(r, H4));
}

TEST(Attacks, QueenIsRookPlusBishop) {
    Bitboard occ = square_bb(F6) | square_bb(C3) | square_bb(E4);
    EXPECT_EQ(queen_attacks(E5, occ), rook_attacks(E5, occ) | bishop_attacks(E5, occ));
}
