/// @file test_material.cpp
/// Tests for the material count and its wording.

#include <chessreview/material.hpp>

#include <gtest/gtest.h>

using namespace chessreview;

TEST(Material, StartingPositionIsEqual) {
    const MaterialBalance mb = material_balance(Position::initial());
    EXPECT_EQ(mb.white, 39);
    EXPECT_EQ(mb.black, 39);
    EXPECT_EQ(mb.balance, 0);
    EXPECT_EQ(mb.description, "Material is equal");
}

TEST(Material, KingsDoNotCount) {
    const MaterialBalance mb = material_balance(Position::from_fen("4k3/8/8/8/8/8/8/4K3 w - -"));
    EXPECT_EQ(mb.white, 0);
    EXPECT_EQ(mb.black, 0);
}

TEST(Material, BlackUpAnExchange) {
    // White: rook + knight = 8; black: 2 rooks + pawn = 11.
    const MaterialBalance mb =
        material_balance(Position::from_fen("r3k2r/p7/8/8/8/8/8/R3K1N1 w - - 0 1"));
    EXPECT_EQ(mb.balance, -3);
    EXPECT_EQ(mb.description, "Black is up a minor piece (3 points)");
}

TEST(Material, DescriptionBands) {
    EXPECT_EQ(material_description(1), "White is up 1 pawn(s)");
    EXPECT_EQ(material_description(-2), "Black is up 2 pawn(s)");
    EXPECT_EQ(material_description(3), "White is up a minor piece (3 points)");
    EXPECT_EQ(material_description(5), "White is up a rook (5 points)");
    EXPECT_EQ(material_description(-8), "Black is up a rook (8 points)");
    EXPECT_EQ(material_description(9), "White is up a queen (9 points)");
    EXPECT_EQ(material_description(-20), "Black is up a queen (20 points)");
}
