/// @file test_pgn.cpp
/// Tests for PGN import and game replay.

#include <chessreview/errors.hpp>
#include <chessreview/pgn.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace chessreview;

// ── parse ───────────────────────────────────────────────────────────────────

TEST(Pgn, TagsAndMovetext) {
    const auto rec = pgn::parse(
        "[Event \"Casual\"]\n"
        "[White \"Anna\"]\n"
        "[Black \"Ben\"]\n"
        "[Result \"1-0\"]\n"
        "\n"
        "1. e4 e5 2. Qh5 Nc6 3. Bc4 Nf6 4. Qxf7# 1-0\n");

    EXPECT_EQ(rec.headers.at("Event"), "Casual");
    EXPECT_EQ(rec.headers.at("White"), "Anna");
    EXPECT_EQ(rec.start_fen, kStartingFen);
    EXPECT_EQ(rec.result, "1-0");
    const std::vector<std::string> want{"e4", "e5", "Qh5", "Nc6", "Bc4", "Nf6", "Qxf7#"};
    EXPECT_EQ(rec.moves, want);
}

TEST(Pgn, SkipsCommentsVariationsAndGlyphs) {
    const auto rec = pgn::parse(
        "1. e4 {best by test} e5 (1... c5 2. Nf3 (2. c3) d6) 2. Nf3 $1 ; a comment\n"
        "2... Nc6 3.Bb5 a6 *\n");
    const std::vector<std::string> want{"e4", "e5", "Nf3", "Nc6", "Bb5", "a6"};
    EXPECT_EQ(rec.moves, want);
    EXPECT_EQ(rec.result, "*");
}

TEST(Pgn, EscapedQuotesInTags) {
    const auto rec = pgn::parse("[Annotator \"The \\\"Doc\\\"\"]\n\n1. d4 *\n");
    EXPECT_EQ(rec.headers.at("Annotator"), "The \"Doc\"");
}

TEST(Pgn, FenTagSetsStartPosition) {
    const std::string fen = "4k3/8/8/8/8/8/4P3/4K3 w - - 0 30";
    const auto rec = pgn::parse("[SetUp \"1\"]\n[FEN \"" + fen + "\"]\n\n30. e4 Kd7 *\n");
    EXPECT_EQ(rec.start_fen, fen);
    EXPECT_EQ(rec.moves.size(), 2u);
}

TEST(Pgn, OnlyFirstGameIsRead) {
    const auto rec = pgn::parse(
        "[Event \"One\"]\n\n1. e4 e5 1/2-1/2\n\n"
        "[Event \"Two\"]\n\n1. d4 d5 0-1\n");
    EXPECT_EQ(rec.headers.at("Event"), "One");
    EXPECT_EQ(rec.moves.size(), 2u);
    EXPECT_EQ(rec.result, "1/2-1/2");
}

TEST(Pgn, MovetextWithoutTags) {
    const auto rec = pgn::parse("1. e4 e5\n2. Nf3\n");
    EXPECT_TRUE(rec.headers.empty());
    EXPECT_EQ(rec.moves.size(), 3u);
    EXPECT_EQ(rec.result, "*");
}

// ── replay ──────────────────────────────────────────────────────────────────

TEST(Pgn, ReplayResolvesSanAndUci) {
    GameRecord rec;
    rec.moves = {"e4", "e7e5", "Nf3", "b8c6", "Bb5"};
    const auto moves = pgn::replay(rec);
    ASSERT_EQ(moves.size(), 5u);
    EXPECT_EQ(moves[1].uci(), "e7e5");
    EXPECT_EQ(moves[4].uci(), "f1b5");
}

TEST(Pgn, ReplayReportsIllegalPly) {
    GameRecord rec;
    rec.moves = {"e4", "e5", "Ke3"};
    try {
        (void)pgn::replay(rec);
        FAIL() << "expected InvalidGameRecord";
    } catch (const InvalidGameRecord& e) {
        EXPECT_EQ(e.ply(), 3);
        EXPECT_EQ(e.token(), "Ke3");
    }
}

TEST(Pgn, ReplayRejectsBadStartPosition) {
    GameRecord rec;
    rec.start_fen = "not a position";
    rec.moves = {"e4"};
    try {
        (void)pgn::replay(rec);
        FAIL() << "expected InvalidGameRecord";
    } catch (const InvalidGameRecord& e) {
        EXPECT_EQ(e.ply(), 0);
    }
}

TEST(Pgn, ReplayEmptyGame) {
    EXPECT_TRUE(pgn::replay(GameRecord{}).empty());
}
