/// @file test_classifier.cpp
/// Tests for move classification thresholds and comments.

#include <chessreview/classifier.hpp>

#include <gtest/gtest.h>

#include <optional>
#include <string>

using namespace chessreview;

namespace {

Classification classify_change(double change, bool better = false, bool sacrifice = false) {
    classify::ClassifierInput in;
    in.eval_change = change;
    in.had_better_move = better;
    in.is_sacrifice = sacrifice;
    return classify::classify_move(in);
}

}  // namespace

// ── Names ───────────────────────────────────────────────────────────────────

TEST(Classifier, NamesRoundTrip) {
    for (Classification c :
         {Classification::Brilliant, Classification::Great, Classification::Best,
          Classification::Good, Classification::Book, Classification::Inaccuracy,
          Classification::Mistake, Classification::Blunder}) {
        EXPECT_EQ(classification_from_string(to_string(c)), c);
    }
    EXPECT_EQ(to_string(Classification::Inaccuracy), "inaccuracy");
    EXPECT_FALSE(classification_from_string("dubious").has_value());
}

TEST(Classifier, ErrorAndCriticalSets) {
    EXPECT_TRUE(is_error(Classification::Inaccuracy));
    EXPECT_TRUE(is_error(Classification::Blunder));
    EXPECT_FALSE(is_error(Classification::Good));
    EXPECT_TRUE(is_critical(Classification::Great));
    EXPECT_TRUE(is_critical(Classification::Mistake));
    EXPECT_FALSE(is_critical(Classification::Inaccuracy));
    EXPECT_FALSE(is_critical(Classification::Best));
}

// ── Loss thresholds ─────────────────────────────────────────────────────────

TEST(Classifier, LossBoundariesAreInclusive) {
    EXPECT_EQ(classify_change(-0.10), Classification::Best);
    EXPECT_EQ(classify_change(-0.11), Classification::Good);
    EXPECT_EQ(classify_change(-0.50), Classification::Good);
    EXPECT_EQ(classify_change(-0.51), Classification::Inaccuracy);
    EXPECT_EQ(classify_change(-1.00), Classification::Inaccuracy);
    EXPECT_EQ(classify_change(-1.01), Classification::Mistake);
    EXPECT_EQ(classify_change(-2.00), Classification::Mistake);
    EXPECT_EQ(classify_change(-2.01), Classification::Blunder);
    EXPECT_EQ(classify_change(-1000.0), Classification::Blunder);
}

TEST(Classifier, BetterMoveDowngradesBestToGood) {
    EXPECT_EQ(classify_change(0.0, false), Classification::Best);
    EXPECT_EQ(classify_change(0.0, true), Classification::Good);
    EXPECT_EQ(classify_change(-0.05, true), Classification::Good);
}

// ── Gains ───────────────────────────────────────────────────────────────────

TEST(Classifier, LargeGainIsGreat) {
    EXPECT_EQ(classify_change(1.0), Classification::Great);
    EXPECT_EQ(classify_change(3.5), Classification::Great);
    EXPECT_EQ(classify_change(0.99), Classification::Best);
    // The evaluator preferred something else: only Good.
    EXPECT_EQ(classify_change(1.5, true), Classification::Good);
}

TEST(Classifier, SacrificeThatGainsIsBrilliant) {
    EXPECT_EQ(classify_change(0.5, false, true), Classification::Brilliant);
    EXPECT_EQ(classify_change(0.5, true, true), Classification::Brilliant);
    EXPECT_EQ(classify_change(0.49, false, true), Classification::Best);
    EXPECT_EQ(classify_change(-3.0, false, true), Classification::Blunder);
    EXPECT_EQ(classify_change(0.5, false, false), Classification::Best);
}

TEST(Classifier, OnlyMoveTurningTheGameIsBrilliant) {
    classify::ClassifierInput in;
    in.eval_change = 0.8;
    in.is_only_good_move = true;
    in.eval_before = -1.5;
    in.eval_after = 0.3;
    EXPECT_EQ(classify::classify_move(in), Classification::Brilliant);

    in.eval_after = -0.3;  // saved but still worse
    EXPECT_EQ(classify::classify_move(in), Classification::Best);
}

// ── Comments ────────────────────────────────────────────────────────────────

TEST(Classifier, Comments) {
    using classify::classification_comment;
    const std::optional<std::string> nf3 = "Nf3";
    const std::optional<std::string> none;

    EXPECT_EQ(classification_comment(Classification::Brilliant, 1.0, none, true),
              "Brilliant sacrifice!");
    EXPECT_EQ(classification_comment(Classification::Brilliant, 1.0, none),
              "Brilliant! The only winning move.");
    EXPECT_EQ(classification_comment(Classification::Great, 1.5, none),
              "Great move! Gains 1.5 pawns.");
    EXPECT_EQ(classification_comment(Classification::Best, 0.0, nf3), "Best move.");
    EXPECT_EQ(classification_comment(Classification::Good, -0.2, nf3), "Good move.");
    EXPECT_EQ(classification_comment(Classification::Book, 0.0, none), "Book move.");
    EXPECT_EQ(classification_comment(Classification::Inaccuracy, -0.7, nf3),
              "Inaccuracy. Nf3 was better.");
    EXPECT_EQ(classification_comment(Classification::Inaccuracy, -0.7, none),
              "Slight inaccuracy.");
    EXPECT_EQ(classification_comment(Classification::Mistake, -1.5, nf3),
              "Mistake! Nf3 was much better (1.5 pawns lost).");
    EXPECT_EQ(classification_comment(Classification::Mistake, -1.5, none),
              "Mistake! (1.5 pawns lost)");
    EXPECT_EQ(classification_comment(Classification::Blunder, -2.5, nf3),
              "Blunder! Nf3 was winning. (2.5 pawns lost)");
    EXPECT_EQ(classification_comment(Classification::Blunder, -2.5, none),
              "Blunder! (2.5 pawns lost)");
}
