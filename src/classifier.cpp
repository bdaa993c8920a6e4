/// @file classifier.cpp

#include <chessreview/classifier.hpp>

#include <cmath>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace chessreview {

namespace {

constexpr std::string_view kNames[] = {"brilliant", "great",      "best",    "good",
                                       "book",      "inaccuracy", "mistake", "blunder"};

std::string one_decimal(double pawns) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << pawns;
    return os.str();
}

}  // namespace

std::string_view to_string(Classification c) noexcept {
    return kNames[static_cast<int>(c)];
}

std::optional<Classification> classification_from_string(std::string_view name) {
    for (int i = 0; i < static_cast<int>(std::size(kNames)); ++i) {
        if (kNames[i] == name) return static_cast<Classification>(i);
    }
    return std::nullopt;
}

namespace classify {

Classification classify_move(const ClassifierInput& in) noexcept {
    if (in.is_sacrifice && in.eval_change >= 0.5) return Classification::Brilliant;

    if (in.is_only_good_move && in.eval_before < -1.0 && in.eval_after > 0.0)
        return Classification::Brilliant;

    if (in.eval_change >= 1.0 && !in.had_better_move) return Classification::Great;

    if (in.eval_change >= -kBestTolerance)
        return in.had_better_move ? Classification::Good : Classification::Best;
    if (in.eval_change >= -kInaccuracyThreshold) return Classification::Good;
    if (in.eval_change >= -kMistakeThreshold) return Classification::Inaccuracy;
    if (in.eval_change >= -kBlunderThreshold) return Classification::Mistake;
    return Classification::Blunder;
}

std::string classification_comment(Classification c, double eval_change,
                                   const std::optional<std::string>& best_move,
                                   bool is_sacrifice) {
    const std::string lost = one_decimal(std::fabs(eval_change));
    switch (c) {
        case Classification::Brilliant:
            return is_sacrifice ? "Brilliant sacrifice!" : "Brilliant! The only winning move.";
        case Classification::Great:
            return "Great move! Gains " + one_decimal(eval_change) + " pawns.";
        case Classification::Best:
            return "Best move.";
        case Classification::Good:
            return "Good move.";
        case Classification::Book:
            return "Book move.";
        case Classification::Inaccuracy:
            if (best_move) return "Inaccuracy. " + *best_move + " was better.";
            return "Slight inaccuracy.";
        case Classification::Mistake:
            if (best_move)
                return "Mistake! " + *best_move + " was much better (" + lost + " pawns lost).";
            return "Mistake! (" + lost + " pawns lost)";
        case Classification::Blunder:
            if (best_move)
                return "Blunder! " + *best_move + " was winning. (" + lost + " pawns lost)";
            return "Blunder! (" + lost + " pawns lost)";
    }
    return {};
}

}  // namespace classify

}  // namespace chessreview
