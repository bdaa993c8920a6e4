#pragma once

/// @file classifier.hpp
/// Move quality classification from an evaluation swing.
///
/// All evaluations are in pawns (centipawns / 100). `eval_change` is from
/// the mover's perspective: negative means the mover lost ground.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chessreview {

enum class Classification : std::uint8_t {
    Brilliant,
    Great,
    Best,
    Good,
    Book,
    Inaccuracy,
    Mistake,
    Blunder,
};

/// "brilliant", "great", "best", "good", "book", "inaccuracy", "mistake", "blunder".
[[nodiscard]] std::string_view to_string(Classification c) noexcept;

/// Inverse of to_string(); empty for unknown names.
[[nodiscard]] std::optional<Classification> classification_from_string(std::string_view name);

/// Inaccuracy, mistake or blunder.
[[nodiscard]] constexpr bool is_error(Classification c) noexcept {
    return c == Classification::Inaccuracy || c == Classification::Mistake ||
           c == Classification::Blunder;
}

/// Classifications recorded as critical moments of a game.
[[nodiscard]] constexpr bool is_critical(Classification c) noexcept {
    return c == Classification::Blunder || c == Classification::Mistake ||
           c == Classification::Brilliant || c == Classification::Great;
}

namespace classify {

// Loss thresholds, pawns.
inline constexpr double kBestTolerance = 0.10;
inline constexpr double kInaccuracyThreshold = 0.50;
inline constexpr double kMistakeThreshold = 1.00;
inline constexpr double kBlunderThreshold = 2.00;

/// Everything the classification depends on; nothing else influences it.
struct ClassifierInput {
    double eval_change = 0.0;
    bool had_better_move = false;
    bool is_sacrifice = false;
    double eval_before = 0.0;  ///< white's perspective
    double eval_after = 0.0;   ///< white's perspective
    bool is_only_good_move = false;
};

/// First matching rule wins:
///   sacrifice gaining >= 0.5            -> Brilliant
///   only good move, -1.0 -> above 0     -> Brilliant
///   gain >= 1.0 with no better move     -> Great
///   change >= -0.10                     -> Best (Good if a better move existed)
///   change >= -0.50                     -> Good
///   change >= -1.00                     -> Inaccuracy
///   change >= -2.00                     -> Mistake
///   otherwise                           -> Blunder
/// Book is never produced here; callers tag opening-book moves themselves.
[[nodiscard]] Classification classify_move(const ClassifierInput& in) noexcept;

/// Short annotation for a classified move. `best_move` is quoted only for
/// inaccuracies, mistakes and blunders.
[[nodiscard]] std::string classification_comment(Classification c, double eval_change,
                                                 const std::optional<std::string>& best_move,
                                                 bool is_sacrifice = false);

}  // namespace classify

}  // namespace chessreview
