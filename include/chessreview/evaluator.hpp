#pragma once

/// @file evaluator.hpp
/// Position Evaluator seam: scores, limits, results and the abstract evaluator.

#include <chessreview/position.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace chessreview {

// ── Score ───────────────────────────────────────────────────────────────────

/// An evaluator score: centipawns or a signed mate distance.
class Score {
   public:
    /// Pawn value reported for any forced mate.
    static constexpr double kMatePawns = 1000.0;

    constexpr Score() noexcept = default;

    [[nodiscard]] static constexpr Score centipawns(int cp) noexcept { return Score(false, cp); }
    /// Mate in `n` moves for the side to move; negative when that side gets mated.
    [[nodiscard]] static constexpr Score mate_in(int n) noexcept { return Score(true, n); }

    /// Parse "0.35", "-1.2" (pawns), "M3", "M-2", "#3", "cp 35" or "mate -2".
    /// Throws MalformedScore for anything else.
    [[nodiscard]] static Score parse(std::string_view text);

    [[nodiscard]] constexpr bool is_mate() const noexcept { return mate_; }
    [[nodiscard]] constexpr int cp() const noexcept { return mate_ ? 0 : value_; }
    [[nodiscard]] constexpr int mate() const noexcept { return mate_ ? value_ : 0; }

    /// Pawns; mate scores map to +/-kMatePawns. Mate 0 means the side to move is mated.
    [[nodiscard]] constexpr double to_pawns() const noexcept {
        if (mate_) return value_ > 0 ? kMatePawns : -kMatePawns;
        return value_ / 100.0;
    }

    /// "0.35" style pawns, or "M3" / "M-2".
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] constexpr bool operator==(const Score&) const noexcept = default;

   private:
    constexpr Score(bool mate, int value) noexcept : mate_(mate), value_(value) {}

    bool mate_ = false;
    int value_ = 0;
};

/// Score::parse, but a malformed score is logged and read as 0.0 (equal).
[[nodiscard]] Score parse_score_or_neutral(std::string_view text);

// ── Requests and results ────────────────────────────────────────────────────

struct EvalLimits {
    int depth = 12;
    std::int64_t movetime_ms = 1000;  ///< <= 0 means depth-limited only.
    int multipv = 1;                  ///< number of principal variations wanted
};

/// One principal variation of a multi-PV search.
struct PvLine {
    Score score;                  ///< side to move's point of view
    std::vector<std::string> pv;  ///< UCI moves

    [[nodiscard]] bool operator==(const PvLine&) const = default;
};

struct EvalResult {
    std::string best_move;  ///< UCI; empty when the side to move has no legal move.
    Score score;            ///< from the side to move's point of view
    int depth = 0;
    std::vector<std::string> pv;  ///< UCI moves
    /// Every reported variation, best first. May be empty for evaluators that
    /// only report the main line; lines[0] then equals {score, pv}.
    std::vector<PvLine> lines;
};

// ── Evaluator interface ─────────────────────────────────────────────────────

/// Source of best moves and scores. Injected into the analyzer; one instance
/// is one session and must not be driven by two analyses at once.
class PositionEvaluator {
   public:
    virtual ~PositionEvaluator() = default;

    /// Search `pos` within `limits`. Throws EvaluatorUnavailable when no answer
    /// can be produced.
    virtual EvalResult evaluate(const Position& pos, const EvalLimits& limits) = 0;

    /// Whether the evaluator can currently answer queries.
    [[nodiscard]] virtual bool available() const = 0;
};

}  // namespace chessreview
