#pragma once

/// @file analyzer.hpp
/// Game analysis: replays a game, asks the evaluator about every half-move,
/// classifies each move and aggregates per-side error counts.
///
/// The per-move bookkeeping is a pure fold (fold_move) over observations;
/// GameAnalyzer only gathers those observations from the rules layer and the
/// injected PositionEvaluator.

#include <chessreview/classifier.hpp>
#include <chessreview/evaluator.hpp>
#include <chessreview/material.hpp>
#include <chessreview/pgn.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chessreview {

// ── Configuration ───────────────────────────────────────────────────────────

struct AnalyzerConfig {
    EvalLimits limits{12, 1000};
    double blunder_threshold_cp = 100.0;  ///< check_blunder() default
    int assessment_lines = 3;             ///< candidate moves in assess_position()
};

// ── Results ─────────────────────────────────────────────────────────────────

/// One analysed half-move. Evaluations are pawns from white's point of view,
/// except eval_change which is from the mover's.
struct MoveAnalysis {
    int move_number = 1;
    Color color = Color::White;
    std::string move_san;
    double eval_before = 0.0;
    double eval_after = 0.0;
    double eval_change = 0.0;
    std::optional<std::string> best_move;  ///< set only when a better move existed
    std::optional<double> best_eval;
    Classification classification = Classification::Best;
    std::string comment;
    bool is_capture = false;
    bool is_check = false;
    bool is_sacrifice = false;
    std::string fen_after;

    [[nodiscard]] bool operator==(const MoveAnalysis&) const = default;
};

struct SideErrors {
    int blunders = 0;
    int mistakes = 0;
    int inaccuracies = 0;

    [[nodiscard]] bool operator==(const SideErrors&) const = default;
};

struct GameAnalysis {
    std::vector<MoveAnalysis> moves;
    SideErrors white;
    SideErrors black;
    std::vector<int> critical_moments;  ///< move numbers
    std::string summary;

    [[nodiscard]] bool operator==(const GameAnalysis&) const = default;
};

/// Outcome of the live single-move check.
struct BlunderCheck {
    bool is_blunder = false;
    std::optional<std::string> best_move;  ///< SAN, only when a blunder missed it
    double eval_loss_cp = 0.0;             ///< mover's perspective, positive = lost ground
    Classification classification = Classification::Best;
};

/// One of the evaluator's preferred moves in a position.
struct CandidateMove {
    std::string move;               ///< SAN
    std::string score;              ///< white's view, "0.35" or "M3"
    std::vector<std::string> line;  ///< SAN, at most four moves

    [[nodiscard]] bool operator==(const CandidateMove&) const = default;
};

/// Quick look at a position: evaluation, top moves and material.
struct PositionAssessment {
    double evaluation = 0.0;  ///< pawns, white's view
    std::string evaluation_text;
    std::vector<CandidateMove> best_moves;
    bool is_tactical = false;  ///< a forced mate, or more than 1.5 pawns either way
    MaterialBalance material;
};

// ── Fold ────────────────────────────────────────────────────────────────────

/// Everything observed about one half-move, before any classification.
struct MoveObservation {
    Color color = Color::White;
    std::string move_san;
    bool is_capture = false;
    bool is_check = false;
    bool is_sacrifice = false;
    std::optional<std::string> best_move_san;  ///< evaluator's choice before the move
    std::optional<double> best_eval;           ///< pre-move evaluation, white's view
    double eval_after = 0.0;                   ///< post-move evaluation, white's view
    std::string fen_after;
};

/// Accumulator threaded through fold_move.
struct AnalysisState {
    GameAnalysis analysis;
    int move_number = 1;
    double prev_eval = 0.0;
};

namespace analysis {

/// Classify one half-move and append it to `state`. Pure.
[[nodiscard]] AnalysisState fold_move(AnalysisState state, const MoveObservation& obs);

/// Title, per-side error counts and up to five blunders/mistakes with comments.
[[nodiscard]] std::string summarize(const GameAnalysis& analysis);

/// A capture made with a piece worth more than the captured one (king = 0).
[[nodiscard]] bool is_sacrifice(const Position& pos, Move m);

}  // namespace analysis

// ── GameAnalyzer ────────────────────────────────────────────────────────────

/// Drives an injected PositionEvaluator over games and single moves.
/// Holds no state between calls besides its configuration.
class GameAnalyzer {
   public:
    explicit GameAnalyzer(PositionEvaluator& evaluator, AnalyzerConfig config = {});

    /// Analyse every move of `record`.
    ///
    /// The whole record is replayed first: an illegal or unreadable move
    /// throws InvalidGameRecord before the evaluator is queried. Throws
    /// EvaluatorUnavailable if the evaluator is down at the start or fails
    /// on any move; no partial result is produced.
    [[nodiscard]] GameAnalysis analyze_game(const GameRecord& record);

    /// analyze_game() on the first game of a PGN text.
    [[nodiscard]] GameAnalysis analyze_pgn(std::string_view pgn_text);

    /// analyze_game() on SAN or UCI moves played from `start_fen`.
    [[nodiscard]] GameAnalysis analyze_moves(std::string_view start_fen,
                                             const std::vector<std::string>& moves);

    /// Compare the evaluation before and after `move`. A blunder is a loss of
    /// more than `threshold_cp` centipawns for the mover.
    [[nodiscard]] BlunderCheck check_blunder(const Position& before, Move move,
                                             double threshold_cp);
    [[nodiscard]] BlunderCheck check_blunder(const Position& before, Move move) {
        return check_blunder(before, move, config_.blunder_threshold_cp);
    }

    /// Coaching line for a player's move, or nothing when the move is fine.
    /// Throws InvalidGameRecord if `move_text` is not legal in `before`.
    [[nodiscard]] std::optional<std::string> tutor_feedback(const Position& before,
                                                            std::string_view move_text);

    /// Evaluate `pos` asking for config().assessment_lines variations.
    /// Throws EvaluatorUnavailable when the evaluator is down.
    [[nodiscard]] PositionAssessment assess_position(const Position& pos);

    [[nodiscard]] const AnalyzerConfig& config() const noexcept { return config_; }

   private:
    struct EngineAnswer {
        std::optional<std::string> best_san;
        double eval = 0.0;  ///< white's view, pawns
    };

    struct MoveAssessment {
        std::string played_san;
        std::optional<std::string> best_san;
        double eval_before = 0.0;
        double eval_after = 0.0;
        double loss_cp = 0.0;
        Position after;
    };

    EngineAnswer ask_evaluator(const Position& pos);
    MoveAssessment assess(const Position& before, Move move);
    void require_available() const;

    PositionEvaluator& evaluator_;
    AnalyzerConfig config_;
};

}  // namespace chessreview
