/// @file analyzer.cpp
/// Game replay, evaluator probing and the per-move analysis fold.

#include <chessreview/analyzer.hpp>

#include <chessreview/errors.hpp>
#include <chessreview/log.hpp>
#include <chessreview/san.hpp>
#include <chessreview/tactics.hpp>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <utility>

namespace chessreview {

namespace {

constexpr const char* kLogTag = "analysis";

// Positions whose evaluation exceeds this are considered tactical.
constexpr int kTacticalCp = 150;
constexpr std::size_t kCandidateLineMoves = 4;

/// Evaluations are whole centipawns; snap a pawn difference back onto that grid
/// so threshold comparisons see exactly -0.5, -1.0, ...
double on_centipawn_grid(double pawns) {
    return std::round(pawns * 100.0) / 100.0;
}

/// `score` (side to move's view) as text from white's point of view.
std::string white_view_text(const Score& score, int sign) {
    if (score.is_mate()) return "M" + std::to_string(sign * score.mate());
    return Score::centipawns(sign * score.cp()).to_string();
}

/// Leading moves of a UCI variation in SAN; stops at the first illegal move.
std::vector<std::string> variation_to_san(Position pos, const std::vector<std::string>& pv) {
    std::vector<std::string> out;
    for (const std::string& uci : pv) {
        if (out.size() == kCandidateLineMoves) break;
        auto m = san::from_san(pos, uci);
        if (!m) break;
        out.push_back(san::to_san(pos, *m));
        pos.make_move(*m);
    }
    return out;
}

std::string one_decimal(double v) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << v;
    return os.str();
}

void count_error(SideErrors& side, Classification c) {
    switch (c) {
        case Classification::Blunder:
            ++side.blunders;
            break;
        case Classification::Mistake:
            ++side.mistakes;
            break;
        case Classification::Inaccuracy:
            ++side.inaccuracies;
            break;
        default:
            break;
    }
}

void append_side(std::ostringstream& os, const char* title, const SideErrors& side) {
    os << title << ":\n"
       << "  Blunders: " << side.blunders << '\n'
       << "  Mistakes: " << side.mistakes << '\n'
       << "  Inaccuracies: " << side.inaccuracies << '\n'
       << '\n';
}

}  // namespace

// ── Fold ────────────────────────────────────────────────────────────────────

namespace analysis {

AnalysisState fold_move(AnalysisState state, const MoveObservation& obs) {
    const bool white = obs.color == Color::White;

    MoveAnalysis ma;
    ma.move_number = state.move_number;
    ma.color = obs.color;
    ma.move_san = obs.move_san;
    ma.eval_before = state.prev_eval;
    ma.eval_after = obs.eval_after;
    ma.eval_change = on_centipawn_grid(white ? ma.eval_after - ma.eval_before
                                             : ma.eval_before - ma.eval_after);
    ma.best_eval = obs.best_eval;
    ma.is_capture = obs.is_capture;
    ma.is_check = obs.is_check;
    ma.is_sacrifice = obs.is_sacrifice;
    ma.fen_after = obs.fen_after;

    const bool played_is_best = obs.best_move_san && *obs.best_move_san == obs.move_san;
    const bool had_better_move = obs.best_eval.has_value() && !played_is_best;

    classify::ClassifierInput in;
    in.eval_change = ma.eval_change;
    in.had_better_move = had_better_move;
    in.is_sacrifice = obs.is_sacrifice;
    in.eval_before = ma.eval_before;
    in.eval_after = ma.eval_after;
    in.is_only_good_move = played_is_best && ma.eval_before < -1.0 && ma.eval_after > -0.5;

    ma.classification = classify::classify_move(in);
    if (had_better_move) ma.best_move = obs.best_move_san;
    ma.comment = classify::classification_comment(ma.classification, ma.eval_change,
                                                  ma.best_move, obs.is_sacrifice);

    GameAnalysis& ga = state.analysis;
    count_error(white ? ga.white : ga.black, ma.classification);
    if (is_critical(ma.classification)) ga.critical_moments.push_back(ma.move_number);
    ga.moves.push_back(std::move(ma));

    state.prev_eval = obs.eval_after;
    if (!white) ++state.move_number;
    return state;
}

std::string summarize(const GameAnalysis& analysis) {
    std::ostringstream os;
    os << "Game Analysis Summary\n" << std::string(40, '=') << "\n\n";
    append_side(os, "White", analysis.white);
    append_side(os, "Black", analysis.black);

    int listed = 0;
    for (const MoveAnalysis& m : analysis.moves) {
        if (m.classification != Classification::Blunder &&
            m.classification != Classification::Mistake)
            continue;
        if (listed == 5) break;
        if (listed == 0) os << "Critical moments:";
        os << "\n  Move " << m.move_number << ". " << m.move_san << " (" << color_name(m.color)
           << "): " << m.comment;
        ++listed;
    }

    std::string out = os.str();
    if (listed == 0 && !out.empty()) out.pop_back();  // no trailing blank line
    return out;
}

bool is_sacrifice(const Position& pos, Move m) {
    const Piece captured = pos.captured_piece(m);
    if (captured == kNoPiece) return false;
    const Piece mover = pos.piece_at(m.from_sq);
    return material_value(mover.type) > material_value(captured.type);
}

}  // namespace analysis

// ── GameAnalyzer ────────────────────────────────────────────────────────────

GameAnalyzer::GameAnalyzer(PositionEvaluator& evaluator, AnalyzerConfig config)
    : evaluator_(evaluator), config_(config) {}

GameAnalysis GameAnalyzer::analyze_game(const GameRecord& record) {
    const std::vector<Move> moves = pgn::replay(record);
    require_available();

    log_info(kLogTag, "Analyzing " + std::to_string(moves.size()) + " half-moves at depth " +
                          std::to_string(config_.limits.depth));

    Position pos = Position::from_fen(record.start_fen);
    AnalysisState state;
    state.move_number = pos.fullmove_number();

    for (Move m : moves) {
        MoveObservation obs;
        obs.color = pos.side_to_move();
        obs.is_capture = pos.is_capture(m);
        obs.is_check = pos.gives_check(m);
        obs.is_sacrifice = analysis::is_sacrifice(pos, m);

        EngineAnswer before = ask_evaluator(pos);
        obs.best_move_san = std::move(before.best_san);
        obs.best_eval = before.eval;

        obs.move_san = san::to_san(pos, m);
        pos.make_move(m);
        obs.fen_after = pos.to_fen();

        obs.eval_after = ask_evaluator(pos).eval;
        state = analysis::fold_move(std::move(state), obs);
    }

    state.analysis.summary = analysis::summarize(state.analysis);

    const GameAnalysis& ga = state.analysis;
    log_info(kLogTag, "Analysis done: white " + std::to_string(ga.white.blunders) + "/" +
                          std::to_string(ga.white.mistakes) + "/" +
                          std::to_string(ga.white.inaccuracies) + ", black " +
                          std::to_string(ga.black.blunders) + "/" +
                          std::to_string(ga.black.mistakes) + "/" +
                          std::to_string(ga.black.inaccuracies) +
                          " (blunders/mistakes/inaccuracies)");
    return std::move(state.analysis);
}

GameAnalysis GameAnalyzer::analyze_pgn(std::string_view pgn_text) {
    return analyze_game(pgn::parse(pgn_text));
}

GameAnalysis GameAnalyzer::analyze_moves(std::string_view start_fen,
                                         const std::vector<std::string>& moves) {
    GameRecord record;
    record.start_fen = std::string(start_fen);
    record.moves = moves;
    return analyze_game(record);
}

BlunderCheck GameAnalyzer::check_blunder(const Position& before, Move move, double threshold_cp) {
    MoveAssessment a = assess(before, move);

    BlunderCheck check;
    check.eval_loss_cp = a.loss_cp;
    check.is_blunder = a.loss_cp > threshold_cp;
    const bool played_is_best = a.best_san && *a.best_san == a.played_san;
    if (check.is_blunder && !played_is_best) check.best_move = a.best_san;

    classify::ClassifierInput in;
    in.eval_change = -a.loss_cp / 100.0;
    in.had_better_move = a.best_san.has_value() && !played_is_best;
    in.is_sacrifice = analysis::is_sacrifice(before, move);
    in.eval_before = a.eval_before;
    in.eval_after = a.eval_after;
    in.is_only_good_move = played_is_best && a.eval_before < -1.0 && a.eval_after > -0.5;
    check.classification = classify::classify_move(in);
    return check;
}

std::optional<std::string> GameAnalyzer::tutor_feedback(const Position& before,
                                                        std::string_view move_text) {
    auto move = san::from_san(before, move_text);
    if (!move) {
        throw InvalidGameRecord("Illegal or unparseable move '" + std::string(move_text) + "'", 1,
                                std::string(move_text));
    }

    MoveAssessment a = assess(before, *move);
    const bool suggest = a.best_san && *a.best_san != a.played_san;
    log_info(kLogTag, a.played_san + ": eval_before=" + one_decimal(a.eval_before) +
                          " eval_after=" + one_decimal(a.eval_after) + " loss=" +
                          std::to_string(static_cast<int>(a.loss_cp)) + "cp");

    const std::vector<Motif> motifs = tactics::analyze_tactics(a.after);

    if (a.loss_cp > 200.0) {
        std::string feedback = "That was a blunder! You lost about " +
                               one_decimal(a.loss_cp / 100.0) + " pawns of advantage.";
        if (suggest) feedback += " " + *a.best_san + " was much better.";
        for (const Motif& m : motifs) {
            if (m.severity == Severity::Critical) {
                feedback += " Watch out: " + m.description;
                break;
            }
        }
        return feedback;
    }
    if (a.loss_cp > 100.0) {
        std::string feedback =
            "That's a mistake - you lost about " + one_decimal(a.loss_cp / 100.0) + " pawns.";
        if (suggest) feedback += " Consider " + *a.best_san + " next time.";
        return feedback;
    }
    if (a.loss_cp > 50.0 && suggest) {
        return "Small inaccuracy. " + *a.best_san + " was slightly better.";
    }

    // Only the first noteworthy motif is considered.
    for (const Motif& m : motifs) {
        if (m.severity == Severity::Info) continue;
        if (m.type == MotifType::HangingPiece) return "Be careful! " + m.description;
        break;
    }
    return std::nullopt;
}

PositionAssessment GameAnalyzer::assess_position(const Position& pos) {
    require_available();

    EvalLimits limits = config_.limits;
    limits.multipv = std::max(1, config_.assessment_lines);
    const EvalResult r = evaluator_.evaluate(pos, limits);

    std::vector<PvLine> lines = r.lines;
    if (lines.empty() && !r.best_move.empty()) {
        lines.push_back({r.score, r.pv.empty() ? std::vector<std::string>{r.best_move} : r.pv});
    }

    const int sign = pos.side_to_move() == Color::White ? 1 : -1;
    PositionAssessment a;
    a.evaluation = sign * r.score.to_pawns();
    a.evaluation_text = white_view_text(r.score, sign);
    a.is_tactical = r.score.is_mate() || std::abs(r.score.cp()) > kTacticalCp;
    a.material = material_balance(pos);

    const auto wanted = static_cast<std::size_t>(limits.multipv);
    for (const PvLine& line : lines) {
        if (a.best_moves.size() == wanted) break;
        std::vector<std::string> san_line = variation_to_san(pos, line.pv);
        if (san_line.empty()) {
            log_warn(kLogTag, "Skipping unplayable variation in " + pos.to_fen());
            continue;
        }
        CandidateMove c;
        c.move = san_line.front();
        c.score = white_view_text(line.score, sign);
        c.line = std::move(san_line);
        a.best_moves.push_back(std::move(c));
    }

    log_debug(kLogTag, "Assessment " + a.evaluation_text + " with " +
                           std::to_string(a.best_moves.size()) + " candidate move(s)");
    return a;
}

// ── Private helpers ─────────────────────────────────────────────────────────

GameAnalyzer::EngineAnswer GameAnalyzer::ask_evaluator(const Position& pos) {
    EvalResult r = evaluator_.evaluate(pos, config_.limits);

    EngineAnswer p;
    const double pawns = r.score.to_pawns();
    p.eval = pos.side_to_move() == Color::White ? pawns : -pawns;

    if (!r.best_move.empty()) {
        if (auto best = san::from_san(pos, r.best_move)) {
            p.best_san = san::to_san(pos, *best);
        } else {
            log_warn(kLogTag, "Evaluator suggested an illegal move '" + r.best_move + "' in " +
                                  pos.to_fen());
        }
    }
    return p;
}

GameAnalyzer::MoveAssessment GameAnalyzer::assess(const Position& before, Move move) {
    require_available();

    MoveAssessment a;
    a.played_san = san::to_san(before, move);
    if (a.played_san.empty()) {
        throw InvalidGameRecord("Illegal move '" + move.uci() + "'", 1, move.uci());
    }

    EngineAnswer pre = ask_evaluator(before);
    a.best_san = std::move(pre.best_san);
    a.eval_before = pre.eval;

    a.after = before;
    a.after.make_move(move);
    a.eval_after = ask_evaluator(a.after).eval;

    const double change = a.eval_after - a.eval_before;
    a.loss_cp = std::round((before.side_to_move() == Color::White ? -change : change) * 100.0);
    return a;
}

void GameAnalyzer::require_available() const {
    if (!evaluator_.available()) {
        log_warn(kLogTag, "Position evaluator not available");
        throw EvaluatorUnavailable("Position evaluator is not available");
    }
}

}  // namespace chessreview
