/// @file pybind_module.cpp
/// pybind11 bindings for the chessreview analysis core.
///
/// Exposes the `_chessreview` Python module. Positions cross the boundary as
/// FEN strings and moves as SAN or UCI strings; results come back as dicts
/// so the Python side never depends on C++ types.

#include <chessreview/analyzer.hpp>
#include <chessreview/errors.hpp>
#include <chessreview/log.hpp>
#include <chessreview/material.hpp>
#include <chessreview/san.hpp>
#include <chessreview/tactics.hpp>
#include <chessreview/uci_evaluator.hpp>

#include <memory>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <string>
#include <utility>

namespace py = pybind11;
namespace cr = chessreview;

namespace {

// ── Python-implemented evaluator ────────────────────────────────────────────

/// Adapts any Python object with `evaluate(fen, depth, movetime_ms)` returning
/// `(best_uci, score_text, depth, pv)`. An optional `available()` is honoured.
class PyObjectEvaluator : public cr::PositionEvaluator {
   public:
    explicit PyObjectEvaluator(py::object impl) : impl_(std::move(impl)) {}

    ~PyObjectEvaluator() override {
        py::gil_scoped_acquire gil;
        impl_ = py::object();
    }

    cr::EvalResult evaluate(const cr::Position& pos, const cr::EvalLimits& limits) override {
        py::gil_scoped_acquire gil;
        try {
            auto out = impl_.attr("evaluate")(pos.to_fen(), limits.depth, limits.movetime_ms)
                           .cast<py::tuple>();
            if (out.size() != 4) {
                throw cr::EvaluatorUnavailable(
                    "Python evaluator must return (best_uci, score_text, depth, pv)");
            }
            cr::EvalResult r;
            r.best_move = out[0].is_none() ? std::string() : out[0].cast<std::string>();
            r.score = cr::parse_score_or_neutral(py::str(out[1]).cast<std::string>());
            r.depth = out[2].cast<int>();
            r.pv = out[3].cast<std::vector<std::string>>();
            return r;
        } catch (py::error_already_set& e) {
            throw cr::EvaluatorUnavailable(std::string("Python evaluator failed: ") + e.what());
        } catch (const py::cast_error& e) {
            throw cr::EvaluatorUnavailable(std::string("Python evaluator returned bad data: ") +
                                           e.what());
        }
    }

    bool available() const override {
        py::gil_scoped_acquire gil;
        if (!py::hasattr(impl_, "available")) return true;
        try {
            return impl_.attr("available")().cast<bool>();
        } catch (py::error_already_set& e) {
            cr::log_warn("analysis", std::string("available() raised: ") + e.what());
            return false;
        }
    }

   private:
    py::object impl_;
};

/// Keeps the evaluator alive for as long as the analyzer that uses it.
struct PyGameAnalyzer {
    std::shared_ptr<cr::PositionEvaluator> evaluator;
    cr::GameAnalyzer analyzer;

    PyGameAnalyzer(std::shared_ptr<cr::PositionEvaluator> ev, cr::AnalyzerConfig config)
        : evaluator(std::move(ev)), analyzer(*evaluator, config) {}
};

// ── Dict conversion ─────────────────────────────────────────────────────────

py::object optional_square(const std::optional<cr::Square>& sq) {
    if (!sq) return py::none();
    return py::str(cr::square_name(*sq));
}

py::dict motif_to_dict(const cr::Motif& m) {
    py::list targets;
    for (cr::Square sq : m.target_squares) targets.append(cr::square_name(sq));
    py::dict d;
    d["type"] = std::string(cr::to_string(m.type));
    d["attacker_square"] = optional_square(m.attacker_square);
    d["target_squares"] = targets;
    d["description"] = m.description;
    d["severity"] = std::string(cr::to_string(m.severity));
    return d;
}

py::list motifs_to_list(const std::vector<cr::Motif>& motifs) {
    py::list out;
    for (const cr::Motif& m : motifs) out.append(motif_to_dict(m));
    return out;
}

py::dict move_to_dict(const cr::MoveAnalysis& m) {
    py::dict d;
    d["move_number"] = m.move_number;
    d["color"] = std::string(cr::color_name(m.color));
    d["move_san"] = m.move_san;
    d["eval_before"] = m.eval_before;
    d["eval_after"] = m.eval_after;
    d["eval_change"] = m.eval_change;
    d["best_move"] = m.best_move;
    d["best_eval"] = m.best_eval;
    d["classification"] = std::string(cr::to_string(m.classification));
    d["comment"] = m.comment;
    d["is_capture"] = m.is_capture;
    d["is_check"] = m.is_check;
    d["is_sacrifice"] = m.is_sacrifice;
    d["fen_after"] = m.fen_after;
    return d;
}

py::dict game_to_dict(const cr::GameAnalysis& g) {
    py::list moves;
    for (const cr::MoveAnalysis& m : g.moves) moves.append(move_to_dict(m));
    py::dict d;
    d["moves"] = moves;
    d["white_blunders"] = g.white.blunders;
    d["white_mistakes"] = g.white.mistakes;
    d["white_inaccuracies"] = g.white.inaccuracies;
    d["black_blunders"] = g.black.blunders;
    d["black_mistakes"] = g.black.mistakes;
    d["black_inaccuracies"] = g.black.inaccuracies;
    d["critical_moments"] = g.critical_moments;
    d["summary"] = g.summary;
    return d;
}

py::dict material_to_dict(const cr::MaterialBalance& mb) {
    py::dict d;
    d["white"] = mb.white;
    d["black"] = mb.black;
    d["balance"] = mb.balance;
    d["description"] = mb.description;
    return d;
}

py::dict assessment_to_dict(const cr::PositionAssessment& a) {
    py::list best;
    for (const cr::CandidateMove& c : a.best_moves) {
        py::dict d;
        d["move"] = c.move;
        d["score"] = c.score;
        d["line"] = c.line;
        best.append(d);
    }
    py::dict d;
    d["evaluation"] = a.evaluation_text;
    d["evaluation_pawns"] = a.evaluation;
    d["best_moves"] = best;
    d["is_tactical"] = a.is_tactical;
    d["material"] = material_to_dict(a.material);
    return d;
}

cr::Move parse_move_or_throw(const cr::Position& pos, const std::string& text) {
    auto m = cr::san::from_san(pos, text);
    if (!m) throw cr::InvalidGameRecord("Illegal or unparseable move '" + text + "'", 1, text);
    return *m;
}

}  // namespace

PYBIND11_MODULE(_chessreview, m) {
    m.doc() = "Chess game review core: tactical motifs and move classification (pybind11)";

    auto base_error = py::register_exception<cr::Error>(m, "Error", PyExc_RuntimeError);
    py::register_exception<cr::EvaluatorUnavailable>(m, "EvaluatorUnavailable", base_error);
    py::register_exception<cr::InvalidGameRecord>(m, "InvalidGameRecord", base_error);
    py::register_exception<cr::MalformedScore>(m, "MalformedScore", base_error);

    m.def(
        "set_log_level",
        [](int level) { cr::set_log_level(static_cast<cr::LogLevel>(level)); },
        py::arg("level"), "0 = silent, 1 = warnings (default), 2 = info, 3 = debug.");

    // ── Tactics ─────────────────────────────────────────────────────────

    m.def(
        "analyze_tactics",
        [](const std::string& fen) {
            return motifs_to_list(cr::tactics::analyze_tactics(cr::Position::from_fen(fen)));
        },
        py::arg("fen"), "All pins, forks, hanging pieces and skewers in the position.");

    m.def(
        "analyze_move_tactics",
        [](const std::string& fen, const std::string& move) {
            cr::Position pos = cr::Position::from_fen(fen);
            cr::MoveTactics mt =
                cr::tactics::analyze_move_tactics(pos, parse_move_or_throw(pos, move));
            py::dict d;
            d["creates_threat"] = mt.creates_threat;
            d["threats"] = motifs_to_list(mt.threats);
            d["tactical_motifs"] = motifs_to_list(mt.motifs_after);
            return d;
        },
        py::arg("fen"), py::arg("move"), "Motifs that *move* creates.");

    m.def(
        "tactical_summary",
        [](const std::string& fen) {
            return cr::tactics::tactical_summary(
                cr::tactics::analyze_tactics(cr::Position::from_fen(fen)));
        },
        py::arg("fen"));

    // ── Classification ──────────────────────────────────────────────────

    m.def(
        "classify_move",
        [](double eval_change, bool had_better_move, bool is_sacrifice, double eval_before,
           double eval_after, bool is_only_good_move) {
            cr::classify::ClassifierInput in;
            in.eval_change = eval_change;
            in.had_better_move = had_better_move;
            in.is_sacrifice = is_sacrifice;
            in.eval_before = eval_before;
            in.eval_after = eval_after;
            in.is_only_good_move = is_only_good_move;
            return std::string(cr::to_string(cr::classify::classify_move(in)));
        },
        py::arg("eval_change"), py::arg("had_better_move") = false,
        py::arg("is_sacrifice") = false, py::arg("eval_before") = 0.0,
        py::arg("eval_after") = 0.0, py::arg("is_only_good_move") = false,
        "Classification name for an evaluation swing in pawns (mover's view).");

    m.def(
        "classification_comment",
        [](const std::string& classification, double eval_change,
           std::optional<std::string> best_move, bool is_sacrifice) {
            auto c = cr::classification_from_string(classification);
            if (!c) throw py::value_error("Unknown classification: " + classification);
            return cr::classify::classification_comment(*c, eval_change, best_move, is_sacrifice);
        },
        py::arg("classification"), py::arg("eval_change"), py::arg("best_move") = py::none(),
        py::arg("is_sacrifice") = false);

    m.def(
        "material_balance",
        [](const std::string& fen) {
            return material_to_dict(cr::material_balance(cr::Position::from_fen(fen)));
        },
        py::arg("fen"));

    m.def(
        "find_engine_executable",
        [](const std::string& configured) { return cr::find_engine_executable(configured); },
        py::arg("configured") = "");

    // ── UciEvaluator ────────────────────────────────────────────────────

    py::class_<cr::UciEvaluator, std::shared_ptr<cr::UciEvaluator>>(m, "UciEvaluator")
        .def(py::init([](const std::string& path, int skill_level, int threads, int hash_mb,
                         int handshake_timeout_ms) {
                 cr::UciEvaluatorConfig cfg;
                 cfg.path = path;
                 cfg.skill_level = skill_level;
                 cfg.threads = threads;
                 cfg.hash_mb = hash_mb;
                 cfg.handshake_timeout_ms = handshake_timeout_ms;
                 return std::make_shared<cr::UciEvaluator>(cfg);
             }),
             py::arg("path") = "", py::arg("skill_level") = 20, py::arg("threads") = 1,
             py::arg("hash_mb") = 16, py::arg("handshake_timeout_ms") = 3000)
        .def("start", &cr::UciEvaluator::start, py::call_guard<py::gil_scoped_release>(),
             "Launch the engine; returns False when it cannot be started.")
        .def("stop", &cr::UciEvaluator::stop, py::call_guard<py::gil_scoped_release>())
        .def("cancel", &cr::UciEvaluator::cancel, "Stop an in-flight search (thread-safe).")
        .def("available", &cr::UciEvaluator::available)
        .def_property_readonly("engine_name", &cr::UciEvaluator::engine_name)
        .def(
            "evaluate",
            [](cr::UciEvaluator& self, const std::string& fen, int depth,
               std::int64_t movetime_ms) -> py::tuple {
                cr::Position pos = cr::Position::from_fen(fen);
                cr::EvalResult r;
                {
                    py::gil_scoped_release release;
                    r = self.evaluate(pos, {depth, movetime_ms});
                }
                return py::make_tuple(r.best_move, r.score.to_string(), r.depth, r.pv);
            },
            py::arg("fen"), py::arg("depth") = 12, py::arg("movetime_ms") = 1000,
            "Returns ``(best_uci, score_text, depth, pv)`` from the side to move's view.");

    // ── GameAnalyzer ────────────────────────────────────────────────────

    py::class_<PyGameAnalyzer>(m, "GameAnalyzer")
        .def(py::init([](py::object evaluator, int depth, std::int64_t movetime_ms,
                         double blunder_threshold_cp, int assessment_lines) {
                 cr::AnalyzerConfig cfg;
                 cfg.limits = {depth, movetime_ms};
                 cfg.blunder_threshold_cp = blunder_threshold_cp;
                 cfg.assessment_lines = assessment_lines;

                 std::shared_ptr<cr::PositionEvaluator> ev;
                 if (py::isinstance<cr::UciEvaluator>(evaluator)) {
                     ev = evaluator.cast<std::shared_ptr<cr::UciEvaluator>>();
                 } else if (py::hasattr(evaluator, "evaluate")) {
                     ev = std::make_shared<PyObjectEvaluator>(evaluator);
                 } else {
                     throw py::type_error("evaluator must be a UciEvaluator or define evaluate()");
                 }
                 return std::make_unique<PyGameAnalyzer>(std::move(ev), cfg);
             }),
             py::arg("evaluator"), py::arg("depth") = 12, py::arg("movetime_ms") = 1000,
             py::arg("blunder_threshold_cp") = 100.0, py::arg("assessment_lines") = 3)
        .def(
            "analyze_pgn",
            [](PyGameAnalyzer& self, const std::string& pgn_text) {
                cr::GameAnalysis g;
                {
                    py::gil_scoped_release release;
                    g = self.analyzer.analyze_pgn(pgn_text);
                }
                return game_to_dict(g);
            },
            py::arg("pgn_text"))
        .def(
            "analyze_moves",
            [](PyGameAnalyzer& self, const std::vector<std::string>& moves,
               const std::string& start_fen) {
                cr::GameAnalysis g;
                {
                    py::gil_scoped_release release;
                    g = self.analyzer.analyze_moves(start_fen, moves);
                }
                return game_to_dict(g);
            },
            py::arg("moves"), py::arg("start_fen") = std::string(cr::kStartingFen))
        .def(
            "check_blunder",
            [](PyGameAnalyzer& self, const std::string& fen, const std::string& move,
               std::optional<double> threshold_cp) {
                cr::Position pos = cr::Position::from_fen(fen);
                cr::Move mv = parse_move_or_throw(pos, move);
                cr::BlunderCheck bc;
                {
                    py::gil_scoped_release release;
                    bc = threshold_cp ? self.analyzer.check_blunder(pos, mv, *threshold_cp)
                                      : self.analyzer.check_blunder(pos, mv);
                }
                py::dict d;
                d["is_blunder"] = bc.is_blunder;
                d["best_move"] = bc.best_move;
                d["eval_loss_cp"] = bc.eval_loss_cp;
                d["classification"] = std::string(cr::to_string(bc.classification));
                return d;
            },
            py::arg("fen"), py::arg("move"), py::arg("threshold_cp") = py::none())
        .def(
            "tutor_feedback",
            [](PyGameAnalyzer& self, const std::string& fen, const std::string& move) {
                cr::Position pos = cr::Position::from_fen(fen);
                py::gil_scoped_release release;
                return self.analyzer.tutor_feedback(pos, move);
            },
            py::arg("fen"), py::arg("move"),
            "Coaching text for a player's move, or None when there is nothing to say.")
        .def(
            "assess_position",
            [](PyGameAnalyzer& self, const std::string& fen) {
                cr::Position pos = cr::Position::from_fen(fen);
                cr::PositionAssessment a;
                {
                    py::gil_scoped_release release;
                    a = self.analyzer.assess_position(pos);
                }
                return assessment_to_dict(a);
            },
            py::arg("fen"), "Evaluation, top moves, tactical flag and material balance.");
}
