/// @file cli.cpp
/// chessreview-cli: tactical scan of a FEN or engine-backed review of a PGN game.

#include <chessreview/analyzer.hpp>
#include <chessreview/errors.hpp>
#include <chessreview/log.hpp>
#include <chessreview/material.hpp>
#include <chessreview/tactics.hpp>
#include <chessreview/uci_evaluator.hpp>

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

struct Options {
    std::string engine_path;
    std::string fen{chessreview::kStartingFen};
    int depth = 12;
    std::int64_t movetime_ms = 1000;
    bool verbose = false;
    std::string command;
    std::string pgn_file;
};

[[noreturn]] void usage_and_exit() {
    std::cerr << "Usage: chessreview-cli [options] tactics\n"
                 "       chessreview-cli [options] analyze FILE.pgn\n"
                 "Options:\n"
                 "  --engine <path>    UCI engine binary (default autodetect)\n"
                 "  --depth <N>        Search depth per position (default 12)\n"
                 "  --movetime <ms>    Search time per position (default 1000)\n"
                 "  --fen <FEN>        Position for 'tactics' (default start position)\n"
                 "  -v                 Verbose diagnostics\n";
    std::exit(1);
}

int to_int(const std::string& flag, const std::string& value) {
    try {
        std::size_t used = 0;
        int v = std::stoi(value, &used);
        if (used == value.size()) return v;
    } catch (const std::logic_error&) {
    }
    std::cerr << "Invalid number for " << flag << ": " << value << "\n";
    usage_and_exit();
}

Options parse_args(int argc, char** argv) {
    Options o;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) usage_and_exit();
            return argv[++i];
        };

        if (arg == "--engine") {
            o.engine_path = next();
        } else if (arg == "--depth") {
            o.depth = to_int(arg, next());
        } else if (arg == "--movetime") {
            o.movetime_ms = to_int(arg, next());
        } else if (arg == "--fen") {
            o.fen = next();
        } else if (arg == "-v" || arg == "--verbose") {
            o.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            usage_and_exit();
        } else if (o.command.empty()) {
            o.command = arg;
        } else if (o.command == "analyze" && o.pgn_file.empty()) {
            o.pgn_file = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            usage_and_exit();
        }
    }
    if (o.command != "tactics" && o.command != "analyze") usage_and_exit();
    if (o.command == "analyze" && o.pgn_file.empty()) usage_and_exit();
    return o;
}

int run_tactics(const Options& o) {
    using namespace chessreview;
    const Position pos = Position::from_fen(o.fen);
    const auto motifs = tactics::analyze_tactics(pos);

    for (const Motif& m : motifs) {
        std::cout << std::left << std::setw(14) << to_string(m.type) << std::setw(10)
                  << to_string(m.severity) << m.description << "\n";
    }
    if (!motifs.empty()) std::cout << "\n";
    std::cout << tactics::tactical_summary(motifs) << "\n";
    std::cout << material_balance(pos).description << "\n";
    return 0;
}

int run_analyze(const Options& o) {
    using namespace chessreview;

    std::ifstream in(o.pgn_file);
    if (!in) {
        std::cerr << "Cannot open " << o.pgn_file << "\n";
        return 2;
    }
    std::stringstream buf;
    buf << in.rdbuf();

    UciEvaluatorConfig ecfg;
    ecfg.path = o.engine_path;
    UciEvaluator engine(ecfg);
    if (!engine.start()) {
        std::cerr << "No usable UCI engine; pass --engine or set CHESSREVIEW_ENGINE\n";
        return 2;
    }

    AnalyzerConfig acfg;
    acfg.limits = {o.depth, o.movetime_ms};
    GameAnalyzer analyzer(engine, acfg);
    const GameAnalysis game = analyzer.analyze_pgn(buf.str());

    for (const MoveAnalysis& m : game.moves) {
        std::cout << std::right << std::setw(3) << m.move_number
                  << (m.color == Color::White ? ".    " : "... ") << std::left << std::setw(8)
                  << m.move_san << std::setw(11) << to_string(m.classification) << std::right
                  << std::fixed << std::setprecision(2) << std::setw(8) << m.eval_after << "  "
                  << m.comment << "\n";
    }
    std::cout << "\n" << game.summary << "\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    const Options opts = parse_args(argc, argv);
    chessreview::set_log_level(opts.verbose ? chessreview::LogLevel::Info
                                            : chessreview::LogLevel::Warn);
    try {
        return opts.command == "tactics" ? run_tactics(opts) : run_analyze(opts);
    } catch (const chessreview::InvalidGameRecord& e) {
        std::cerr << "Invalid game: " << e.what() << "\n";
    } catch (const chessreview::EvaluatorUnavailable& e) {
        std::cerr << "Engine unavailable: " << e.what() << "\n";
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid input: " << e.what() << "\n";
    }
    return 2;
}
