#pragma once

/// @file uci_evaluator.hpp
/// PositionEvaluator backed by an external UCI engine process (e.g. Stockfish).

#include <chessreview/evaluator.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace chessreview {

struct UciEvaluatorConfig {
    std::string path;  ///< empty: locate with find_engine_executable()
    int skill_level = 20;
    int threads = 1;
    int hash_mb = 16;
    int handshake_timeout_ms = 3000;
};

/// Locate a UCI engine binary. Tries `configured`, then $CHESSREVIEW_ENGINE,
/// the usual Stockfish install locations and finally every PATH entry.
[[nodiscard]] std::optional<std::string> find_engine_executable(std::string_view configured = {});

/// One engine process is one session. evaluate() calls are serialized, so a
/// single instance may be shared, but a cancellable analysis should own its own.
class UciEvaluator : public PositionEvaluator {
   public:
    explicit UciEvaluator(UciEvaluatorConfig config = {});
    ~UciEvaluator() override;

    UciEvaluator(const UciEvaluator&) = delete;
    UciEvaluator& operator=(const UciEvaluator&) = delete;

    /// Launch the engine, run the uci/isready handshake and apply options.
    /// Returns false (and logs) when the engine cannot be started.
    bool start();

    /// Send "quit" and reap the process.
    void stop() noexcept;

    /// Ask an in-flight search to stop early (thread-safe). The caller should
    /// discard the result of the interrupted evaluate().
    void cancel() noexcept;

    EvalResult evaluate(const Position& pos, const EvalLimits& limits) override;

    [[nodiscard]] bool available() const override {
        return running_.load(std::memory_order_acquire);
    }

    /// Engine name from "id name", empty before start().
    [[nodiscard]] const std::string& engine_name() const noexcept { return engine_name_; }
    [[nodiscard]] const UciEvaluatorConfig& config() const noexcept { return config_; }

    /// Fold one line of engine output into `result`.
    /// Handles "info ... depth N ... multipv K ... score cp|mate X ... pv m1 m2 ..."
    /// and "bestmove M". Only variation 1 updates score, depth and pv; every
    /// variation lands in `lines`. Returns true once the bestmove line has been seen.
    static bool parse_line(std::string_view line, EvalResult& result);

   private:
    struct Process;

    void send(const std::string& line);
    std::string expect(std::string_view token, int timeout_ms);
    void fail(const std::string& why);

    UciEvaluatorConfig config_;
    std::unique_ptr<Process> process_;
    std::string engine_name_;
    int multipv_ = 1;  // MultiPV value the engine currently has

    std::mutex session_mutex_;  // one evaluate() at a time
    std::mutex write_mutex_;    // evaluate() and cancel() both write
    std::atomic<bool> running_{false};
    std::atomic<bool> searching_{false};
};

}  // namespace chessreview
