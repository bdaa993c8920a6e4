/// @file uci_evaluator.cpp
/// UCI engine session over fork/exec and a pair of pipes (POSIX).

#include <chessreview/uci_evaluator.hpp>

#include <chessreview/errors.hpp>
#include <chessreview/log.hpp>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <thread>
#include <utility>
#include <vector>

#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace chessreview {

namespace {

constexpr const char* kLogTag = "uci";

// Extra time allowed past the requested movetime before "stop" is sent.
constexpr int kSearchGraceMs = 10000;

constexpr int kMaxMultiPv = 64;

constexpr const char* kKnownLocations[] = {
    "/usr/local/bin/stockfish",
    "/usr/bin/stockfish",
    "/opt/homebrew/bin/stockfish",
};

bool is_executable(const std::string& path) {
    return !path.empty() && ::access(path.c_str(), X_OK) == 0;
}

std::vector<std::string_view> split_ws(std::string_view s) {
    std::vector<std::string_view> out;
    std::size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\r' || s[i] == '\n')) ++i;
        std::size_t start = i;
        while (i < s.size() && s[i] != ' ' && s[i] != '\t' && s[i] != '\r' && s[i] != '\n') ++i;
        if (i > start) out.push_back(s.substr(start, i - start));
    }
    return out;
}

bool to_int(std::string_view sv, int& out) {
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

/// Blocks SIGPIPE on the calling thread while writing to the engine, so a
/// dead engine shows up as EPIPE. A SIGPIPE raised meanwhile is consumed
/// before the previous mask comes back; the process-wide disposition is untouched.
class SigpipeGuard {
   public:
    SigpipeGuard() noexcept {
        sigemptyset(&pipe_set_);
        sigaddset(&pipe_set_, SIGPIPE);
        sigset_t pending;
        sigemptyset(&pending);
        already_pending_ = ::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1;
        ::pthread_sigmask(SIG_BLOCK, &pipe_set_, &saved_);
    }

    ~SigpipeGuard() {
        if (!already_pending_) {
            const timespec no_wait{0, 0};
            while (::sigtimedwait(&pipe_set_, nullptr, &no_wait) == SIGPIPE) {
            }
        }
        ::pthread_sigmask(SIG_SETMASK, &saved_, nullptr);
    }

    SigpipeGuard(const SigpipeGuard&) = delete;
    SigpipeGuard& operator=(const SigpipeGuard&) = delete;

   private:
    sigset_t pipe_set_;
    sigset_t saved_;
    bool already_pending_ = false;
};

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

}  // namespace

// ── Engine discovery ────────────────────────────────────────────────────────

std::optional<std::string> find_engine_executable(std::string_view configured) {
    if (!configured.empty()) {
        std::string path(configured);
        if (is_executable(path)) return path;
        log_warn(kLogTag, "Configured engine is not executable: " + path);
    }

    if (const char* env = std::getenv("CHESSREVIEW_ENGINE"); env && is_executable(env)) {
        return std::string(env);
    }

    for (const char* candidate : kKnownLocations) {
        if (is_executable(candidate)) return std::string(candidate);
    }

    if (const char* path_env = std::getenv("PATH")) {
        std::string_view dirs(path_env);
        while (!dirs.empty()) {
            std::size_t colon = dirs.find(':');
            std::string_view dir = dirs.substr(0, colon);
            dirs = colon == std::string_view::npos ? std::string_view{} : dirs.substr(colon + 1);
            if (dir.empty()) continue;
            std::string candidate = std::string(dir) + "/stockfish";
            if (is_executable(candidate)) return candidate;
        }
    }
    return std::nullopt;
}

// ── Process ─────────────────────────────────────────────────────────────────

struct UciEvaluator::Process {
    enum class ReadStatus { Line, Timeout, Closed };

    pid_t pid = -1;
    int stdin_write = -1;  // parent -> child stdin
    int stdout_read = -1;  // child stdout -> parent
    std::string read_buf;

    ~Process() { terminate(); }

    bool spawn(const std::string& exe_path) {
        int in_pipe[2] = {-1, -1};
        int out_pipe[2] = {-1, -1};
        if (::pipe(in_pipe) != 0) return false;
        if (::pipe(out_pipe) != 0) {
            ::close(in_pipe[0]);
            ::close(in_pipe[1]);
            return false;
        }

        pid_t child = ::fork();
        if (child < 0) {
            ::close(in_pipe[0]);
            ::close(in_pipe[1]);
            ::close(out_pipe[0]);
            ::close(out_pipe[1]);
            return false;
        }

        if (child == 0) {
            ::dup2(in_pipe[0], STDIN_FILENO);
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::close(in_pipe[0]);
            ::close(in_pipe[1]);
            ::close(out_pipe[0]);
            ::close(out_pipe[1]);
            char* const argv[] = {const_cast<char*>(exe_path.c_str()), nullptr};
            ::execv(exe_path.c_str(), argv);
            _exit(127);
        }

        ::close(in_pipe[0]);
        ::close(out_pipe[1]);
        pid = child;
        stdin_write = in_pipe[1];
        stdout_read = out_pipe[0];
        return true;
    }

    bool write_all(const std::string& s) {
        if (stdin_write < 0) return false;
        SigpipeGuard guard;
        const char* p = s.data();
        std::size_t remaining = s.size();
        while (remaining > 0) {
            ssize_t n = ::write(stdin_write, p, remaining);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            p += n;
            remaining -= static_cast<std::size_t>(n);
        }
        return true;
    }

    /// Next line without its terminator. `timeout_ms` < 0 waits indefinitely.
    ReadStatus read_line(std::string& out, int timeout_ms) {
        using Clock = std::chrono::steady_clock;
        const auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

        for (;;) {
            std::size_t nl = read_buf.find('\n');
            if (nl != std::string::npos) {
                out.assign(read_buf, 0, nl);
                if (!out.empty() && out.back() == '\r') out.pop_back();
                read_buf.erase(0, nl + 1);
                return ReadStatus::Line;
            }
            if (stdout_read < 0) return ReadStatus::Closed;

            int wait_ms = -1;
            if (timeout_ms >= 0) {
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - Clock::now());
                if (left.count() <= 0) return ReadStatus::Timeout;
                wait_ms = static_cast<int>(left.count());
            }

            pollfd pfd{stdout_read, POLLIN, 0};
            int ready = ::poll(&pfd, 1, wait_ms);
            if (ready < 0) {
                if (errno == EINTR) continue;
                return ReadStatus::Closed;
            }
            if (ready == 0) return ReadStatus::Timeout;

            char tmp[4096];
            ssize_t n = ::read(stdout_read, tmp, sizeof(tmp));
            if (n < 0) {
                if (errno == EINTR) continue;
                return ReadStatus::Closed;
            }
            if (n == 0) {
                if (read_buf.empty()) return ReadStatus::Closed;
                read_buf += '\n';  // flush a final unterminated line
                continue;
            }
            read_buf.append(tmp, static_cast<std::size_t>(n));
        }
    }

    void terminate() noexcept {
        if (stdin_write >= 0) {
            SigpipeGuard guard;
            constexpr char kQuit[] = "quit\n";
            ssize_t written = ::write(stdin_write, kQuit, sizeof(kQuit) - 1);
            (void)written;
        }
        close_fd(stdin_write);
        close_fd(stdout_read);

        if (pid > 0) {
            int status = 0;
            for (int i = 0; i < 50; ++i) {
                if (::waitpid(pid, &status, WNOHANG) == pid) {
                    pid = -1;
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            if (pid > 0) {
                ::kill(pid, SIGKILL);
                ::waitpid(pid, &status, 0);
                pid = -1;
            }
        }
        read_buf.clear();
    }
};

// ── UciEvaluator ────────────────────────────────────────────────────────────

UciEvaluator::UciEvaluator(UciEvaluatorConfig config) : config_(std::move(config)) {}

UciEvaluator::~UciEvaluator() {
    stop();
}

bool UciEvaluator::start() {
    std::lock_guard<std::mutex> session(session_mutex_);
    stop();

    auto exe = find_engine_executable(config_.path);
    if (!exe) {
        log_warn(kLogTag, "No UCI engine found (install stockfish or set CHESSREVIEW_ENGINE)");
        return false;
    }

    process_ = std::make_unique<Process>();
    if (!process_->spawn(*exe)) {
        log_warn(kLogTag, "Failed to launch engine: " + *exe);
        process_.reset();
        return false;
    }
    running_.store(true, std::memory_order_release);

    try {
        send("uci");
        std::string line;
        for (;;) {
            auto status = process_->read_line(line, config_.handshake_timeout_ms);
            if (status != Process::ReadStatus::Line) fail("Engine did not answer 'uci'");
            if (line.rfind("id name ", 0) == 0) engine_name_ = line.substr(8);
            if (line == "uciok") break;
        }

        send("setoption name Threads value " + std::to_string(std::max(1, config_.threads)));
        send("setoption name Hash value " + std::to_string(std::max(1, config_.hash_mb)));
        send("setoption name Skill Level value " + std::to_string(config_.skill_level));
        multipv_ = 1;
        send("isready");
        expect("readyok", config_.handshake_timeout_ms);
    } catch (const EvaluatorUnavailable& e) {
        log_warn(kLogTag, std::string("Engine handshake failed: ") + e.what());
        return false;
    }

    log_info(kLogTag, "Engine started (" + (engine_name_.empty() ? *exe : engine_name_) +
                          ", skill=" + std::to_string(config_.skill_level) + ")");
    return true;
}

void UciEvaluator::stop() noexcept {
    running_.store(false, std::memory_order_release);
    searching_.store(false, std::memory_order_release);
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (process_) {
        process_->terminate();
        process_.reset();
    }
}

void UciEvaluator::cancel() noexcept {
    if (!searching_.load(std::memory_order_acquire)) return;
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (process_ && !process_->write_all("stop\n")) {
        log_warn(kLogTag, "Could not deliver 'stop' to engine");
    }
}

EvalResult UciEvaluator::evaluate(const Position& pos, const EvalLimits& limits) {
    std::lock_guard<std::mutex> session(session_mutex_);
    if (!running_.load(std::memory_order_acquire) || !process_) {
        throw EvaluatorUnavailable("UCI engine is not running");
    }

    std::string go = "go";
    if (limits.depth > 0) go += " depth " + std::to_string(limits.depth);
    if (limits.movetime_ms > 0) go += " movetime " + std::to_string(limits.movetime_ms);
    if (go == "go") go += " movetime 1000";

    const int multipv = std::clamp(limits.multipv, 1, kMaxMultiPv);
    if (multipv != multipv_) {
        send("setoption name MultiPV value " + std::to_string(multipv));
        multipv_ = multipv;
    }

    send("position fen " + pos.to_fen());
    searching_.store(true, std::memory_order_release);
    send(go);

    int timeout_ms =
        limits.movetime_ms > 0 ? static_cast<int>(limits.movetime_ms) + kSearchGraceMs : -1;
    bool stop_sent = false;

    EvalResult result;
    std::string line;
    for (;;) {
        auto status = process_->read_line(line, timeout_ms);
        if (status == Process::ReadStatus::Closed) fail("Engine closed its output during search");
        if (status == Process::ReadStatus::Timeout) {
            if (stop_sent) fail("Engine did not return a best move");
            log_warn(kLogTag, "Search overran its time budget, sending stop");
            send("stop");
            stop_sent = true;
            timeout_ms = config_.handshake_timeout_ms;
            continue;
        }
        if (parse_line(line, result)) break;
    }
    searching_.store(false, std::memory_order_release);

    log_debug(kLogTag, "bestmove " + result.best_move + " score " + result.score.to_string() +
                           " depth " + std::to_string(result.depth));
    return result;
}

bool UciEvaluator::parse_line(std::string_view line, EvalResult& result) {
    const auto tok = split_ws(line);
    if (tok.empty()) return false;

    if (tok[0] == "bestmove") {
        if (tok.size() > 1 && tok[1] != "(none)" && tok[1] != "0000") {
            result.best_move = std::string(tok[1]);
        }
        if (result.pv.empty() && !result.best_move.empty()) result.pv.push_back(result.best_move);
        if (result.lines.empty() && !result.pv.empty()) {
            result.lines.push_back({result.score, result.pv});
        }
        return true;
    }
    if (tok[0] != "info") return false;

    int depth = result.depth;
    int multipv = 1;
    std::optional<Score> score;
    std::vector<std::string> pv;

    for (std::size_t i = 1; i < tok.size(); ++i) {
        if (tok[i] == "string") {
            return false;  // free text to end of line
        } else if (tok[i] == "multipv" && i + 1 < tok.size()) {
            if (!to_int(tok[++i], multipv) || multipv < 1 || multipv > kMaxMultiPv) return false;
        } else if (tok[i] == "depth" && i + 1 < tok.size()) {
            int d = 0;
            if (to_int(tok[++i], d)) depth = d;
        } else if (tok[i] == "score" && i + 2 < tok.size()) {
            score = parse_score_or_neutral(std::string(tok[i + 1]) + " " + std::string(tok[i + 2]));
            i += 2;
        } else if (tok[i] == "pv") {
            for (++i; i < tok.size(); ++i) pv.emplace_back(tok[i]);
        }
    }

    if (!score) return false;

    const auto index = static_cast<std::size_t>(multipv - 1);
    if (result.lines.size() <= index) result.lines.resize(index + 1);
    result.lines[index].score = *score;
    if (!pv.empty()) result.lines[index].pv = pv;

    if (multipv == 1) {
        result.score = *score;
        result.depth = depth;
        if (!pv.empty()) result.pv = std::move(pv);
    }
    return false;
}

// ── Private helpers ─────────────────────────────────────────────────────────

void UciEvaluator::send(const std::string& line) {
    bool ok = false;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        ok = process_ && process_->write_all(line + "\n");
    }
    if (!ok) fail("Failed to write '" + line + "' to engine");
}

std::string UciEvaluator::expect(std::string_view token, int timeout_ms) {
    std::string line;
    for (;;) {
        auto status = process_->read_line(line, timeout_ms);
        if (status != Process::ReadStatus::Line) {
            fail("Timed out waiting for '" + std::string(token) + "'");
        }
        if (line.rfind(token, 0) == 0) return line;
    }
}

void UciEvaluator::fail(const std::string& why) {
    log_warn(kLogTag, why);
    stop();
    throw EvaluatorUnavailable(why);
}

}  // namespace chessreview
