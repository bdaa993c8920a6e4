/// @file log.cpp

#include <chessreview/log.hpp>

#include <atomic>
#include <iostream>
#include <mutex>

namespace chessreview {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Warn)};
std::mutex g_write_mutex;

}  // namespace

void set_log_level(LogLevel level) noexcept {
    g_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() noexcept {
    return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed));
}

void log(LogLevel level, std::string_view tag, std::string_view message) {
    const int enabled = g_level.load(std::memory_order_relaxed);
    if (level == LogLevel::Silent || static_cast<int>(level) > enabled) return;
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << '[' << tag << "] " << message << '\n';
}

}  // namespace chessreview
