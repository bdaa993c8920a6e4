#pragma once

/// @file log.hpp
/// Process-wide diagnostic output: tagged lines on stderr, gated by a level.

#include <string_view>

namespace chessreview {

enum class LogLevel : int { Silent = 0, Warn = 1, Info = 2, Debug = 3 };

/// Set the verbosity for all subsequent log lines (default Warn).
void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

/// Write "[tag] message" to std::cerr when `level` is enabled.
void log(LogLevel level, std::string_view tag, std::string_view message);

inline void log_warn(std::string_view tag, std::string_view message) {
    log(LogLevel::Warn, tag, message);
}
inline void log_info(std::string_view tag, std::string_view message) {
    log(LogLevel::Info, tag, message);
}
inline void log_debug(std::string_view tag, std::string_view message) {
    log(LogLevel::Debug, tag, message);
}

}  // namespace chessreview
