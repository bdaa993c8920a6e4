/// @file evaluator.cpp
/// Score text parsing and formatting.

#include <chessreview/evaluator.hpp>

#include <chessreview/errors.hpp>
#include <chessreview/log.hpp>

#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>

namespace chessreview {

namespace {

// Largest pawn value whose centipawn count still fits an int.
constexpr double kMaxPawns = std::numeric_limits<int>::max() / 100;

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' ||
                          s.back() == '\n'))
        s.remove_suffix(1);
    return s;
}

bool parse_whole_int(std::string_view sv, int& out) {
    if (!sv.empty() && sv.front() == '+') sv.remove_prefix(1);
    if (sv.empty()) return false;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

bool parse_whole_double(std::string_view sv, double& out) {
    if (!sv.empty() && sv.front() == '+') sv.remove_prefix(1);
    if (sv.empty()) return false;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc{} && ptr == sv.data() + sv.size() && std::isfinite(out);
}

}  // namespace

Score Score::parse(std::string_view text) {
    std::string_view s = trim(text);
    int n = 0;

    if (s.substr(0, 3) == "cp ") {
        if (parse_whole_int(trim(s.substr(3)), n)) return centipawns(n);
    } else if (s.substr(0, 5) == "mate ") {
        if (parse_whole_int(trim(s.substr(5)), n)) return mate_in(n);
    } else if (!s.empty() && (s.front() == 'M' || s.front() == '#')) {
        if (parse_whole_int(s.substr(1), n)) return mate_in(n);
    } else {
        double pawns = 0.0;
        if (parse_whole_double(s, pawns) && std::fabs(pawns) <= kMaxPawns) {
            return centipawns(static_cast<int>(std::lround(pawns * 100.0)));
        }
    }
    throw MalformedScore(std::string(text));
}

std::string Score::to_string() const {
    if (mate_) return "M" + std::to_string(value_);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", value_ / 100.0);
    return buf;
}

Score parse_score_or_neutral(std::string_view text) {
    try {
        return Score::parse(text);
    } catch (const MalformedScore& e) {
        log_warn("analysis", std::string(e.what()) + ", treating as 0.0");
        return Score::centipawns(0);
    }
}

}  // namespace chessreview
