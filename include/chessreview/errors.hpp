#pragma once

/// @file errors.hpp
/// Exception hierarchy for analysis failures.
///
/// Structural failures (no evaluator, unplayable game record) abort the
/// current analysis call. A malformed evaluator score is recoverable: the
/// analyzer logs it and substitutes a neutral evaluation.

#include <stdexcept>
#include <string>
#include <utility>

namespace chessreview {

class Error : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

/// The position evaluator cannot be reached or returned no result.
class EvaluatorUnavailable : public Error {
   public:
    using Error::Error;
};

/// A move sequence that cannot be parsed or replayed from its start position.
class InvalidGameRecord : public Error {
   public:
    InvalidGameRecord(const std::string& what, int ply, std::string token)
        : Error(what), ply_(ply), token_(std::move(token)) {}

    /// 1-based half-move index of the offending token (0 when not tied to a move).
    [[nodiscard]] int ply() const noexcept { return ply_; }
    [[nodiscard]] const std::string& token() const noexcept { return token_; }

   private:
    int ply_;
    std::string token_;
};

/// Score text that is neither centipawns nor a mate distance.
class MalformedScore : public Error {
   public:
    explicit MalformedScore(std::string text)
        : Error("Malformed evaluator score: '" + text + "'"), text_(std::move(text)) {}

    [[nodiscard]] const std::string& text() const noexcept { return text_; }

   private:
    std::string text_;
};

}  // namespace chessreview
