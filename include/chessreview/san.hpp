#pragma once

/// @file san.hpp
/// Standard Algebraic Notation conversion against a position.

#include <chessreview/position.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace chessreview::san {

/// SAN for a legal move, e.g. "Nbd7", "exd6", "e8=Q+", "O-O", "Qxf7#".
/// Returns an empty string if `m` is not legal in `pos`.
[[nodiscard]] std::string to_san(const Position& pos, Move m);

/// Resolve SAN (or UCI long algebraic, e.g. "e2e4") to a legal move.
/// Check/mate suffixes and !/? annotations are ignored; "0-0" is accepted for "O-O".
[[nodiscard]] std::optional<Move> from_san(const Position& pos, std::string_view text);

}  // namespace chessreview::san
