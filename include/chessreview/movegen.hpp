#pragma once

/// @file movegen.hpp
/// Legal and pseudo-legal move generation + perft.

#include <chessreview/position.hpp>

#include <cstdint>

namespace chessreview::movegen {

/// Generate all pseudo-legal moves for the current side to move.
[[nodiscard]] MoveList pseudo_legal(const Position& pos);

/// Generate all strictly legal moves (uses internal make/unmake).
[[nodiscard]] MoveList legal(Position& pos);

/// Count leaf nodes at `depth` plies (perft for validation).
[[nodiscard]] std::uint64_t perft(Position& pos, int depth);

}  // namespace chessreview::movegen
