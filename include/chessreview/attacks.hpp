#pragma once

/// @file attacks.hpp
/// Direction offsets over the flat 0-63 board and sliding-piece attacks.
///
/// Sliding attacks are computed from precomputed ray masks: the nearest
/// blocker on each ray truncates it. All tables are built at compile time,
/// so no initialisation call is needed and lookups are safe from any thread.

#include <chessreview/bitboard.hpp>
#include <chessreview/types.hpp>

#include <array>
#include <optional>

namespace chessreview {

// ── Directions ──────────────────────────────────────────────────────────────

enum class Direction : int {
    North = 8,
    South = -8,
    East = 1,
    West = -1,
    NorthEast = 9,
    NorthWest = 7,
    SouthEast = -7,
    SouthWest = -9,
};

inline constexpr std::array<Direction, 4> kStraightDirections = {
    Direction::North, Direction::South, Direction::East, Direction::West};
inline constexpr std::array<Direction, 4> kDiagonalDirections = {
    Direction::NorthEast, Direction::NorthWest, Direction::SouthEast, Direction::SouthWest};

[[nodiscard]] constexpr int offset(Direction d) noexcept {
    return static_cast<int>(d);
}

[[nodiscard]] constexpr bool is_diagonal(Direction d) noexcept {
    return d == Direction::NorthEast || d == Direction::NorthWest ||
           d == Direction::SouthEast || d == Direction::SouthWest;
}

/// Whether a piece of type `pt` attacks along `d` any distance away.
[[nodiscard]] constexpr bool slides_along(PieceType pt, Direction d) noexcept {
    switch (pt) {
        case PieceType::Queen:
            return true;
        case PieceType::Rook:
            return !is_diagonal(d);
        case PieceType::Bishop:
            return is_diagonal(d);
        default:
            return false;
    }
}

/// Square one step from `sq` in direction `d`, or kNoSquare off the board.
[[nodiscard]] constexpr Square step(Square sq, Direction d) noexcept {
    int to = sq + offset(d);
    return is_adjacent_step(sq, to) ? static_cast<Square>(to) : kNoSquare;
}

/// Whether two distinct squares share a rank, file or diagonal.
[[nodiscard]] constexpr bool same_line(Square a, Square b) noexcept {
    if (a == b)
        return false;
    int dr = rank_of(b) - rank_of(a);
    int df = file_of(b) - file_of(a);
    return dr == 0 || df == 0 || dr == df || dr == -df;
}

/// Unit direction from `from` towards `to`; empty unless the squares share a line.
[[nodiscard]] constexpr std::optional<Direction> direction_between(Square from,
                                                                   Square to) noexcept {
    if (!same_line(from, to))
        return std::nullopt;
    int dr = (rank_of(to) > rank_of(from)) - (rank_of(to) < rank_of(from));
    int df = (file_of(to) > file_of(from)) - (file_of(to) < file_of(from));
    return static_cast<Direction>(dr * 8 + df);
}

// ── Ray tables ──────────────────────────────────────────────────────────────

namespace detail {

inline constexpr std::array<Direction, 8> kAllDirections = {
    Direction::North,     Direction::South,     Direction::East,      Direction::West,
    Direction::NorthEast, Direction::NorthWest, Direction::SouthEast, Direction::SouthWest};

struct RayTables {
    Bitboard ray[8][64]{};  // [direction index][origin], origin excluded
};

constexpr RayTables compute_rays() noexcept {
    RayTables t{};
    for (int d = 0; d < 8; ++d) {
        for (int sq = 0; sq < 64; ++sq) {
            Square cur = step(static_cast<Square>(sq), kAllDirections[d]);
            while (cur != kNoSquare) {
                set_bit(t.ray[d][sq], cur);
                cur = step(cur, kAllDirections[d]);
            }
        }
    }
    return t;
}

inline constexpr RayTables kRays = compute_rays();

/// Attacks along one ray, stopping at (and including) the first blocker.
constexpr Bitboard ray_attacks(int dir_index, Square sq, Bitboard occupancy) noexcept {
    Bitboard ray = kRays.ray[dir_index][sq];
    Bitboard blockers = ray & occupancy;
    if (!blockers)
        return ray;
    // Positive offsets walk towards higher indices: nearest blocker is the lowest bit.
    Square first = offset(kAllDirections[dir_index]) > 0 ? lsb(blockers) : msb(blockers);
    return ray ^ kRays.ray[dir_index][first];
}

}  // namespace detail

[[nodiscard]] constexpr Bitboard rook_attacks(Square sq, Bitboard occupancy) noexcept {
    return detail::ray_attacks(0, sq, occupancy) | detail::ray_attacks(1, sq, occupancy) |
           detail::ray_attacks(2, sq, occupancy) | detail::ray_attacks(3, sq, occupancy);
}

[[nodiscard]] constexpr Bitboard bishop_attacks(Square sq, Bitboard occupancy) noexcept {
    return detail::ray_attacks(4, sq, occupancy) | detail::ray_attacks(5, sq, occupancy) |
           detail::ray_attacks(6, sq, occupancy) | detail::ray_attacks(7, sq, occupancy);
}

[[nodiscard]] constexpr Bitboard queen_attacks(Square sq, Bitboard occupancy) noexcept {
    return bishop_attacks(sq, occupancy) | rook_attacks(sq, occupancy);
}

}  // namespace chessreview
