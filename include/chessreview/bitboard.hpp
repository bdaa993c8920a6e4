#pragma once

/// @file bitboard.hpp
/// Bitboard type, bit manipulation utilities and leaper attack tables.

#include <chessreview/types.hpp>

#include <bit>
#include <cstdint>

namespace chessreview {

using Bitboard = std::uint64_t;

inline constexpr Bitboard kEmptyBB = 0ULL;

// ── Bit manipulation ────────────────────────────────────────────────────────

[[nodiscard]] constexpr Bitboard square_bb(Square sq) noexcept {
    return 1ULL << sq;
}

[[nodiscard]] constexpr int popcount(Bitboard b) noexcept {
    return std::popcount(b);
}

/// Index of the least significant set bit. `b` must be non-empty.
[[nodiscard]] constexpr Square lsb(Bitboard b) noexcept {
    return static_cast<Square>(std::countr_zero(b));
}

/// Index of the most significant set bit. `b` must be non-empty.
[[nodiscard]] constexpr Square msb(Bitboard b) noexcept {
    return static_cast<Square>(63 - std::countl_zero(b));
}

/// Pop (return and clear) the least significant bit.
[[nodiscard]] constexpr Square pop_lsb(Bitboard& b) noexcept {
    Square sq = lsb(b);
    b &= b - 1;
    return sq;
}

[[nodiscard]] constexpr bool test_bit(Bitboard b, Square sq) noexcept {
    return (b >> sq) & 1;
}

constexpr void set_bit(Bitboard& b, Square sq) noexcept {
    b |= square_bb(sq);
}

constexpr void clear_bit(Bitboard& b, Square sq) noexcept {
    b &= ~square_bb(sq);
}

// ── Rank / File masks ───────────────────────────────────────────────────────

inline constexpr Bitboard kFileA = 0x0101010101010101ULL;
inline constexpr Bitboard kFileH = kFileA << 7;
inline constexpr Bitboard kRank1 = 0x00000000000000FFULL;
inline constexpr Bitboard kRank3 = kRank1 << 16;
inline constexpr Bitboard kRank6 = kRank1 << 40;
inline constexpr Bitboard kRank8 = kRank1 << 56;

// ── Shift helpers ───────────────────────────────────────────────────────────

[[nodiscard]] constexpr Bitboard shift_north(Bitboard b) noexcept {
    return b << 8;
}
[[nodiscard]] constexpr Bitboard shift_south(Bitboard b) noexcept {
    return b >> 8;
}
[[nodiscard]] constexpr Bitboard shift_ne(Bitboard b) noexcept {
    return (b << 9) & ~kFileA;
}
[[nodiscard]] constexpr Bitboard shift_nw(Bitboard b) noexcept {
    return (b << 7) & ~kFileH;
}
[[nodiscard]] constexpr Bitboard shift_se(Bitboard b) noexcept {
    return (b >> 7) & ~kFileA;
}
[[nodiscard]] constexpr Bitboard shift_sw(Bitboard b) noexcept {
    return (b >> 9) & ~kFileH;
}

// ── Pre-computed leaper tables ──────────────────────────────────────────────

namespace detail {

struct LeaperTables {
    Bitboard knight[64]{};
    Bitboard king[64]{};
    Bitboard pawn[2][64]{};
};

constexpr LeaperTables compute_leaper_tables() noexcept {
    constexpr int kKnightOffsets[] = {17, 15, 10, 6, -6, -10, -15, -17};
    constexpr int kKingOffsets[] = {8, -8, 1, -1, 9, 7, -7, -9};

    LeaperTables t{};
    for (int sq = 0; sq < 64; ++sq) {
        for (int off : kKnightOffsets) {
            int to = sq + off;
            int df = (to % 8) - (sq % 8);
            if (is_valid_square(to) && df >= -2 && df <= 2)
                set_bit(t.knight[sq], static_cast<Square>(to));
        }
        for (int off : kKingOffsets) {
            if (is_adjacent_step(sq, sq + off))
                set_bit(t.king[sq], static_cast<Square>(sq + off));
        }
        Bitboard bb = square_bb(static_cast<Square>(sq));
        t.pawn[0][sq] = shift_ne(bb) | shift_nw(bb);
        t.pawn[1][sq] = shift_se(bb) | shift_sw(bb);
    }
    return t;
}

inline constexpr LeaperTables kLeapers = compute_leaper_tables();

}  // namespace detail

[[nodiscard]] constexpr Bitboard knight_attacks(Square sq) noexcept {
    return detail::kLeapers.knight[sq];
}

[[nodiscard]] constexpr Bitboard king_attacks(Square sq) noexcept {
    return detail::kLeapers.king[sq];
}

/// Squares a pawn of color `c` on `sq` attacks.
[[nodiscard]] constexpr Bitboard pawn_attacks(Color c, Square sq) noexcept {
    return detail::kLeapers.pawn[color_index(c)][sq];
}

}  // namespace chessreview
