#pragma once

/// @file board.hpp
/// Bitboard-based piece placement with a mailbox for O(1) piece-at-square lookups.

#include <chessreview/bitboard.hpp>
#include <chessreview/piece.hpp>
#include <chessreview/types.hpp>

namespace chessreview {

/// Maintains 12 piece bitboards (2 colors × 6 piece types),
/// per-color and total occupancy, and a 64-element mailbox.
class Board {
   public:
    Board() noexcept { clear(); }

    // ── Piece placement ─────────────────────────────────────────────────

    /// Place a piece on the board. Square must be empty.
    void put_piece(Square sq, Piece p) noexcept {
        int ci = color_index(p.color);
        set_bit(pieces_[ci][piece_index(p.type)], sq);
        set_bit(occupied_[ci], sq);
        mailbox_[sq] = p;
    }

    /// Remove a piece from the board. Square must be occupied.
    void remove_piece(Square sq) noexcept {
        Piece p = mailbox_[sq];
        int ci = color_index(p.color);
        clear_bit(pieces_[ci][piece_index(p.type)], sq);
        clear_bit(occupied_[ci], sq);
        mailbox_[sq] = kNoPiece;
    }

    // ── Queries ─────────────────────────────────────────────────────────

    /// Piece at a given square (kNoPiece if empty).
    [[nodiscard]] Piece piece_at(Square sq) const noexcept { return mailbox_[sq]; }

    [[nodiscard]] bool is_empty(Square sq) const noexcept {
        return mailbox_[sq].type == PieceType::None;
    }

    /// Bitboard of all pieces of a given color and type.
    [[nodiscard]] Bitboard pieces(Color c, PieceType pt) const noexcept {
        return pieces_[color_index(c)][piece_index(pt)];
    }

    /// Bitboard of all pieces of a given color.
    [[nodiscard]] Bitboard occupied(Color c) const noexcept {
        return occupied_[color_index(c)];
    }

    [[nodiscard]] Bitboard occupied_all() const noexcept { return occupied_[0] | occupied_[1]; }

    /// Square of the king of color `c`, or kNoSquare on a board without one.
    [[nodiscard]] Square king_square(Color c) const noexcept {
        Bitboard k = pieces(c, PieceType::King);
        return k ? lsb(k) : kNoSquare;
    }

    void clear() noexcept {
        for (auto& color_pieces : pieces_) {
            for (auto& bb : color_pieces) {
                bb = kEmptyBB;
            }
        }
        occupied_[0] = kEmptyBB;
        occupied_[1] = kEmptyBB;
        for (auto& p : mailbox_) {
            p = kNoPiece;
        }
    }

    [[nodiscard]] bool operator==(const Board& other) const noexcept {
        for (int c = 0; c < 2; ++c) {
            for (int p = 0; p < kNumPieceTypes; ++p) {
                if (pieces_[c][p] != other.pieces_[c][p]) return false;
            }
        }
        return true;
    }

   private:
    Bitboard pieces_[2][6]{};  // [color_index][piece_index]
    Bitboard occupied_[2]{};   // [color_index]
    Piece mailbox_[64]{};
};

}  // namespace chessreview
