#pragma once

/// @file position.hpp
/// Complete chess position: board + side-to-move + castling + en passant + clocks.
///
/// This is the read-only view the analysis core works against. make_move /
/// unmake_move keep an internal undo stack so callers can push a hypothetical
/// move, inspect the result and restore the original snapshot.

#include <chessreview/board.hpp>
#include <chessreview/move.hpp>

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace chessreview {

inline constexpr std::string_view kStartingFen =
    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

/// Snapshot saved before each move so we can undo it.
struct UndoInfo {
    CastlingRights castling;
    Square en_passant;
    int halfmove_clock;
    Piece captured;  ///< kNoPiece if no capture
};

namespace detail {

/// Castling rights to PRESERVE when a square is the origin or target of a move.
constexpr CastlingRights castling_mask_for(int sq) noexcept {
    switch (sq) {
        case A1:
            return static_cast<CastlingRights>(kCastlingAll & ~kWhiteQueenside);
        case H1:
            return static_cast<CastlingRights>(kCastlingAll & ~kWhiteKingside);
        case E1:
            return static_cast<CastlingRights>(kCastlingAll & ~kWhiteBoth);
        case A8:
            return static_cast<CastlingRights>(kCastlingAll & ~kBlackQueenside);
        case H8:
            return static_cast<CastlingRights>(kCastlingAll & ~kBlackKingside);
        case E8:
            return static_cast<CastlingRights>(kCastlingAll & ~kBlackBoth);
        default:
            return kCastlingAll;
    }
}

constexpr auto make_castling_masks() noexcept {
    std::array<CastlingRights, 64> masks{};
    for (int i = 0; i < 64; ++i) {
        masks[i] = castling_mask_for(i);
    }
    return masks;
}

inline constexpr auto kCastleMask = make_castling_masks();

}  // namespace detail

class Position {
   public:
    Position(Board board, Color side, CastlingRights castling, Square ep, int halfmove,
             int fullmove);

    /// Empty board, white to move, no castling, no EP.
    Position();

    [[nodiscard]] static Position initial();

    /// Parse a FEN string. Throws std::invalid_argument on bad input.
    [[nodiscard]] static Position from_fen(std::string_view fen);

    [[nodiscard]] std::string to_fen() const;

    // ── Move operations ─────────────────────────────────────────────────

    /// Apply a move, pushing undo state onto the history stack.
    void make_move(Move m);

    /// Undo the last make_move.
    void unmake_move(Move m);

    // ── Accessors ───────────────────────────────────────────────────────

    [[nodiscard]] const Board& board() const noexcept { return board_; }
    [[nodiscard]] Piece piece_at(Square sq) const noexcept { return board_.piece_at(sq); }
    [[nodiscard]] Color side_to_move() const noexcept { return side_to_move_; }
    [[nodiscard]] CastlingRights castling() const noexcept { return castling_; }
    [[nodiscard]] Square en_passant() const noexcept { return en_passant_; }
    [[nodiscard]] int halfmove_clock() const noexcept { return halfmove_clock_; }
    [[nodiscard]] int fullmove_number() const noexcept { return fullmove_number_; }

    // ── Attack queries ──────────────────────────────────────────────────

    /// All pieces of color `by` that attack `sq` (pawns by capture direction only).
    [[nodiscard]] Bitboard attackers(Square sq, Color by) const noexcept;

    /// Squares attacked by the piece standing on `sq` (empty if the square is empty).
    [[nodiscard]] Bitboard attacks_from(Square sq) const noexcept;

    [[nodiscard]] bool is_square_attacked(Square sq, Color by) const noexcept {
        return attackers(sq, by) != kEmptyBB;
    }

    /// Is the side-to-move's king in check?
    [[nodiscard]] bool is_in_check() const noexcept;

    /// Is the specified color's king in check? False when that side has no king.
    [[nodiscard]] bool is_in_check(Color c) const noexcept;

    // ── Move queries ────────────────────────────────────────────────────

    /// Piece a move would capture (handles en passant); kNoPiece for quiet moves.
    [[nodiscard]] Piece captured_piece(Move m) const noexcept;

    [[nodiscard]] bool is_capture(Move m) const noexcept {
        return captured_piece(m) != kNoPiece;
    }

    /// Whether playing `m` leaves the opponent in check.
    [[nodiscard]] bool gives_check(Move m) const;

    [[nodiscard]] bool is_checkmate();
    [[nodiscard]] bool is_stalemate();

   private:
    void slide_castling_rook(Move m, bool undo);

    Board board_;
    Color side_to_move_ = Color::White;
    CastlingRights castling_ = kCastlingNone;
    Square en_passant_ = kNoSquare;
    int halfmove_clock_ = 0;
    int fullmove_number_ = 1;
    std::vector<UndoInfo> history_;
};

}  // namespace chessreview
