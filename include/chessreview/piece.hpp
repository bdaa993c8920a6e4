#pragma once

/// @file piece.hpp
/// Piece value object (color + type) and material values used for comparisons.

#include <chessreview/types.hpp>

#include <string>

namespace chessreview {

/// An immutable piece on the board (color + type).
struct Piece {
    Color color;
    PieceType type;

    [[nodiscard]] constexpr bool operator==(const Piece&) const noexcept = default;

    /// FEN character for this piece ('P','N','B','R','Q','K' for white, lowercase for black).
    [[nodiscard]] constexpr char fen_char() const noexcept {
        // clang-format off
        constexpr char kChars[2][7] = {
            {' ', 'P', 'N', 'B', 'R', 'Q', 'K'},
            {' ', 'p', 'n', 'b', 'r', 'q', 'k'},
        };
        // clang-format on
        return kChars[color_index(color)][static_cast<int>(type)];
    }

    /// Parse a FEN piece character. Returns Piece with PieceType::None on failure.
    [[nodiscard]] static constexpr Piece from_fen_char(char ch) noexcept {
        switch (ch) {
                // clang-format off
            case 'P': return {Color::White, PieceType::Pawn};
            case 'N': return {Color::White, PieceType::Knight};
            case 'B': return {Color::White, PieceType::Bishop};
            case 'R': return {Color::White, PieceType::Rook};
            case 'Q': return {Color::White, PieceType::Queen};
            case 'K': return {Color::White, PieceType::King};
            case 'p': return {Color::Black, PieceType::Pawn};
            case 'n': return {Color::Black, PieceType::Knight};
            case 'b': return {Color::Black, PieceType::Bishop};
            case 'r': return {Color::Black, PieceType::Rook};
            case 'q': return {Color::Black, PieceType::Queen};
            case 'k': return {Color::Black, PieceType::King};
            default:  return {Color::White, PieceType::None};
                // clang-format on
        }
    }
};

/// Sentinel value for "no piece".
inline constexpr Piece kNoPiece{Color::White, PieceType::None};

// ── Material values ─────────────────────────────────────────────────────────
// Comparison weights only; not a board evaluation.

/// Values for skewer ordering: P1 N3 B3 R5 Q9, the king outranks everything.
[[nodiscard]] constexpr int tactical_value(PieceType pt) noexcept {
    constexpr int kValues[] = {0, 1, 3, 3, 5, 9, 100};
    return kValues[static_cast<int>(pt)];
}

/// Values for material counting and sacrifice detection: the king counts zero.
[[nodiscard]] constexpr int material_value(PieceType pt) noexcept {
    constexpr int kValues[] = {0, 1, 3, 3, 5, 9, 0};
    return kValues[static_cast<int>(pt)];
}

/// "Bishop", "Queen", ... for use at the start of a sentence.
[[nodiscard]] inline std::string capitalized_name(PieceType pt) {
    std::string s(piece_type_name(pt));
    if (!s.empty())
        s[0] = static_cast<char>(s[0] - 'a' + 'A');
    return s;
}

}  // namespace chessreview
