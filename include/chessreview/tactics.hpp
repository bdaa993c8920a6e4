#pragma once

/// @file tactics.hpp
/// Tactical motif detection from raw piece placement.
///
/// Every scan is a pure function of the position: no move history, no
/// evaluator. Scans walk the flat 0-63 board with direction offsets and
/// stop explicitly at board edges (see attacks.hpp step()).

#include <chessreview/position.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chessreview {

enum class MotifType : std::uint8_t { Pin, Fork, Skewer, HangingPiece };

enum class Severity : std::uint8_t { Info, Warning, Critical };

/// "pin", "fork", "skewer", "hanging_piece".
[[nodiscard]] std::string_view to_string(MotifType type) noexcept;
/// "info", "warning", "critical".
[[nodiscard]] std::string_view to_string(Severity severity) noexcept;

/// One detected tactical pattern. `target_squares` is never empty.
struct Motif {
    MotifType type = MotifType::Pin;
    std::optional<Square> attacker_square;
    std::vector<Square> target_squares;
    std::string description;
    Severity severity = Severity::Info;

    [[nodiscard]] bool operator==(const Motif&) const = default;
};

/// Motifs created by a move, relative to the position before it.
struct MoveTactics {
    bool creates_threat = false;
    std::vector<Motif> threats;       ///< after-move motifs absent before the move
    std::vector<Motif> motifs_after;  ///< every motif in the position after the move
};

namespace tactics {

/// Absolute pins against each side's king.
/// Targets are [pinned_square, king_square]; attacker is the pinning slider.
[[nodiscard]] std::vector<Motif> find_pins(const Position& pos);

/// One piece attacking two or more valuable enemy pieces (queen, rook, king;
/// knights and bishops too when the attacker is a pawn).
[[nodiscard]] std::vector<Motif> find_forks(const Position& pos);

/// Non-pawn pieces attacked by the opponent and defended by nobody.
[[nodiscard]] std::vector<Motif> find_hanging_pieces(const Position& pos);

/// A slider attacking a piece worth more than the enemy piece directly behind it.
[[nodiscard]] std::vector<Motif> find_skewers(const Position& pos);

/// Pins, forks, hanging pieces and skewers, in that order.
[[nodiscard]] std::vector<Motif> analyze_tactics(const Position& pos);

/// Compare motifs before and after `m`. A motif is new when no motif of the
/// same type with the same targets existed before. `pos` is restored before
/// returning.
[[nodiscard]] MoveTactics analyze_move_tactics(Position& pos, Move m);

/// Human-readable digest: up to three critical threats and three warnings.
[[nodiscard]] std::string tactical_summary(const std::vector<Motif>& motifs);

}  // namespace tactics

}  // namespace chessreview
