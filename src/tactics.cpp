/// @file tactics.cpp
/// Pin, fork, hanging-piece and skewer scans.

#include <chessreview/tactics.hpp>

#include <chessreview/attacks.hpp>

#include <algorithm>

namespace chessreview {

std::string_view to_string(MotifType type) noexcept {
    switch (type) {
        case MotifType::Pin:
            return "pin";
        case MotifType::Fork:
            return "fork";
        case MotifType::Skewer:
            return "skewer";
        case MotifType::HangingPiece:
            return "hanging_piece";
    }
    return "unknown";
}

std::string_view to_string(Severity severity) noexcept {
    switch (severity) {
        case Severity::Info:
            return "info";
        case Severity::Warning:
            return "warning";
        case Severity::Critical:
            return "critical";
    }
    return "unknown";
}

namespace tactics {

namespace {

constexpr Color kColors[] = {Color::White, Color::Black};

// Scan order for sliders: straight lines first, then diagonals.
constexpr Direction kSkewerDirections[] = {
    Direction::South,     Direction::North,     Direction::West,      Direction::East,
    Direction::SouthWest, Direction::SouthEast, Direction::NorthWest, Direction::NorthEast};

std::string name_on(PieceType pt, Square sq) {
    return std::string(piece_type_name(pt)) + " on " + square_name(sq);
}

/// Square of the enemy slider pinning `pinned` to `king`, if any. Only the
/// squares beyond `pinned` are scanned; what stands between it and the king
/// is not consulted.
std::optional<Square> find_pinner(const Board& board, Square pinned, Square king,
                                  Color owner) {
    auto dir = direction_between(king, pinned);
    if (!dir) return std::nullopt;

    for (Square cur = step(pinned, *dir); cur != kNoSquare; cur = step(cur, *dir)) {
        Piece p = board.piece_at(cur);
        if (p == kNoPiece) continue;
        if (p.color == owner) return std::nullopt;
        if (slides_along(p.type, *dir)) return cur;
        return std::nullopt;
    }
    return std::nullopt;
}

bool is_fork_target(PieceType attacker, PieceType target) {
    switch (target) {
        case PieceType::Queen:
        case PieceType::Rook:
        case PieceType::King:
            return true;
        case PieceType::Knight:
        case PieceType::Bishop:
            return attacker == PieceType::Pawn;
        default:
            return false;
    }
}

}  // namespace

// ── Pins ────────────────────────────────────────────────────────────────────

std::vector<Motif> find_pins(const Position& pos) {
    std::vector<Motif> motifs;
    const Board& board = pos.board();

    for (Color color : kColors) {
        const Square king = board.king_square(color);
        if (king == kNoSquare) continue;

        Bitboard own = board.occupied(color) & ~square_bb(king);
        while (own) {
            const Square sq = pop_lsb(own);
            auto pinner = find_pinner(board, sq, king, color);
            if (!pinner) continue;

            const PieceType pinned_type = board.piece_at(sq).type;
            const PieceType pinner_type = board.piece_at(*pinner).type;
            const bool heavy = pinned_type == PieceType::Queen || pinned_type == PieceType::Rook;

            motifs.push_back({MotifType::Pin, *pinner, {sq, king},
                              capitalized_name(pinned_type) + " on " + square_name(sq) +
                                  " is pinned to the king by " +
                                  std::string(piece_type_name(pinner_type)),
                              heavy ? Severity::Warning : Severity::Info});
        }
    }
    return motifs;
}

// ── Forks ───────────────────────────────────────────────────────────────────

std::vector<Motif> find_forks(const Position& pos) {
    std::vector<Motif> motifs;
    const Board& board = pos.board();

    for (Color color : kColors) {
        Bitboard pieces = board.occupied(color);
        while (pieces) {
            const Square sq = pop_lsb(pieces);
            const PieceType attacker = board.piece_at(sq).type;

            std::vector<Square> targets;
            Bitboard attacked = pos.attacks_from(sq) & board.occupied(opposite(color));
            while (attacked) {
                Square t = pop_lsb(attacked);
                if (is_fork_target(attacker, board.piece_at(t).type)) targets.push_back(t);
            }
            if (targets.size() < 2) continue;

            std::string desc = capitalized_name(attacker) + " on " + square_name(sq) + " forks ";
            bool hits_king = false;
            for (std::size_t i = 0; i < targets.size(); ++i) {
                const PieceType pt = board.piece_at(targets[i]).type;
                hits_king |= pt == PieceType::King;
                if (i >= 3) continue;
                if (i > 0) desc += " and ";
                desc += name_on(pt, targets[i]);
            }

            motifs.push_back({MotifType::Fork, sq, std::move(targets), std::move(desc),
                              hits_king ? Severity::Critical : Severity::Warning});
        }
    }
    return motifs;
}

// ── Hanging pieces ──────────────────────────────────────────────────────────

std::vector<Motif> find_hanging_pieces(const Position& pos) {
    std::vector<Motif> motifs;
    const Board& board = pos.board();

    Bitboard occupied = board.occupied_all();
    while (occupied) {
        const Square sq = pop_lsb(occupied);
        const Piece piece = board.piece_at(sq);
        if (piece.type == PieceType::Pawn) continue;

        const Bitboard attackers = pos.attackers(sq, opposite(piece.color));
        const Bitboard defenders = pos.attackers(sq, piece.color);
        if (!attackers || defenders) continue;

        const bool heavy = piece.type == PieceType::Queen || piece.type == PieceType::Rook;
        std::string side = piece.color == Color::White ? "White " : "Black ";
        motifs.push_back({MotifType::HangingPiece, lsb(attackers), {sq},
                          side + name_on(piece.type, sq) + " is undefended and attacked",
                          heavy ? Severity::Critical : Severity::Warning});
    }
    return motifs;
}

// ── Skewers ─────────────────────────────────────────────────────────────────

std::vector<Motif> find_skewers(const Position& pos) {
    std::vector<Motif> motifs;
    const Board& board = pos.board();

    for (Color color : kColors) {
        Bitboard sliders = board.pieces(color, PieceType::Bishop) |
                           board.pieces(color, PieceType::Rook) |
                           board.pieces(color, PieceType::Queen);
        while (sliders) {
            const Square from = pop_lsb(sliders);
            const PieceType attacker = board.piece_at(from).type;

            for (Direction d : kSkewerDirections) {
                if (!slides_along(attacker, d)) continue;

                Square front = kNoSquare;
                for (Square cur = step(from, d); cur != kNoSquare; cur = step(cur, d)) {
                    const Piece p = board.piece_at(cur);
                    if (p == kNoPiece) continue;
                    if (p.color == color) break;
                    if (front == kNoSquare) {
                        front = cur;
                        continue;
                    }
                    const PieceType front_type = board.piece_at(front).type;
                    if (tactical_value(front_type) > tactical_value(p.type)) {
                        motifs.push_back(
                            {MotifType::Skewer, from, {front, cur},
                             capitalized_name(attacker) + " skewers " +
                                 std::string(piece_type_name(front_type)) + " to " +
                                 std::string(piece_type_name(p.type)),
                             Severity::Warning});
                    }
                    break;
                }
            }
        }
    }
    return motifs;
}

// ── Aggregates ──────────────────────────────────────────────────────────────

std::vector<Motif> analyze_tactics(const Position& pos) {
    std::vector<Motif> motifs = find_pins(pos);
    for (auto* finder : {&find_forks, &find_hanging_pieces, &find_skewers}) {
        std::vector<Motif> found = finder(pos);
        motifs.insert(motifs.end(), std::make_move_iterator(found.begin()),
                      std::make_move_iterator(found.end()));
    }
    return motifs;
}

MoveTactics analyze_move_tactics(Position& pos, Move m) {
    const std::vector<Motif> before = analyze_tactics(pos);

    pos.make_move(m);
    MoveTactics result;
    result.motifs_after = analyze_tactics(pos);
    pos.unmake_move(m);

    for (const Motif& motif : result.motifs_after) {
        bool existed = std::any_of(before.begin(), before.end(), [&](const Motif& old) {
            return old.type == motif.type && old.target_squares == motif.target_squares;
        });
        if (!existed) result.threats.push_back(motif);
    }
    result.creates_threat = !result.threats.empty();
    return result;
}

std::string tactical_summary(const std::vector<Motif>& motifs) {
    if (motifs.empty()) return "No immediate tactical threats detected.";

    std::string out;
    auto append_section = [&](const char* title, Severity severity) {
        int listed = 0;
        for (const Motif& m : motifs) {
            if (m.severity != severity || listed == 3) continue;
            if (listed == 0) {
                if (!out.empty()) out += '\n';
                out += title;
            }
            out += "\n  - " + m.description;
            ++listed;
        }
    };
    append_section("Critical threats:", Severity::Critical);
    append_section("Tactical features:", Severity::Warning);
    return out;
}

}  // namespace tactics

}  // namespace chessreview
