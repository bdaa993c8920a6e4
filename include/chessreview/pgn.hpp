#pragma once

/// @file pgn.hpp
/// PGN import: tag pairs and main-line movetext.

#include <chessreview/position.hpp>

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace chessreview {

/// A game as recorded: start position plus main-line move tokens (SAN or UCI).
struct GameRecord {
    std::map<std::string, std::string> headers;
    std::string start_fen{kStartingFen};
    std::vector<std::string> moves;
    std::string result = "*";
};

namespace pgn {

/// Parse the first game of a PGN text.
///
/// Comments (`{...}`, `;` to end of line), variations `(...)`, numeric
/// annotation glyphs (`$n`) and move numbers are skipped. A `[FEN "..."]`
/// tag replaces the start position. Move tokens are not validated here;
/// see replay().
[[nodiscard]] GameRecord parse(std::string_view text);

/// Resolve every move token of `record` against the replayed game.
/// Throws InvalidGameRecord for a bad start position or on the first token
/// that is not a legal move.
[[nodiscard]] std::vector<Move> replay(const GameRecord& record);

}  // namespace pgn

}  // namespace chessreview
