/// @file pgn.cpp
/// PGN tag-pair and movetext tokenizer.

#include <chessreview/pgn.hpp>

#include <chessreview/errors.hpp>
#include <chessreview/san.hpp>

#include <cctype>
#include <stdexcept>

namespace chessreview::pgn {

namespace {

bool is_result_token(std::string_view tok) {
    return tok == "1-0" || tok == "0-1" || tok == "1/2-1/2" || tok == "*";
}

/// Parse `[Name "Value"]`; returns false for a malformed tag line.
bool parse_tag(std::string_view line, std::string& name, std::string& value) {
    if (line.size() < 2 || line.front() != '[' || line.back() != ']') return false;
    std::string_view body = line.substr(1, line.size() - 2);
    std::size_t space = body.find(' ');
    std::size_t open = body.find('"');
    std::size_t close = body.rfind('"');
    if (space == std::string_view::npos || open == std::string_view::npos || close <= open)
        return false;
    name = std::string(body.substr(0, space));
    value.clear();
    for (std::size_t i = open + 1; i < close; ++i) {
        if (body[i] == '\\' && i + 1 < close) ++i;
        value += body[i];
    }
    return true;
}

/// Drop comments and (nested) variations, keeping main-line text.
std::string strip_comments_and_variations(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    int paren = 0;
    bool brace = false;
    bool line_comment = false;

    for (char c : s) {
        if (line_comment) {
            if (c == '\n' || c == '\r') line_comment = false;
            continue;
        }
        if (brace) {
            if (c == '}') brace = false;
            continue;
        }
        if (c == '{') {
            brace = true;
        } else if (c == ';' && paren == 0) {
            line_comment = true;
        } else if (c == '(') {
            ++paren;
        } else if (c == ')') {
            if (paren > 0) --paren;
        } else if (paren == 0) {
            out += c;
            continue;
        }
        out += ' ';
    }
    return out;
}

/// "12.e4" → "e4", "12...Nf6" → "Nf6", "12." → "".
std::string_view strip_move_number(std::string_view tok) {
    std::size_t i = 0;
    while (i < tok.size() && std::isdigit(static_cast<unsigned char>(tok[i]))) ++i;
    if (i == 0 || i == tok.size() || tok[i] != '.') return tok;
    while (i < tok.size() && tok[i] == '.') ++i;
    return tok.substr(i);
}

}  // namespace

GameRecord parse(std::string_view text) {
    GameRecord record;
    std::string movetext;

    std::size_t pos = 0;
    bool in_movetext = false;
    while (pos < text.size()) {
        std::size_t eol = text.find('\n', pos);
        if (eol == std::string_view::npos) eol = text.size();
        std::string_view line = text.substr(pos, eol - pos);
        pos = eol + 1;

        while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back())))
            line.remove_suffix(1);
        while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front())))
            line.remove_prefix(1);

        std::string name;
        std::string value;
        if (!in_movetext && !line.empty() && line.front() == '[' &&
            parse_tag(line, name, value)) {
            record.headers[name] = value;
            continue;
        }
        if (in_movetext && line.empty()) {
            break;  // blank line terminates the first game's movetext
        }
        if (!line.empty()) in_movetext = true;
        movetext.append(line);
        movetext += '\n';
    }

    if (auto it = record.headers.find("FEN"); it != record.headers.end()) {
        record.start_fen = it->second;
    }

    const std::string clean = strip_comments_and_variations(movetext);
    std::size_t i = 0;
    while (i < clean.size()) {
        while (i < clean.size() && std::isspace(static_cast<unsigned char>(clean[i]))) ++i;
        std::size_t start = i;
        while (i < clean.size() && !std::isspace(static_cast<unsigned char>(clean[i]))) ++i;
        std::string_view tok = std::string_view(clean).substr(start, i - start);
        if (tok.empty() || tok.front() == '$') continue;
        if (is_result_token(tok)) {
            record.result = std::string(tok);
            break;
        }
        tok = strip_move_number(tok);
        if (!tok.empty()) record.moves.emplace_back(tok);
    }
    return record;
}

std::vector<Move> replay(const GameRecord& record) {
    Position pos;
    try {
        pos = Position::from_fen(record.start_fen);
    } catch (const std::invalid_argument& e) {
        throw InvalidGameRecord(std::string("Invalid start position: ") + e.what(), 0,
                                record.start_fen);
    }

    std::vector<Move> moves;
    moves.reserve(record.moves.size());
    int ply = 0;
    for (const std::string& token : record.moves) {
        ++ply;
        auto move = san::from_san(pos, token);
        if (!move) {
            throw InvalidGameRecord("Illegal or unparseable move '" + token + "' at ply " +
                                        std::to_string(ply),
                                    ply, token);
        }
        pos.make_move(*move);
        moves.push_back(*move);
    }
    return moves;
}

}  // namespace chessreview::pgn
