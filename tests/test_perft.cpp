/// @file test_perft.cpp
/// Perft validation of the rules layer against published node counts.
/// SAN, PGN replay and the tactical scanner all trust these moves.

#include <chessreview/movegen.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using namespace chessreview;

namespace {

struct PerftCase {
    const char* name;
    const char* fen;
    int depth;
    std::uint64_t nodes;
};

// clang-format off
constexpr PerftCase kCases[] = {
    {"Start1",    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1", 1, 20},
    {"Start2",    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1", 2, 400},
    {"Start3",    "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1", 3, 8902},
    {"Kiwipete1", "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1", 1, 48},
    {"Kiwipete2", "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1", 2, 2039},
    {"Endgame3",  "8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1", 3, 2812},
    {"Position4", "r3k2r/Pppp1ppp/1b3nbN/nP6/BBP1P3/q4N2/Pp1P2PP/R2Q1RK1 w kq - 0 1", 2, 264},
    {"Position5", "rnbq1k1r/pp1Pbppp/2p5/8/2B5/8/PPP1NnPP/RNBQK2R w KQ - 1 8", 2, 1486},
};
// clang-format on

class Perft : public ::testing::TestWithParam<PerftCase> {};

}  // namespace

TEST_P(Perft, NodeCount) {
    const PerftCase& c = GetParam();
    auto pos = Position::from_fen(c.fen);
    EXPECT_EQ(movegen::perft(pos, c.depth), c.nodes);
    EXPECT_EQ(pos.to_fen(), c.fen);  // make/unmake leave no trace
}

INSTANTIATE_TEST_SUITE_P(Known, Perft, ::testing::ValuesIn(kCases),
                         [](const ::testing::TestParamInfo<PerftCase>& info) {
                             return std::string(info.param.name);
                         });
