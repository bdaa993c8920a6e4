/// @file test_position.cpp
/// Tests for Position: FEN I/O, make/unmake and the attack and move queries
/// used by the tactical scanner.

#include <chessreview/position.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace chessreview;

namespace {

constexpr const char* kKiwipete =
    "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1";

}  // namespace

// ── FEN ─────────────────────────────────────────────────────────────────────

TEST(Position, StartingFenRoundTrip) {
    EXPECT_EQ(Position::initial().to_fen(), kStartingFen);
    EXPECT_EQ(Position::from_fen(kKiwipete).to_fen(), kKiwipete);
}

TEST(Position, FenFieldsParsed) {
    auto pos = Position::from_fen("rnbqkbnr/pp1ppppp/8/2p5/4P3/8/PPPP1PPP/RNBQKBNR w Kq c6 0 2");
    EXPECT_EQ(pos.side_to_move(), Color::White);
    EXPECT_EQ(pos.castling(), kWhiteKingside | kBlackQueenside);
    EXPECT_EQ(pos.en_passant(), C6);
    EXPECT_EQ(pos.fullmove_number(), 2);
    EXPECT_EQ(pos.piece_at(C5), (Piece{Color::Black, PieceType::Pawn}));
}

TEST(Position, FenClockFieldsOptional) {
    auto pos = Position::from_fen("4k3/8/8/8/8/8/8/4K3 b - -");
    EXPECT_EQ(pos.side_to_move(), Color::Black);
    EXPECT_EQ(pos.halfmove_clock(), 0);
    EXPECT_EQ(pos.fullmove_number(), 1);
}

TEST(Position, InvalidFenThrows) {
    EXPECT_THROW((void)Position::from_fen(""), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("8/8/8/8 w - -"), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("8/8/8/8/8/8/8/9 w - -"), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("4k3/8/8/8/8/8/8/4X3 w - -"), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("4k3/8/8/8/8/8/8/4K3 x - -"), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("4k3/8/8/8/8/8/8/4K3 w KX -"), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("4k3/8/8/8/8/8/8/4K3 w - z9"), std::invalid_argument);
    EXPECT_THROW((void)Position::from_fen("4k3/8/8/8/8/8/8/4K3 w - - x 1"),
                 std::invalid_argument);
}

// ── Make / unmake ───────────────────────────────────────────────────────────

TEST(Position, MakeUpdatesStateAndUnmakeRestores) {
    auto pos = Position::initial();
    const std::string before = pos.to_fen();

    Move e4{E2, E4, MoveFlag::DoublePawn};
    pos.make_move(e4);
    EXPECT_EQ(pos.to_fen(), "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1");

    Move nf6{G8, F6};
    pos.make_move(nf6);
    EXPECT_EQ(pos.fullmove_number(), 2);
    EXPECT_EQ(pos.halfmove_clock(), 1);

    pos.unmake_move(nf6);
    pos.unmake_move(e4);
    EXPECT_EQ(pos.to_fen(), before);
}

TEST(Position, EnPassantCaptureAndUndo) {
    auto pos = Position::from_fen("4k3/8/8/3pP3/8/8/8/4K3 w - d6 0 2");
    const std::string before = pos.to_fen();
    Move exd6{E5, D6, MoveFlag::EnPassant};

    EXPECT_EQ(pos.captured_piece(exd6), (Piece{Color::Black, PieceType::Pawn}));
    pos.make_move(exd6);
    EXPECT_EQ(pos.piece_at(D5), kNoPiece);
    EXPECT_EQ(pos.piece_at(D6), (Piece{Color::White, PieceType::Pawn}));

    pos.unmake_move(exd6);
    EXPECT_EQ(pos.to_fen(), before);
}

TEST(Position, CastlingMovesRookAndClearsRights) {
    auto pos = Position::from_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    Move oo{E1, G1, MoveFlag::CastleKingside};
    pos.make_move(oo);
    EXPECT_EQ(pos.piece_at(F1), (Piece{Color::White, PieceType::Rook}));
    EXPECT_EQ(pos.piece_at(H1), kNoPiece);
    EXPECT_EQ(pos.castling(), kBlackBoth);

    Move ooo{E8, C8, MoveFlag::CastleQueenside};
    pos.make_move(ooo);
    EXPECT_EQ(pos.piece_at(D8), (Piece{Color::Black, PieceType::Rook}));
    EXPECT_EQ(pos.castling(), kCastlingNone);

    pos.unmake_move(ooo);
    pos.unmake_move(oo);
    EXPECT_EQ(pos.to_fen(), "r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
}

TEST(Position, PromotionAndUndo) {
    auto pos = Position::from_fen("1r2k3/P7/8/8/8/8/8/4K3 w - - 0 1");
    Move axb8{A7, B8, MoveFlag::Promotion, PieceType::Knight};
    pos.make_move(axb8);
    EXPECT_EQ(pos.piece_at(B8), (Piece{Color::White, PieceType::Knight}));
    pos.unmake_move(axb8);
    EXPECT_EQ(pos.piece_at(A7), (Piece{Color::White, PieceType::Pawn}));
    EXPECT_EQ(pos.piece_at(B8), (Piece{Color::Black, PieceType::Rook}));
}

TEST(Position, CaptureOnRookHomeRemovesRight) {
    auto pos = Position::from_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    pos.make_move(Move{A1, A8});
    EXPECT_EQ(pos.castling(), kWhiteKingside | kBlackKingside);
}

// ── Attack queries ──────────────────────────────────────────────────────────

TEST(Position, AttackersOfSquare) {
    // The f3 queen is screened by its own e4 pawn.
    auto pos = Position::from_fen("4k3/8/8/3p4/4P3/2N2Q2/8/4K3 w - - 0 1");
    Bitboard att = pos.attackers(D5, Color::White);
    EXPECT_TRUE(test_bit(att, E4));
    EXPECT_TRUE(test_bit(att, C3));
    EXPECT_FALSE(test_bit(att, F3));
    EXPECT_EQ(popcount(att), 2);
    EXPECT_EQ(pos.attackers(D5, Color::Black), kEmptyBB);
}

TEST(Position, PawnAttackersFollowCaptureDirection) {
    auto pos = Position::from_fen("4k3/8/8/8/8/8/3P4/4K3 w - - 0 1");
    EXPECT_TRUE(pos.is_square_attacked(E3, Color::White));
    EXPECT_FALSE(pos.is_square_attacked(D3, Color::White));
}

TEST(Position, AttacksFromPiece) {
    auto pos = Position::from_fen("4k3/8/8/8/3R1p2/8/8/4K3 w - - 0 1");
    Bitboard r = pos.attacks_from(D4);
    EXPECT_TRUE(test_bit(r, F4));
    EXPECT_FALSE(test_bit(r, G4));
    EXPECT_TRUE(test_bit(r, D8));
    EXPECT_EQ(pos.attacks_from(A1), kEmptyBB);
}

TEST(Position, CheckDetection) {
    auto pos = Position::from_fen("4k3/8/8/8/8/8/8/4K2r w - - 0 1");
    EXPECT_TRUE(pos.is_in_check());
    EXPECT_FALSE(pos.is_in_check(Color::Black));

    auto kingless = Position::from_fen("8/8/8/8/8/8/8/R7 w - -");
    EXPECT_FALSE(kingless.is_in_check(Color::White));
    EXPECT_FALSE(kingless.is_in_check(Color::Black));
}

// ── Move queries ────────────────────────────────────────────────────────────

TEST(Position, CaptureDetection) {
    auto pos = Position::from_fen("4k3/8/8/3p4/4P3/8/8/4K3 w - - 0 1");
    EXPECT_TRUE(pos.is_capture(Move{E4, D5}));
    EXPECT_FALSE(pos.is_capture(Move{E4, E5}));
}

TEST(Position, GivesCheckLeavesPositionUntouched) {
    auto pos = Position::from_fen("4k3/8/8/8/8/8/8/R3K3 w - - 0 1");
    const std::string before = pos.to_fen();
    EXPECT_TRUE(pos.gives_check(Move{A1, A8}));
    EXPECT_FALSE(pos.gives_check(Move{A1, A2}));
    EXPECT_EQ(pos.to_fen(), before);
}

TEST(Position, MateAndStalemate) {
    auto mate = Position::from_fen(
        "r1bqkb1r/pppp1Qpp/2n2n2/4p3/2B1P3/8/PPPP1PPP/RNB1K1NR b KQkq - 0 4");
    EXPECT_TRUE(mate.is_checkmate());
    EXPECT_FALSE(mate.is_stalemate());

    auto stale = Position::from_fen("k7/2Q5/1K6/8/8/8/8/8 b - - 0 1");
    EXPECT_FALSE(stale.is_checkmate());
    EXPECT_TRUE(stale.is_stalemate());

    auto start = Position::initial();
    EXPECT_FALSE(start.is_checkmate());
    EXPECT_FALSE(start.is_stalemate());
}
