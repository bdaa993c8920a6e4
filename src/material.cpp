/// @file material.cpp

#include <chessreview/material.hpp>

#include <cstdlib>

namespace chessreview {

namespace {

int side_material(const Board& board, Color c) {
    int total = 0;
    for (PieceType pt : {PieceType::Pawn, PieceType::Knight, PieceType::Bishop, PieceType::Rook,
                         PieceType::Queen}) {
        total += popcount(board.pieces(c, pt)) * material_value(pt);
    }
    return total;
}

}  // namespace

MaterialBalance material_balance(const Position& pos) {
    MaterialBalance mb;
    mb.white = side_material(pos.board(), Color::White);
    mb.black = side_material(pos.board(), Color::Black);
    mb.balance = mb.white - mb.black;
    mb.description = material_description(mb.balance);
    return mb;
}

std::string material_description(int balance) {
    if (balance == 0) return "Material is equal";

    const std::string side = balance > 0 ? "White" : "Black";
    const int points = std::abs(balance);
    const std::string in_points = " (" + std::to_string(points) + " points)";

    if (points >= 9) return side + " is up a queen" + in_points;
    if (points >= 5) return side + " is up a rook" + in_points;
    if (points >= 3) return side + " is up a minor piece" + in_points;
    return side + " is up " + std::to_string(points) + " pawn(s)";
}

}  // namespace chessreview
