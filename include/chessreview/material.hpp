#pragma once

/// @file material.hpp
/// Material count per side (P1 N3 B3 R5 Q9, kings excluded).

#include <chessreview/position.hpp>

#include <string>

namespace chessreview {

struct MaterialBalance {
    int white = 0;
    int black = 0;
    int balance = 0;  ///< white - black
    std::string description;
};

[[nodiscard]] MaterialBalance material_balance(const Position& pos);

/// "Material is equal", "White is up a rook (5 points)", "Black is up 2 pawn(s)", ...
[[nodiscard]] std::string material_description(int balance);

}  // namespace chessreview
