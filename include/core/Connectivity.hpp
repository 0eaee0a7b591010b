#pragma once
#include "core/Board.hpp"
#include <array>

/// Distance reported when a side has no stone path between its edges.
constexpr int kNoPath = 99;

/// Hex neighbor offsets (drow, dcol) on the rhombic row/column grid.
constexpr std::array<std::array<int, 2>, 6> kHexDirections{{
    {{-1, 0}}, {{-1, +1}}, {{0, -1}}, {{0, +1}}, {{+1, -1}}, {{+1, 0}}
}};

/// True when side's stones join its start edge to its target edge.
bool HasConnected(const Board& board, Side side);

/**
 * Fewest hex steps along side's own stones from a start-edge stone to a
 * target-edge stone, or kNoPath.
 *
 * Empty cells are never crossed, so this is a comparative signal for the
 * evaluation, not the number of moves still needed.
 */
int ShortestCompletionDistance(const Board& board, Side side);
