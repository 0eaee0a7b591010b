#pragma once
#include "core/Coord.hpp"
#include <iostream>
#include <vector>

/// Cell occupancy. X connects left-right, O connects top-bottom.
enum class Cell { Empty = 0, X = 1, O = 2 };

/// Player identities share the stone values of Cell.
enum class Side { X = 1, O = 2 };

/// Returns the other side.
Side Opponent(Side side);
/// Returns the stone a side places.
Cell StoneOf(Side side);
/// Returns 'X' or 'O'.
char SideSymbol(Side side);

/**
 * N x N Hex grid. Legality is checked by GameState, not here.
 */
class Board {
public:
    /// Creates an empty n x n board (0 <= n <= 26).
    explicit Board(int n = 5);

    int size() const { return N; }
    /// Returns the cell at coord; throws std::out_of_range outside the grid.
    Cell cellAt(const Coord& coord) const;
    /// Overwrites the cell at coord; throws std::out_of_range outside the grid.
    void setCell(const Coord& coord, Cell cell);
    /// Empty cells in row-major order.
    std::vector<Coord> emptyCells() const;
    bool isFull() const;
    bool contains(const Coord& coord) const;
    /// Writes the rhombus with column letters and 1-based row numbers.
    void print(std::ostream& out = std::cout) const;

    bool operator==(const Board& other) const { return N == other.N && cells == other.cells; }
    bool operator!=(const Board& other) const { return !(*this == other); }

private:
    int N;
    std::vector<std::vector<Cell>> cells;
    int emptyCount;
};
