#include "core/Board.hpp"
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace {
int ValidateBoardSize(int n) {
    if (n < 0 || n > kMaxNotationSize) {
        throw std::invalid_argument("Board size must be between 0 and " + std::to_string(kMaxNotationSize));
    }
    return n;
}

template <typename T, typename = std::enable_if_t<std::is_integral<T>::value>>
bool InRange(T value, T minValue, T maxValue) {
    return value >= minValue && value < maxValue;
}

char CellSymbol(Cell cell) {
    switch (cell) {
        case Cell::X: return 'X';
        case Cell::O: return 'O';
        default: return '.';
    }
}
} // namespace

Side Opponent(Side side) {
    return side == Side::X ? Side::O : Side::X;
}

Cell StoneOf(Side side) {
    return side == Side::X ? Cell::X : Cell::O;
}

char SideSymbol(Side side) {
    return side == Side::X ? 'X' : 'O';
}

Board::Board(int n)
    : N(ValidateBoardSize(n)), cells(N, std::vector<Cell>(N, Cell::Empty)), emptyCount(N * N) {}

bool Board::contains(const Coord& coord) const {
    return InRange(coord.row, 0, N) && InRange(coord.col, 0, N);
}

Cell Board::cellAt(const Coord& coord) const {
    if (!contains(coord)) {
        throw std::out_of_range("Board::cellAt row/column out of range");
    }
    return cells[coord.row][coord.col];
}

void Board::setCell(const Coord& coord, Cell cell) {
    if (!contains(coord)) {
        throw std::out_of_range("Board::setCell row/column out of range");
    }
    Cell& target = cells[coord.row][coord.col];
    if (target == Cell::Empty && cell != Cell::Empty) --emptyCount;
    else if (target != Cell::Empty && cell == Cell::Empty) ++emptyCount;
    target = cell;
}

// Row-major order; the search relies on it for move ordering
std::vector<Coord> Board::emptyCells() const {
    std::vector<Coord> out;
    out.reserve(static_cast<std::size_t>(emptyCount));
    for (int r = 0; r < N; ++r) {
        for (int c = 0; c < N; ++c) {
            if (cells[r][c] == Cell::Empty) {
                out.push_back(Coord{r, c});
            }
        }
    }
    return out;
}

bool Board::isFull() const {
    return emptyCount == 0;
}

void Board::print(std::ostream& out) const {
    out << "    ";
    for (int c = 0; c < N; ++c) {
        out << static_cast<char>('A' + c);
        if (c + 1 < N) out << " ";
    }
    out << "\n";

    for (int r = 0; r < N; ++r) {
        // Each row shifts half a cell further right to draw the rhombus.
        out << std::string(static_cast<std::size_t>(r), ' ') << std::setw(2) << (r + 1) << "  ";
        for (int c = 0; c < N; ++c) {
            out << CellSymbol(cells[r][c]);
            if (c + 1 < N) out << " ";
        }
        out << "\n";
    }
}
