#pragma once
#include <optional>
#include <string>

/**
 * Board coordinate (0-based row and column).
 *
 * Externally a cell is written as a column letter followed by a 1-based row
 * number: "A5" is row 4, column 0.
 */
struct Coord {
    int row{0};
    int col{0};

    bool operator==(const Coord& other) const { return row == other.row && col == other.col; }
    bool operator!=(const Coord& other) const { return !(*this == other); }
};

/// Largest board that single-letter column notation can address.
constexpr int kMaxNotationSize = 26;

/// Parses "C3"-style notation for an n x n board; empty when malformed or off the board.
std::optional<Coord> ParseCoord(const std::string& text, int n);
/// Formats a coordinate as column letter + 1-based row.
std::string FormatCoord(const Coord& coord);
