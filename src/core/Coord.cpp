#include "core/Coord.hpp"
#include <cctype>
#include <string>

std::optional<Coord> ParseCoord(const std::string& text, int n) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    if (end - begin < 2) {
        return std::nullopt;
    }

    const char letter = static_cast<char>(std::toupper(static_cast<unsigned char>(text[begin])));
    if (letter < 'A' || letter > 'Z') {
        return std::nullopt;
    }
    const int col = letter - 'A';

    // Row digits only, no sign, no leading zero
    if (text[begin + 1] == '0') {
        return std::nullopt;
    }
    int rowNumber = 0;
    for (std::size_t i = begin + 1; i < end; ++i) {
        const unsigned char ch = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(ch)) {
            return std::nullopt;
        }
        rowNumber = rowNumber * 10 + (ch - '0');
        if (rowNumber > kMaxNotationSize) {
            return std::nullopt;
        }
    }

    const int row = rowNumber - 1;
    if (row < 0 || row >= n || col >= n) {
        return std::nullopt;
    }
    return Coord{row, col};
}

std::string FormatCoord(const Coord& coord) {
    std::string out(1, static_cast<char>('A' + coord.col));
    out += std::to_string(coord.row + 1);
    return out;
}
