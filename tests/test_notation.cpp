#undef NDEBUG
#include "core/Coord.hpp"
#include <cassert>
#include <iostream>

static void test_parse_valid() {
    auto c = ParseCoord("A5", 5);
    assert(c && c->row == 4 && c->col == 0 && "A5 is column 0, row 4");
    c = ParseCoord("a1", 5);
    assert(c && c->row == 0 && c->col == 0);
    c = ParseCoord("  C3 \n", 5);
    assert(c && c->row == 2 && c->col == 2);
    c = ParseCoord("C10", 11);
    assert(c && c->row == 9 && c->col == 2);
}

static void test_parse_rejects_malformed() {
    assert(!ParseCoord("", 5));
    assert(!ParseCoord("A", 5));
    assert(!ParseCoord("5A", 5));
    assert(!ParseCoord("AA1", 5));
    assert(!ParseCoord("A1x", 5));
    assert(!ParseCoord("A0", 5));
    assert(!ParseCoord("A05", 5));
    assert(!ParseCoord("A-1", 5));
    assert(!ParseCoord("?3", 5));
}

static void test_parse_rejects_off_board() {
    assert(!ParseCoord("Z9", 5));
    assert(!ParseCoord("F1", 5));
    assert(!ParseCoord("A6", 5));
    assert(!ParseCoord("A1", 0));
    assert(!ParseCoord("A99999999999", 26));
}

static void test_format() {
    assert(FormatCoord({4, 0}) == "A5");
    assert(FormatCoord({0, 2}) == "C1");
    assert(FormatCoord({9, 2}) == "C10");
    const auto back = ParseCoord(FormatCoord({3, 1}), 5);
    assert(back && *back == (Coord{3, 1}));
}

int main() {
    test_parse_valid();
    test_parse_rejects_malformed();
    test_parse_rejects_off_board();
    test_format();
    std::cout << "All notation tests passed\n";
    return 0;
}
