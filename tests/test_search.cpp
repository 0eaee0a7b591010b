#undef NDEBUG
#include "core/Connectivity.hpp"
#include "core/GameState.hpp"
#include "core/MoveStrategy.hpp"
#include <cassert>
#include <initializer_list>
#include <iostream>
#include <stdexcept>

static void play(GameState& state, std::initializer_list<Coord> moves) {
    for (const Coord& m : moves) state.ApplyMove(m);
}

// 3x3, X to move, (0,2) is the only empty cell and completes X's top row:
//   X X .
//   O O X
//   O X O
static GameState oneCellFromWin() {
    GameState state(3);
    play(state, {{0, 0}, {1, 0}, {0, 1}, {1, 1}, {1, 2}, {2, 0}, {2, 1}, {2, 2}});
    return state;
}

// 3x3, O to move, X threatens to finish the bottom row at (2,2):
//   . . .
//   . . O
//   X X .
static GameState mustBlockLastCell() {
    GameState state(3);
    play(state, {{2, 0}, {1, 2}, {2, 1}});
    return state;
}

static void test_depth_one_takes_the_winning_cell() {
    GameState state = oneCellFromWin();
    assert(!state.IsTerminal());
    NegamaxStrategy strategy(1);
    SearchResult res = strategy.search(state, 1);
    assert(res.completed);
    assert(res.bestMove && *res.bestMove == (Coord{0, 2}));

    GameState after = oneCellFromWin();
    after.ApplyMove({0, 2});
    assert(after.Winner() == Side::X);
    const int selfDistance = ShortestCompletionDistance(after.GetBoard(), Side::X);
    assert(res.score == kNoPath - selfDistance && "Score is the child's evaluation negated");
    assert(res.score > 0);
}

static void test_depth_zero_is_static_evaluation() {
    GameState state = mustBlockLastCell();
    NegamaxStrategy strategy(1);
    SearchResult res = strategy.search(state, 0);
    assert(!res.bestMove);
    assert(res.score == state.Evaluate());
}

static void test_empty_board_ties_go_to_first_cell() {
    GameState state(5);
    NegamaxStrategy strategy(1);
    SearchResult res = strategy.search(state, 1);
    assert(res.bestMove && *res.bestMove == (Coord{0, 0}) && "All replies score 0, first in board order wins");
    assert(res.score == 0);
}

static void test_blocks_single_threat() {
    for (bool pruning : {true, false}) {
        GameState state = mustBlockLastCell();
        NegamaxStrategy strategy(2, 0, pruning);
        SearchResult res = strategy.search(state, 2);
        assert(res.bestMove && *res.bestMove == (Coord{2, 2}) && "O must block X's only winning cell");
        assert(res.score == 0);
    }
}

static void test_search_restores_state() {
    GameState state = mustBlockLastCell();
    const Board before = state.GetBoard();
    NegamaxStrategy strategy(3);
    strategy.search(state, 3);
    assert(state.GetBoard() == before);
    assert(state.History().size() == 3);
    assert(state.CurrentPlayer() == Side::O);
}

static void test_search_is_deterministic() {
    GameState state(4);
    play(state, {{1, 1}, {2, 2}});
    NegamaxStrategy strategy(3);
    SearchResult first = strategy.search(state, 3);
    SearchResult second = strategy.search(state, 3);
    assert(first.bestMove && second.bestMove);
    assert(*first.bestMove == *second.bestMove);
    assert(first.score == second.score);
    assert(first.nodes == second.nodes);
}

static void test_alpha_beta_matches_plain_negamax() {
    GameState positions[] = {GameState(3), mustBlockLastCell(), GameState(4), GameState(4)};
    play(positions[3], {{0, 1}, {1, 1}, {2, 0}, {1, 2}});

    for (GameState& state : positions) {
        for (int depth = 1; depth <= 3; ++depth) {
            NegamaxStrategy pruned(depth, 0, true);
            NegamaxStrategy plain(depth, 0, false);
            SearchResult a = pruned.search(state, depth);
            SearchResult b = plain.search(state, depth);
            assert(a.bestMove && b.bestMove);
            assert(*a.bestMove == *b.bestMove && "Pruning must not change the chosen move");
            assert(a.score == b.score && "Pruning must not change the score");
            assert(a.nodes <= b.nodes);
        }
    }
}

static void test_terminal_root_returns_evaluation() {
    GameState state(3);
    play(state, {{0, 0}, {1, 0}, {0, 1}, {1, 1}, {0, 2}});
    assert(state.Winner() == Side::X);
    NegamaxStrategy strategy(2);
    SearchResult res = strategy.search(state, 2);
    assert(!res.bestMove);
    assert(res.score == state.Evaluate());
}

static void test_deadline_aborts_and_restores() {
    GameState state(5);
    NegamaxStrategy strategy(8, 1);
    SearchResult res = strategy.search(state, 8);
    assert(!res.completed && "Depth 8 on an empty 5x5 cannot finish in 1 ms");
    assert(state.History().empty());
    assert(state.GetBoard() == Board(5));

    const Coord move = strategy.select(state);
    assert(state.GetBoard().cellAt(move) == Cell::Empty);
}

static void test_select_prefers_immediate_win() {
    GameState state(3);
    play(state, {{1, 0}, {0, 2}, {1, 1}, {2, 2}});
    NegamaxStrategy strategy(4);
    const Coord move = strategy.select(state);
    assert(move == (Coord{1, 2}) && "X completes the middle row");
    assert(state.History().size() == 4);
}

static void test_invalid_configuration() {
    bool threw = false;
    try { NegamaxStrategy bad(0); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
    threw = false;
    try { NegamaxStrategy bad(4, -5); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    GameState finished(1);
    finished.ApplyMove({0, 0});
    NegamaxStrategy strategy(1);
    threw = false;
    try { strategy.select(finished); } catch (const std::logic_error&) { threw = true; }
    assert(threw);
}

int main() {
    test_depth_one_takes_the_winning_cell();
    test_depth_zero_is_static_evaluation();
    test_empty_board_ties_go_to_first_cell();
    test_blocks_single_threat();
    test_search_restores_state();
    test_search_is_deterministic();
    test_alpha_beta_matches_plain_negamax();
    test_terminal_root_returns_evaluation();
    test_deadline_aborts_and_restores();
    test_select_prefers_immediate_win();
    test_invalid_configuration();
    std::cout << "All search tests passed\n";
    return 0;
}
