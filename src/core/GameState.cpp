#include "core/GameState.hpp"
#include "core/Connectivity.hpp"
#include <stdexcept>

GameState::GameState(int n) : board(n) {}

std::vector<Coord> GameState::GetAvailableMoves() const {
    return board.emptyCells();
}

Side GameState::CurrentPlayer() const {
    return history.size() % 2 == 0 ? Side::X : Side::O;
}

std::optional<Side> GameState::LastMover() const {
    if (history.empty()) {
        return std::nullopt;
    }
    return Opponent(CurrentPlayer());
}

void GameState::ApplyMove(const Coord& move) {
    if (board.cellAt(move) != Cell::Empty) {
        throw IllegalMoveError("Cell " + FormatCoord(move) + " is already occupied");
    }
    if (Winner()) {
        throw IllegalMoveError("Game is already over");
    }
    board.setCell(move, StoneOf(CurrentPlayer()));
    history.push_back(move);
}

void GameState::UndoMove(const Coord& move) {
    if (history.empty()) {
        throw std::logic_error("GameState::UndoMove with no move to undo");
    }
    if (history.back() != move) {
        throw std::logic_error("GameState::UndoMove out of order: expected " +
                               FormatCoord(history.back()) + ", got " + FormatCoord(move));
    }
    board.setCell(move, Cell::Empty);
    history.pop_back();
}

// Only the side that just placed a stone can have completed a connection.
std::optional<Side> GameState::Winner() const {
    const auto mover = LastMover();
    if (mover && HasConnected(board, *mover)) {
        return mover;
    }
    return std::nullopt;
}

bool GameState::IsTerminal() const {
    return Winner().has_value() || board.isFull();
}

GameStatus GameState::Status() const {
    if (Winner()) return GameStatus::Won;
    if (board.isFull()) return GameStatus::Drawn;
    return GameStatus::InProgress;
}

int GameState::Evaluate() const {
    const Side self = CurrentPlayer();
    return ShortestCompletionDistance(board, Opponent(self)) - ShortestCompletionDistance(board, self);
}
