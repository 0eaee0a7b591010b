#pragma once
#include "core/Board.hpp"
#include "core/Coord.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Raised when a move targets an occupied cell or the game is already over.
 */
class IllegalMoveError : public std::runtime_error {
public:
    explicit IllegalMoveError(const std::string& what) : std::runtime_error(what) {}
};

enum class GameStatus { InProgress, Won, Drawn };

/**
 * Board plus move history.
 *
 * The side to move is derived from the history length (X moves first), so
 * undo never has to restore it separately.
 */
class GameState {
private:
    Board board;
    std::vector<Coord> history;
public:
    /// Creates an empty n x n game with X to move.
    explicit GameState(int n = 5);

    /// Empty cells in the board's row-major order.
    std::vector<Coord> GetAvailableMoves() const;
    /// Places the current side's stone; throws IllegalMoveError if the cell is taken.
    void ApplyMove(const Coord& move);
    /// Reverts the most recent move; throws std::logic_error if move is not that move.
    void UndoMove(const Coord& move);

    Side CurrentPlayer() const;
    /// Side that made the most recent move, empty before the first move.
    std::optional<Side> LastMover() const;
    /// True once the last mover has connected or the board is full.
    bool IsTerminal() const;
    /// The last mover if its edges are connected.
    std::optional<Side> Winner() const;
    GameStatus Status() const;
    /// Distance difference from the perspective of the side to move; higher is better.
    int Evaluate() const;

    const Board& GetBoard() const { return board; }
    const std::vector<Coord>& History() const { return history; }
    int Size() const { return board.size(); }
};
