#pragma once
#include <iostream>
#include <memory>
#include "core/Board.hpp"
#include "core/GameState.hpp"
#include "core/MoveStrategy.hpp"

/**
 * Player base interface.
 */
class Player {
    public:
        /// Chooses a move for the current state.
        virtual Coord ChooseMove(const GameState& state)=0;
        /// Returns the side this player controls.
        virtual Side Id() const = 0;
        /// Virtual destructor for safe polymorphic cleanup.
        virtual ~Player() = default;
};

/**
 * Human player reading "A5"-style moves from a stream.
 */
class HumanPlayer: public Player {
    Side PlayerId; // immutable identity
    std::istream& in;
    std::ostream& out;
    public:
    /// Creates a human player reading from input and prompting on output.
    HumanPlayer(Side id, std::istream& input = std::cin, std::ostream& output = std::cout);
    /// Prompts until a well-formed move on an empty cell is entered.
    Coord ChooseMove(const GameState& state) override;
    /// Returns the player side.
    Side Id() const override;
};

/**
 * AI player driven by a move strategy.
 */
class AIPlayer : public Player {
    Side playerId;
    std::unique_ptr<IMoveStrategy> strategy;
public:
    /// Creates an AI player with a provided strategy.
    AIPlayer(Side id, std::unique_ptr<IMoveStrategy> s);
    /// Delegates move selection to the strategy.
    Coord ChooseMove(const GameState& state) override;
    /// Returns the player side.
    Side Id() const override;
    /// Returns a mutable pointer to the strategy.
    IMoveStrategy* Strategy();
};
