#pragma once
#include <chrono>
#include <limits>
#include <optional>
#include "core/Coord.hpp"
#include "core/GameState.hpp"

/**
 *Strategy interface for selecting a move.
 */
class IMoveStrategy{
    public:
        /// Returns a selected move for the side to move in state.
        virtual Coord select(const GameState& state) = 0;
        /// Virtual destructor for safe polymorphic cleanup.
        virtual ~IMoveStrategy() = default;
};

/**
 *  Negamax search result container.
 */
struct SearchResult{
    std::optional<Coord> bestMove;
    int score{0};
    bool completed{true};
    long long nodes{0};
};

/**
 * Fixed-depth negamax over GameState::Evaluate.
 *
 * Moves are tried in board order and the first move reaching the best score
 * is kept. Alpha-beta pruning returns the same move and score as the plain
 * search. timeLimitMs is in milliseconds; 0 disables the deadline.
 */
class NegamaxStrategy : public IMoveStrategy {
public:
    /// Creates a negamax strategy searching maxDepth plies.
    explicit NegamaxStrategy(int maxDepth = 4, int timeLimitMs = 0, bool alphaBeta = true, bool verbose = false);
    /// Selects the best move for the side to move.
    Coord select(const GameState& state) override;
    /// Searches depth plies from state, leaving state as it was found.
    SearchResult search(GameState& state, int depth) const;

private:
    using Clock = std::chrono::steady_clock;
    static constexpr int INF = std::numeric_limits<int>::max();

    SearchResult negamax(GameState& state, int depth, int alpha, int beta) const;
    bool outOfTime() const;

    int maxDepth;
    int timeLimitMs;
    bool useAlphaBeta{true};
    bool verbose{false};
    mutable Clock::time_point deadline;
    mutable long long nodeCount{0};
};
