#include "core/MoveStrategy.hpp"
#include "core/GameState.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static std::optional<Coord> findImmediateWinningMove(GameState& state) {
    for (const Coord& m : state.GetAvailableMoves()) {
        state.ApplyMove(m);
        const bool wins = state.Winner().has_value();
        state.UndoMove(m);
        if (wins) {
            return m;
        }
    }
    return std::nullopt;
}

NegamaxStrategy::NegamaxStrategy(int maxDepth, int timeLimitMs, bool alphaBeta, bool verbose)
    : maxDepth(maxDepth),
      timeLimitMs(timeLimitMs),
      useAlphaBeta(alphaBeta),
      verbose(verbose) {
    if (maxDepth < 1) {
        throw std::invalid_argument("Search depth must be at least 1");
    }
    if (timeLimitMs < 0) {
        throw std::invalid_argument("Time limit must not be negative");
    }
}

Coord NegamaxStrategy::select(const GameState& state) {
    GameState scratch(state); // the search mutates in place
    const auto moves = scratch.GetAvailableMoves();
    if (moves.empty() || scratch.IsTerminal()) {
        throw std::logic_error("NegamaxStrategy::select called on a finished game");
    }

    const auto immediateWin = findImmediateWinningMove(scratch);
    if (immediateWin) {
        if (verbose) {
            std::cout << "[Negamax] Immediate winning move in one step | move="
                      << FormatCoord(*immediateWin) << "\n";
        }
        return *immediateWin;
    }

    SearchResult res = search(scratch, maxDepth);
    if (!res.bestMove) {
        // Deadline hit before the first root move finished
        res.bestMove = moves.front();
        if (verbose) {
            std::cout << "[Negamax] No move searched in time, playing first legal move\n";
        }
    }
    if (verbose) {
        std::cout << "[Heuristic] Final choice | depth=" << maxDepth
                  << " move=" << FormatCoord(*res.bestMove)
                  << " score=" << res.score
                  << " complete=" << res.completed << "\n";
    }
    return *res.bestMove;
}

SearchResult NegamaxStrategy::search(GameState& state, int depth) const {
    const auto start = Clock::now();
    deadline = start + std::chrono::milliseconds(timeLimitMs);
    nodeCount = 0;

    if (verbose) {
        std::cout << "[Negamax] Depth " << depth << " start | side=" << SideSymbol(state.CurrentPlayer())
                  << " pruning=" << (useAlphaBeta ? "alpha-beta" : "none") << "\n";
    }
    SearchResult res = negamax(state, depth, -INF, INF);
    res.nodes = nodeCount;

    if (verbose) {
        const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
        std::cout << "[Negamax] Depth " << depth << (res.completed ? " done" : " aborted")
                  << " | bestMove=" << (res.bestMove ? FormatCoord(*res.bestMove) : std::string("-"))
                  << " score=" << res.score << " nodes=" << res.nodes
                  << " elapsed=" << elapsedMs << "ms\n";
    }
    return res;
}

bool NegamaxStrategy::outOfTime() const {
    return timeLimitMs > 0 && Clock::now() >= deadline;
}

SearchResult NegamaxStrategy::negamax(GameState& state, int depth, int alpha, int beta) const {
    if (outOfTime()) {
        return {std::nullopt, 0, false, 0}; // time limit hit
    }
    ++nodeCount;

    if (depth == 0 || state.IsTerminal()) {
        return {std::nullopt, state.Evaluate(), true, 0};
    }

    const std::vector<Coord> moves = state.GetAvailableMoves();
    std::optional<Coord> bestMove;
    int bestScore = -INF;

    for (const Coord& m : moves) {
        state.ApplyMove(m);
        const SearchResult child = useAlphaBeta ? negamax(state, depth - 1, -beta, -alpha)
                                                : negamax(state, depth - 1, -INF, INF);
        state.UndoMove(m);
        if (!child.completed) return {bestMove, bestScore, false, 0};

        const int score = -child.score;
        if (score > bestScore) { // strict: first best move wins ties
            bestScore = score;
            bestMove = m;
        }
        if (!useAlphaBeta) continue;
        if (score > alpha) alpha = score;
        if (alpha >= beta) break; // beta cut
    }

    return {bestMove, bestScore, true, 0};
}
