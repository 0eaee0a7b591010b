#include "core/Connectivity.hpp"
#include <queue>
#include <vector>

namespace {

// X targets column N-1, O targets row N-1
bool OnTargetEdge(const Coord& coord, Side side, int n) {
    return side == Side::X ? coord.col == n - 1 : coord.row == n - 1;
}

// Own stones on column 0 for X, row 0 for O
std::vector<Coord> StartStones(const Board& board, Side side) {
    const int n = board.size();
    const Cell stone = StoneOf(side);
    std::vector<Coord> seeds;
    for (int i = 0; i < n; ++i) {
        const Coord coord = side == Side::X ? Coord{i, 0} : Coord{0, i};
        if (board.cellAt(coord) == stone) {
            seeds.push_back(coord);
        }
    }
    return seeds;
}

} // namespace

bool HasConnected(const Board& board, Side side) {
    const int n = board.size();
    const Cell stone = StoneOf(side);
    std::vector<char> visited(static_cast<std::size_t>(n * n), 0);

    std::vector<Coord> stack = StartStones(board, side);
    for (const Coord& seed : stack) {
        visited[seed.row * n + seed.col] = 1;
    }

    while (!stack.empty()) {
        const Coord current = stack.back();
        stack.pop_back();
        if (OnTargetEdge(current, side, n)) {
            return true;
        }
        for (const auto& d : kHexDirections) {
            const Coord next{current.row + d[0], current.col + d[1]};
            if (!board.contains(next) || board.cellAt(next) != stone) continue;
            char& seen = visited[next.row * n + next.col];
            if (!seen) {
                seen = 1;
                stack.push_back(next);
            }
        }
    }
    return false;
}

int ShortestCompletionDistance(const Board& board, Side side) {
    const int n = board.size();
    const Cell stone = StoneOf(side);
    std::vector<int> dist(static_cast<std::size_t>(n * n), -1);
    std::queue<Coord> q;

    for (const Coord& seed : StartStones(board, side)) {
        dist[seed.row * n + seed.col] = 0;
        q.push(seed);
    }

    while (!q.empty()) {
        const Coord u = q.front();
        q.pop();
        const int du = dist[u.row * n + u.col];
        if (OnTargetEdge(u, side, n)) {
            return du; // BFS order: first target stone dequeued is the nearest
        }
        for (const auto& d : kHexDirections) {
            const Coord v{u.row + d[0], u.col + d[1]};
            if (!board.contains(v) || board.cellAt(v) != stone) continue;
            int& dv = dist[v.row * n + v.col];
            if (dv == -1) {
                dv = du + 1;
                q.push(v);
            }
        }
    }
    return kNoPath;
}
