#include "core/Player.hpp"
#include <stdexcept>
#include <string>

HumanPlayer::HumanPlayer(Side id, std::istream& input, std::ostream& output)
    : PlayerId(id), in(input), out(output) {}

Side HumanPlayer::Id() const {
    return PlayerId;
}

// Ask until the text parses and names an empty cell
Coord HumanPlayer::ChooseMove(const GameState& state) {
    const int n = state.Size();
    while (true) {
        out << "Player " << SideSymbol(PlayerId) << " move (e.g. A" << n << "): ";
        std::string line;
        if (!std::getline(in, line)) {
            throw std::runtime_error("Failed to read move input");
        }

        const auto coord = ParseCoord(line, n);
        if (!coord) {
            out << "Invalid move, try again.\n";
            continue;
        }
        if (state.GetBoard().cellAt(*coord) != Cell::Empty) {
            out << "Cell " << FormatCoord(*coord) << " is occupied, try again.\n";
            continue;
        }
        return *coord;
    }
}

AIPlayer::AIPlayer(Side id, std::unique_ptr<IMoveStrategy> s)
    : playerId(id), strategy(std::move(s)) {
    if (!strategy) {
        throw std::invalid_argument("AIPlayer requires a strategy");
    }
}

Side AIPlayer::Id() const {
    return playerId;
}

// Delegate to configured strategy
Coord AIPlayer::ChooseMove(const GameState& state) {
    return strategy->select(state);
}

IMoveStrategy* AIPlayer::Strategy() {
    return strategy.get();
}
