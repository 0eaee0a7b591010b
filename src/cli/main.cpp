#include "core/Board.hpp"
#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "core/MoveStrategy.hpp"
#include "core/Player.hpp"
#include <exception>
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    try {
        const GameConfig config = ParseArgs(argc, argv);
        if (config.showHelp) {
            std::cout << Usage(argv[0]);
            return 0;
        }

        GameState state(config.boardSize);
        const Side aiSide = Opponent(config.humanSide);
        HumanPlayer human(config.humanSide);
        AIPlayer computer(aiSide, std::make_unique<NegamaxStrategy>(
                                      config.depth, config.timeLimitMs, config.alphaBeta, config.verbose));

        Player* playerX = config.humanSide == Side::X ? static_cast<Player*>(&human)
                                                      : static_cast<Player*>(&computer);
        Player* playerO = config.humanSide == Side::O ? static_cast<Player*>(&human)
                                                      : static_cast<Player*>(&computer);

        while (!state.IsTerminal()) {
            state.GetBoard().print();
            Player* current = state.CurrentPlayer() == Side::X ? playerX : playerO;
            std::cout << "\nPlayer " << SideSymbol(current->Id()) << " turn\n";
            const Coord move = current->ChooseMove(state);
            try {
                state.ApplyMove(move);
            } catch (const IllegalMoveError& e) {
                std::cout << e.what() << ", try again.\n";
                continue;
            }
            if (current == &computer) {
                std::cout << "Computer plays " << FormatCoord(move) << "\n";
            }
        }

        state.GetBoard().print();
        const auto winner = state.Winner();
        if (winner) {
            std::cout << "\nPlayer " << SideSymbol(*winner) << " wins!\n";
        } else {
            std::cout << "\nBoard full without a connection.\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "hex_cli: " << e.what() << "\n";
        return 1;
    }
}
