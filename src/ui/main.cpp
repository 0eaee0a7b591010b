#include "ui/HexGameUI.hpp"

#include "core/GameConfig.hpp"

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        const GameConfig config = ParseArgs(argc, argv);
        if (config.showHelp) {
            std::cout << Usage(argv[0]);
            return 0;
        }
        const float tileRadius = 36.0f;

        HexGameUI game(config, tileRadius);
        return game.run();
    } catch (const std::exception& e) {
        std::cerr << "hex_gui: " << e.what() << "\n";
        return 1;
    }
}
