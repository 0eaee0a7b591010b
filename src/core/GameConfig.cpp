#include "core/GameConfig.hpp"
#include "core/Coord.hpp"
#include <sstream>
#include <stdexcept>
#include <string>

namespace {
int ParseInt(const std::string& option, const std::string& value) {
    std::size_t used = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Option " + option + " expects an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::invalid_argument("Option " + option + " expects an integer, got '" + value + "'");
    }
    return parsed;
}
} // namespace

void GameConfig::validate() const {
    if (boardSize < 1 || boardSize > kMaxNotationSize) {
        throw std::invalid_argument("Board size must be between 1 and " + std::to_string(kMaxNotationSize));
    }
    if (depth < 1) {
        throw std::invalid_argument("Search depth must be at least 1");
    }
    if (timeLimitMs < 0) {
        throw std::invalid_argument("Time limit must not be negative");
    }
}

GameConfig ParseArgs(int argc, char** argv) {
    GameConfig config;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto nextValue = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument("Option " + arg + " needs a value");
            }
            return argv[++i];
        };

        if (arg == "--size") {
            config.boardSize = ParseInt(arg, nextValue());
        } else if (arg == "--depth") {
            config.depth = ParseInt(arg, nextValue());
        } else if (arg == "--time-limit") {
            config.timeLimitMs = ParseInt(arg, nextValue());
        } else if (arg == "--no-prune") {
            config.alphaBeta = false;
        } else if (arg == "--human") {
            const std::string side = nextValue();
            if (side == "X" || side == "x") config.humanSide = Side::X;
            else if (side == "O" || side == "o") config.humanSide = Side::O;
            else throw std::invalid_argument("Option --human expects X or O, got '" + side + "'");
        } else if (arg == "--quiet") {
            config.verbose = false;
        } else if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
        } else {
            throw std::invalid_argument("Unknown option '" + arg + "'");
        }
    }
    config.validate();
    return config;
}

std::string Usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --size N          board size, 1-" << kMaxNotationSize << " (default 5)\n"
        << "  --depth D         negamax search depth (default 4)\n"
        << "  --time-limit MS   per-move search deadline in milliseconds (default none)\n"
        << "  --no-prune        disable alpha-beta pruning\n"
        << "  --human X|O       side played by the human (default X)\n"
        << "  --quiet           no search log\n"
        << "  --help            show this message\n";
    return out.str();
}
