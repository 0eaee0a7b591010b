#pragma once
#include "core/Board.hpp"
#include <string>

/**
 * Tunables for one game. Both board size and depth stay fixed while it runs.
 */
struct GameConfig {
    int boardSize{5};
    int depth{4};
    int timeLimitMs{0}; // 0 = no deadline
    bool alphaBeta{true};
    Side humanSide{Side::X};
    bool verbose{true};
    bool showHelp{false};

    /// Throws std::invalid_argument when a value is out of range.
    void validate() const;
};

/// Builds a config from command-line options; throws std::invalid_argument on bad input.
GameConfig ParseArgs(int argc, char** argv);
/// Returns the option summary printed by --help.
std::string Usage(const std::string& program);
