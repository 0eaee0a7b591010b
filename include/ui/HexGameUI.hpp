#pragma once

#include <SFML/Graphics.hpp>
#include <string>
#include <vector>

#include "core/GameConfig.hpp"
#include "core/GameState.hpp"
#include "core/Player.hpp"
#include "ui/HexTile.hpp"

/**
 * SFML window for a human vs negamax game.
 *
 * Left click places the human stone, R restarts, Esc closes.
 */
class HexGameUI {
public:
    HexGameUI(const GameConfig& config, float tileRadius);

    int run();

private:
    struct Tile {
        HexTile sprite;
        sf::Vector2f center;
        Coord coord;

        Tile(float radius, const sf::Vector2f& centerPos, const Coord& cell);
    };

    void buildLayout();
    void updateTileColors();
    bool applyMove(const Coord& move);
    int pickTileIndex(const sf::Vector2f& pos) const;
    void updateWindowTitle(sf::RenderWindow& window) const;
    void updateHover(const sf::RenderWindow& window);
    void printBoardStatus() const;
    void resetGame();

    GameConfig config_;
    float tileRadius_ = 0.0f;

    GameState state_;
    AIPlayer ai_;
    bool gameOver_ = false;
    int hoveredIndex_ = -1;

    sf::Vector2u windowSize_{0, 0};
    std::vector<Tile> tiles_;
    std::string error_;
};
