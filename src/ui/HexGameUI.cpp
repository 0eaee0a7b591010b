#include "ui/HexGameUI.hpp"

#include "core/MoveStrategy.hpp"

#include <cmath>
#include <iostream>
#include <memory>

constexpr float kWindowMargin = 24.0f;
constexpr sf::Uint8 kHoverAlpha = 180;
constexpr float kEdgeOutline = 3.0f;

HexGameUI::Tile::Tile(float radius, const sf::Vector2f& centerPos, const Coord& cell)
    : sprite(radius), center(centerPos), coord(cell) {
    sprite.setPosition(center.x, center.y);
}

HexGameUI::HexGameUI(const GameConfig& config, float tileRadius)
    : config_(config),
      tileRadius_(tileRadius),
      state_(config.boardSize),
      ai_(Opponent(config.humanSide),
          std::make_unique<NegamaxStrategy>(config.depth, config.timeLimitMs, config.alphaBeta, config.verbose)) {
    if (tileRadius_ <= 0.0f) {
        error_ = "Tile radius must be positive.";
        return;
    }
    buildLayout();
    updateTileColors();
}

// Row r is shifted half a tile per row so the grid forms a rhombus whose
// screen neighbours match the board's six hex directions.
void HexGameUI::buildLayout() {
    tiles_.clear();
    const int n = state_.Size();
    const float tileWidth = std::sqrt(3.0f) * tileRadius_;
    const float rowStep = 1.5f * tileRadius_;

    const float boardWidth = tileWidth * (static_cast<float>(n) + 0.5f * static_cast<float>(n - 1));
    const float boardHeight = rowStep * static_cast<float>(n - 1) + 2.0f * tileRadius_;
    windowSize_ = sf::Vector2u(
        static_cast<unsigned int>(std::ceil(boardWidth + 2.0f * kWindowMargin)),
        static_cast<unsigned int>(std::ceil(boardHeight + 2.0f * kWindowMargin)));

    tiles_.reserve(static_cast<std::size_t>(n * n));
    for (int row = 0; row < n; ++row) {
        for (int col = 0; col < n; ++col) {
            sf::Vector2f center(
                kWindowMargin + tileWidth / 2.0f + tileWidth * (col + 0.5f * row),
                kWindowMargin + tileRadius_ + rowStep * row);
            tiles_.emplace_back(tileRadius_, center, Coord{row, col});
        }
    }
}

void HexGameUI::updateTileColors() {
    const sf::Color emptyColor(210, 210, 220);
    const sf::Color playerXColor(210, 70, 70);
    const sf::Color playerOColor(70, 120, 210);
    const int n = state_.Size();
    for (std::size_t i = 0; i < tiles_.size(); ++i) {
        Tile& tile = tiles_[i];
        const Cell value = state_.GetBoard().cellAt(tile.coord);
        sf::Color color = emptyColor;
        if (value == Cell::X) {
            color = playerXColor;
        } else if (value == Cell::O) {
            color = playerOColor;
        }
        color.a = (static_cast<int>(i) == hoveredIndex_) ? kHoverAlpha : 255;
        tile.sprite.setColor(color);

        // Outline marks the edges each side has to connect
        if (tile.coord.col == 0 || tile.coord.col == n - 1) {
            tile.sprite.setOutline(playerXColor, kEdgeOutline);
        } else if (tile.coord.row == 0 || tile.coord.row == n - 1) {
            tile.sprite.setOutline(playerOColor, kEdgeOutline);
        } else {
            tile.sprite.setOutline(sf::Color(60, 60, 70), 1.0f);
        }
    }
}

bool HexGameUI::applyMove(const Coord& move) {
    try {
        state_.ApplyMove(move);
    } catch (const IllegalMoveError& e) {
        std::cout << e.what() << "\n";
        return false;
    }
    gameOver_ = state_.IsTerminal();
    updateTileColors();
    printBoardStatus();
    return true;
}

// Hexagons tile the plane, so the nearest center within one radius owns the point.
int HexGameUI::pickTileIndex(const sf::Vector2f& pos) const {
    int bestIndex = -1;
    float bestDist2 = tileRadius_ * tileRadius_;
    for (std::size_t i = 0; i < tiles_.size(); ++i) {
        float dx = pos.x - tiles_[i].center.x;
        float dy = pos.y - tiles_[i].center.y;
        float dist2 = dx * dx + dy * dy;
        if (dist2 <= bestDist2) {
            bestDist2 = dist2;
            bestIndex = static_cast<int>(i);
        }
    }
    return bestIndex;
}

void HexGameUI::updateWindowTitle(sf::RenderWindow& window) const {
    if (gameOver_) {
        const auto winner = state_.Winner();
        if (winner) {
            window.setTitle(std::string("Hex - Winner ") + SideSymbol(*winner));
        } else {
            window.setTitle("Hex - Game Over");
        }
        return;
    }
    window.setTitle(std::string("Hex - Turn ") + SideSymbol(state_.CurrentPlayer()));
}

void HexGameUI::updateHover(const sf::RenderWindow& window) {
    sf::Vector2i pixelPos = sf::Mouse::getPosition(window);
    if (pixelPos.x < 0 || pixelPos.y < 0 ||
        pixelPos.x >= static_cast<int>(window.getSize().x) ||
        pixelPos.y >= static_cast<int>(window.getSize().y)) {
        if (hoveredIndex_ != -1) {
            hoveredIndex_ = -1;
            updateTileColors();
        }
        return;
    }
    sf::Vector2f pos = window.mapPixelToCoords(pixelPos);
    int idx = pickTileIndex(pos);
    if (idx != hoveredIndex_) {
        hoveredIndex_ = idx;
        updateTileColors();
    }
}

void HexGameUI::printBoardStatus() const {
    state_.GetBoard().print();
    if (gameOver_) {
        const auto winner = state_.Winner();
        if (winner) {
            std::cout << "\nPlayer " << SideSymbol(*winner) << " wins!\n";
        } else {
            std::cout << "\nGame over.\n";
        }
        return;
    }
    std::cout << "\nPlayer " << SideSymbol(state_.CurrentPlayer()) << " turn\n";
}

void HexGameUI::resetGame() {
    state_ = GameState(config_.boardSize);
    gameOver_ = false;
    updateTileColors();
    printBoardStatus();
}

int HexGameUI::run() {
    if (!error_.empty()) {
        std::cerr << error_ << "\n";
        return 1;
    }
    if (windowSize_.x == 0 || windowSize_.y == 0) {
        std::cerr << "Invalid window size.\n";
        return 1;
    }

    sf::RenderWindow window(sf::VideoMode(windowSize_.x, windowSize_.y), "Hex");
    window.setFramerateLimit(60);
    updateWindowTitle(window);
    printBoardStatus();

    while (window.isOpen()) {
        bool humanMovedThisFrame = false;
        sf::Event event;
        while (window.pollEvent(event)) {
            if (event.type == sf::Event::Closed ||
                (event.type == sf::Event::KeyPressed && event.key.code == sf::Keyboard::Escape)) {
                window.close();
            }
            if (event.type == sf::Event::KeyPressed && event.key.code == sf::Keyboard::R) {
                resetGame();
                updateWindowTitle(window);
            }
            if (!gameOver_ && state_.CurrentPlayer() == config_.humanSide &&
                event.type == sf::Event::MouseButtonPressed &&
                event.mouseButton.button == sf::Mouse::Left) {
                sf::Vector2f pos = window.mapPixelToCoords(
                    sf::Vector2i(event.mouseButton.x, event.mouseButton.y));
                int idx = pickTileIndex(pos);
                if (idx >= 0 && applyMove(tiles_[static_cast<std::size_t>(idx)].coord)) {
                    updateWindowTitle(window);
                    humanMovedThisFrame = true;
                }
            }
        }

        updateHover(window);

        // Let the human's stone render before the search blocks the loop
        if (!gameOver_ && state_.CurrentPlayer() == ai_.Id() && !humanMovedThisFrame) {
            applyMove(ai_.ChooseMove(state_));
            updateWindowTitle(window);
        }

        window.clear(sf::Color(30, 30, 40));
        for (const auto& tile : tiles_) {
            tile.sprite.draw(window);
        }
        window.display();
    }
    return 0;
}
