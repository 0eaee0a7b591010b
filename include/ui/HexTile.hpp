#pragma once

#include <SFML/Graphics.hpp>

/**
 * Pointy-top hexagon drawn for one board cell.
 */
class HexTile {
public:
    explicit HexTile(float radius);

    void setPosition(float x, float y);
    void setColor(const sf::Color& color);
    void setOutline(const sf::Color& color, float thickness);

    sf::Vector2f getPosition() const;
    float getRadius() const;

    void draw(sf::RenderTarget& target) const;

private:
    sf::CircleShape shape_;
};
