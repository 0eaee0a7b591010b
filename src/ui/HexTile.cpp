#include "ui/HexTile.hpp"

HexTile::HexTile(float radius) : shape_(radius, 6) {
    shape_.setOrigin(radius, radius); // position refers to the hexagon center
}

void HexTile::setPosition(float x, float y) {
    shape_.setPosition(x, y);
}

void HexTile::setColor(const sf::Color& color) {
    shape_.setFillColor(color);
}

void HexTile::setOutline(const sf::Color& color, float thickness) {
    shape_.setOutlineColor(color);
    shape_.setOutlineThickness(thickness);
}

sf::Vector2f HexTile::getPosition() const {
    return shape_.getPosition();
}

float HexTile::getRadius() const {
    return shape_.getRadius();
}

void HexTile::draw(sf::RenderTarget& target) const {
    target.draw(shape_);
}
