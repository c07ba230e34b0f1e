#include "../include/Maze.hpp"

#include <sstream>
#include <stdexcept>

Maze::Maze(int width, int height) : w(width), h(height) {
    if (width <= 0 || height <= 0) {
        std::ostringstream msg;
        msg << "invalid maze size " << width << "x" << height;
        throw std::invalid_argument(msg.str());
    }
    walls.assign(static_cast<size_t>(w) * h, 0);
    initializeBoundaries();
}

void Maze::requireInBounds(int x, int y) const {
    if (!inBounds(x, y)) {
        std::ostringstream msg;
        msg << "cell (" << x << ", " << y << ") outside " << w << "x" << h << " maze";
        throw std::out_of_range(msg.str());
    }
}

bool Maze::isWall(int x, int y, Dir d) const {
    if (!inBounds(x, y) || d == NONE) return true;
    if (walls[index(x, y)] & wallBit(d)) return true;
    return !inBounds(x + dx(d), y + dy(d));
}

void Maze::setWall(int x, int y, Dir d) {
    requireInBounds(x, y);
    if (d == NONE) return;
    walls[index(x, y)] |= wallBit(d);
    int nx = x + dx(d);
    int ny = y + dy(d);
    if (inBounds(nx, ny)) {
        walls[index(nx, ny)] |= wallBit(opposite(d));
    }
}

uint8_t Maze::wallMask(int x, int y) const {
    requireInBounds(x, y);
    return walls[index(x, y)];
}

void Maze::initializeBoundaries() {
    for (int x = 0; x < w; ++x) {
        walls[index(x, 0)]     |= WS;
        walls[index(x, h - 1)] |= WN;
    }
    for (int y = 0; y < h; ++y) {
        walls[index(0, y)]     |= WW;
        walls[index(w - 1, y)] |= WE;
    }
}

void Maze::reset() {
    for (size_t i = 0; i < walls.size(); ++i) walls[i] = 0;
    initializeBoundaries();
}
