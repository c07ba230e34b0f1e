#ifndef MAZE_HPP
#define MAZE_HPP

#include <stdint.h>
#include <vector>
#include "Heading.hpp"

struct Cell {
    int x;
    int y;

    Cell() : x(0), y(0) {}
    Cell(int cx, int cy) : x(cx), y(cy) {}

    Cell step(Dir d) const { return Cell(x + dx(d), y + dy(d)); }

    bool operator==(const Cell& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Cell& o) const { return !(*this == o); }
    bool operator<(const Cell& o)  const { return x < o.x || (x == o.x && y < o.y); }
};

class Maze {
public:
    Maze(int width, int height);

    int width() const  { return w; }
    int height() const { return h; }
    int cellCount() const { return w * h; }

    bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < w && y < h; }
    bool inBounds(const Cell& c) const { return inBounds(c.x, c.y); }

    // True when a wall is known on that side, or when the side leads off the grid
    bool isWall(int x, int y, Dir d) const;
    bool isWall(const Cell& c, Dir d) const { return isWall(c.x, c.y, d); }

    // Set a wall at (x,y) facing dir, and mirror it into the neighbour if valid
    void setWall(int x, int y, Dir d);
    void setWall(const Cell& c, Dir d) { setWall(c.x, c.y, d); }

    uint8_t wallMask(int x, int y) const;

    void initializeBoundaries();

    // Forget every discovered wall; only the outer boundary remains
    void reset();

private:
    int w, h;
    std::vector<uint8_t> walls;   // walls[y*w + x]

    int index(int x, int y) const { return y * w + x; }
    void requireInBounds(int x, int y) const;
};

#endif // MAZE_HPP
