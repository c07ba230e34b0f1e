#pragma once
#include <stdint.h>
#include <vector>
#include "Heading.hpp"
#include "Maze.hpp"

// Hop count from each cell to the nearest goal, or UNREACHABLE
class DistanceMap {
public:
    static const uint16_t UNREACHABLE = 0xFFFF;

    DistanceMap(int width, int height);

    int width() const  { return w; }
    int height() const { return h; }

    uint16_t at(int x, int y) const { return dist[y * w + x]; }
    uint16_t at(const Cell& c) const { return at(c.x, c.y); }
    bool reachable(int x, int y) const { return at(x, y) != UNREACHABLE; }
    bool reachable(const Cell& c) const { return reachable(c.x, c.y); }

    void set(int x, int y, uint16_t v) { dist[y * w + x] = v; }

private:
    int w, h;
    std::vector<uint16_t> dist;
};

class FloodFill {
public:
    // Multi-source BFS from every goal through the known wall graph.
    // Neighbours are expanded in N, E, S, W order.
    static DistanceMap compute(const Maze& maze, const std::vector<Cell>& goals);

    // Open, reachable neighbour of (x,y) with the strictly lowest distance.
    // Ties go to the first in N, E, S, W order. NONE if boxed in.
    static Dir cheapestNeighbour(const Maze& maze, const DistanceMap& dist, int x, int y);
};
