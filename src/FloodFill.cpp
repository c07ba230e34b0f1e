#include "../include/FloodFill.hpp"

#include <deque>
#include <sstream>
#include <stdexcept>

const uint16_t DistanceMap::UNREACHABLE;

DistanceMap::DistanceMap(int width, int height)
    : w(width), h(height), dist(static_cast<size_t>(width) * height, UNREACHABLE) {}

DistanceMap FloodFill::compute(const Maze& maze, const std::vector<Cell>& goals) {
    DistanceMap dist(maze.width(), maze.height());
    std::deque<Cell> queue;

    for (size_t i = 0; i < goals.size(); ++i) {
        const Cell& g = goals[i];
        if (!maze.inBounds(g)) {
            std::ostringstream msg;
            msg << "goal (" << g.x << ", " << g.y << ") outside maze";
            throw std::out_of_range(msg.str());
        }
        dist.set(g.x, g.y, 0);
        queue.push_back(g);
    }

    while (!queue.empty()) {
        Cell c = queue.front();
        queue.pop_front();
        uint16_t next = static_cast<uint16_t>(dist.at(c) + 1);

        for (uint8_t d = 0; d < 4; ++d) {
            Dir dir = Dir(d);
            if (maze.isWall(c, dir)) continue;   // also covers the grid edge
            Cell n = c.step(dir);
            if (dist.at(n) > next) {
                dist.set(n.x, n.y, next);
                queue.push_back(n);
            }
        }
    }
    return dist;
}

Dir FloodFill::cheapestNeighbour(const Maze& maze, const DistanceMap& dist, int x, int y) {
    uint16_t best = DistanceMap::UNREACHABLE;
    Dir bestDir = NONE;

    for (uint8_t d = 0; d < 4; ++d) {
        Dir dir = Dir(d);
        if (maze.isWall(x, y, dir)) continue;
        uint16_t v = dist.at(x + dx(dir), y + dy(dir));
        if (v < best) { best = v; bestDir = dir; }
    }
    return bestDir;
}
