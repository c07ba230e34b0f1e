#pragma once
#include <vector>
#include "Heading.hpp"
#include "Maze.hpp"

enum Phase { EXPLORING, SPEED_RUNNING };

const char* phaseName(Phase p);

class RobotState {
public:
    RobotState(int mazeWidth, int mazeHeight, Cell start = Cell(0, 0), Dir startH = NORTH);

    void reset(Cell start, Dir startH);

    Cell position() const { return pos; }
    Dir  heading() const  { return dir; }
    Phase phase() const   { return ph; }

    void setPhase(Phase p) { ph = p; }

    // Heading arithmetic only; the caller issues the actual turn command
    void turnLeft()  { dir = leftOf(dir); }
    void turnRight() { dir = rightOf(dir); }

    // Advance one cell along the current heading and mark it visited
    void advance();

    void markVisited(const Cell& c);
    bool isVisited(const Cell& c) const;
    int  visitedCount() const { return visitedCells; }
    float completionPercent() const;

private:
    int w, h;
    Cell pos;
    Dir dir;
    Phase ph;
    std::vector<bool> visited;   // visited[y*w + x]
    int visitedCells;
};
