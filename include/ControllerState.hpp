#pragma once
#include <ostream>
#include <vector>
#include "FloodFill.hpp"
#include "Maze.hpp"
#include "RobotState.hpp"

// Everything the navigator knows about the run. Replaced wholesale on reset.
struct ControllerState {
    Maze maze;
    RobotState robot;
    std::vector<Cell> goals;

    ControllerState(int width, int height);

    static Cell startCell() { return Cell(0, 0); }
    static Dir startHeading() { return NORTH; }

    // 1, 2 or 4 centre cells depending on the parity of the maze sides
    static std::vector<Cell> centerGoals(int width, int height);

    bool isGoal(const Cell& c) const;
    bool atGoal() const { return isGoal(robot.position()); }

    // ASCII dump: walls, visited '.', goals '*', robot heading marker
    void printAscii(std::ostream& out) const;
};

bool operator==(const ControllerState& a, const ControllerState& b);
