#include "../include/ControllerState.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

ControllerState::ControllerState(int width, int height)
    : maze(width, height),
      robot(width, height, startCell(), startHeading()),
      goals(centerGoals(width, height)) {}

std::vector<Cell> ControllerState::centerGoals(int width, int height) {
    int cx = width / 2;
    int cy = height / 2;
    std::vector<Cell> g;

    if (width % 2 == 0 && height % 2 == 0) {
        g.push_back(Cell(cx - 1, cy - 1));
        g.push_back(Cell(cx,     cy - 1));
        g.push_back(Cell(cx - 1, cy));
        g.push_back(Cell(cx,     cy));
    } else if (width % 2 == 0) {
        g.push_back(Cell(cx - 1, cy));
        g.push_back(Cell(cx,     cy));
    } else if (height % 2 == 0) {
        g.push_back(Cell(cx, cy - 1));
        g.push_back(Cell(cx, cy));
    } else {
        g.push_back(Cell(cx, cy));
    }
    return g;
}

bool ControllerState::isGoal(const Cell& c) const {
    return std::find(goals.begin(), goals.end(), c) != goals.end();
}

void ControllerState::printAscii(std::ostream& out) const {
    const int w = maze.width();
    const int h = maze.height();
    const Cell at = robot.position();

    out << "=== Maze Map (visited='.', goal='*') ===\n";
    for (int y = h - 1; y >= 0; --y) {
        // top edges of row y
        for (int x = 0; x < w; ++x) {
            out << '+' << (maze.isWall(x, y, NORTH) ? "---" : "   ");
        }
        out << "+\n";

        for (int x = 0; x < w; ++x) {
            out << (maze.isWall(x, y, WEST) ? '|' : ' ');

            char cellCh = ' ';
            if (isGoal(Cell(x, y)))                cellCh = '*';
            else if (robot.isVisited(Cell(x, y)))  cellCh = '.';
            if (x == at.x && y == at.y) {
                switch (robot.heading()) {
                    case NORTH: cellCh = '^'; break;
                    case EAST:  cellCh = '>'; break;
                    case SOUTH: cellCh = 'v'; break;
                    default:    cellCh = '<'; break;
                }
            }
            out << ' ' << cellCh << ' ';
        }
        out << "|\n";
    }
    for (int x = 0; x < w; ++x) {
        out << '+' << (maze.isWall(x, 0, SOUTH) ? "---" : "   ");
    }
    out << "+\n";

    // formatted aside so the caller's stream keeps its flags
    std::ostringstream pct;
    pct << std::fixed << std::setprecision(1) << robot.completionPercent();
    out << "Visited: " << robot.visitedCount() << "/" << maze.cellCount()
        << "  (" << pct.str() << "%)\n";
}

bool operator==(const ControllerState& a, const ControllerState& b) {
    if (a.maze.width() != b.maze.width() || a.maze.height() != b.maze.height()) return false;
    if (a.goals != b.goals) return false;
    if (a.robot.position() != b.robot.position()) return false;
    if (a.robot.heading() != b.robot.heading()) return false;
    if (a.robot.phase() != b.robot.phase()) return false;
    if (a.robot.visitedCount() != b.robot.visitedCount()) return false;

    for (int y = 0; y < a.maze.height(); ++y) {
        for (int x = 0; x < a.maze.width(); ++x) {
            if (a.maze.wallMask(x, y) != b.maze.wallMask(x, y)) return false;
            if (a.robot.isVisited(Cell(x, y)) != b.robot.isVisited(Cell(x, y))) return false;
        }
    }
    return true;
}
