#include "../include/RobotState.hpp"

#include <stdexcept>

const char* phaseName(Phase p) {
    return p == EXPLORING ? "explore" : "speed_run";
}

RobotState::RobotState(int mazeWidth, int mazeHeight, Cell start, Dir startH)
    : w(mazeWidth), h(mazeHeight), pos(start), dir(startH), ph(EXPLORING), visitedCells(0) {
    reset(start, startH);
}

void RobotState::reset(Cell start, Dir startH) {
    visited.assign(static_cast<size_t>(w) * h, false);
    visitedCells = 0;
    pos = start;
    dir = startH;
    ph = EXPLORING;
    markVisited(pos);
}

void RobotState::advance() {
    Cell next = pos.step(dir);
    if (next.x < 0 || next.y < 0 || next.x >= w || next.y >= h) {
        throw std::out_of_range("robot driven off the maze");
    }
    pos = next;
    markVisited(pos);
}

void RobotState::markVisited(const Cell& c) {
    if (c.x < 0 || c.y < 0 || c.x >= w || c.y >= h) return;
    size_t i = static_cast<size_t>(c.y) * w + c.x;
    if (!visited[i]) {
        visited[i] = true;
        ++visitedCells;
    }
}

bool RobotState::isVisited(const Cell& c) const {
    if (c.x < 0 || c.y < 0 || c.x >= w || c.y >= h) return false;
    return visited[static_cast<size_t>(c.y) * w + c.x];
}

float RobotState::completionPercent() const {
    // clamp to 100 just in case
    float pct = (100.0f * visitedCells) / (float)(w * h);
    if (pct > 100.0f) pct = 100.0f;
    return pct;
}
