#include "../include/Navigator.hpp"

#include <climits>
#include <string>

const char* failReasonName(FailReason r) {
    switch (r) {
        case NO_VALID_MOVE: return "no valid move";
        case STEP_LIMIT:    return "step limit";
        default:            return "none";
    }
}

ControllerState Navigator::queryState(MouseApi& api) {
    // width first: the simulator answers in request order
    int w = api.mazeWidth();
    int h = api.mazeHeight();
    return ControllerState(w, h);
}

Navigator::Navigator(MouseApi& api, std::ostream& log, const NavigatorConfig& cfg)
    : api(api), cfg(cfg), log(log),
      current(queryState(api)),
      dist(current.maze.width(), current.maze.height()),
      resets(api, cfg),
      stepCount(0) {}

void Navigator::logGoals() {
    log << "Goals: [";
    for (size_t i = 0; i < current.goals.size(); ++i) {
        if (i) log << ", ";
        log << "(" << current.goals[i].x << ", " << current.goals[i].y << ")";
    }
    log << "]" << std::endl;
}

void Navigator::start() {
    log << "Maze size: " << current.maze.width() << "x" << current.maze.height() << std::endl;
    logGoals();
    resets.paintMarkers(current);
}

RunResult Navigator::run() {
    start();

    CycleResult r;
    do {
        r = step();
    } while (r.status == CONTINUE);

    RunResult out;
    out.status = r.status;
    out.reason = r.reason;
    out.steps = stepCount;
    return out;
}

CycleResult Navigator::step() {
    ++stepCount;
    if (stepCount > cfg.maxSteps) {
        return fail(STEP_LIMIT, "Maximum steps reached, terminating");
    }

    const Cell here = current.robot.position();
    log << "Step " << stepCount << " at (" << here.x << ", " << here.y << "), phase: "
        << phaseName(current.robot.phase()) << std::endl;

    if (resets.poll()) {
        log << "Reset detected!" << std::endl;
        resets.apply(current);
        log << "Reset complete, restarting algorithm" << std::endl;
        return CycleResult(CONTINUE);
    }

    scanWalls();

    api.setColor(here.x, here.y,
                 current.robot.phase() == EXPLORING ? cfg.exploringColor : cfg.speedRunColor);

    recomputeDistances();

    if (current.atGoal()) {
        api.setColor(here.x, here.y, cfg.completeColor);
        if (current.robot.phase() == EXPLORING) {
            log << "Reached goal! Switching to speed run mode." << std::endl;
            current.robot.setPhase(SPEED_RUNNING);
            current.goals.assign(1, ControllerState::startCell());
            return CycleResult(CONTINUE);
        }
        log << "Speed run complete!" << std::endl;
        return CycleResult(COMPLETE);
    }

    Dir next = chooseDirection();
    if (next == NONE) {
        return fail(NO_VALID_MOVE, "No valid moves available!");
    }

    turnToDirection(next);
    moveForward();
    return CycleResult(CONTINUE);
}

CycleResult Navigator::fail(FailReason reason, const char* message) {
    const Cell here = current.robot.position();
    log << message << std::endl;
    log << "Cycle " << stepCount << ": at (" << here.x << ", " << here.y << ") heading "
        << dirName(current.robot.heading()) << ", phase " << phaseName(current.robot.phase())
        << " (" << failReasonName(reason) << ")" << std::endl;
    current.printAscii(log);
    log.flush();
    return CycleResult(FATAL, reason);
}

void Navigator::scanWalls() {
    const Cell here = current.robot.position();
    const Dir h = current.robot.heading();

    // front, right, back, left
    bool seen[4];
    seen[0] = api.wallFront();
    seen[1] = api.wallRight();
    seen[2] = api.wallBack();
    seen[3] = api.wallLeft();

    for (uint8_t rel = 0; rel < 4; ++rel) {
        if (!seen[rel]) continue;
        Dir abs = relativeTo(h, rel);
        current.maze.setWall(here, abs);
        api.setWall(here.x, here.y, dirLetter(abs));
    }
}

void Navigator::recomputeDistances() {
    dist = FloodFill::compute(current.maze, current.goals);
    publishDistances();
}

void Navigator::publishDistances() {
    api.clearAllText();
    for (int x = 0; x < dist.width(); ++x) {
        for (int y = 0; y < dist.height(); ++y) {
            if (dist.reachable(x, y)) api.setText(x, y, std::to_string(dist.at(x, y)));
        }
    }
}

bool Navigator::shouldExploreMore() const {
    if (current.robot.phase() == SPEED_RUNNING) return false;

    const Cell here = current.robot.position();
    for (uint8_t d = 0; d < 4; ++d) {
        Dir dir = Dir(d);
        if (current.maze.isWall(here, dir)) continue;
        if (!current.robot.isVisited(here.step(dir))) return true;
    }

    const double cells = current.maze.cellCount();
    const double seen = current.robot.visitedCount();

    if (current.atGoal() && seen > cells * cfg.goalCoverage) return false;
    return seen < cells * cfg.exploreCoverage;
}

Dir Navigator::chooseDirection() const {
    if (current.robot.phase() == EXPLORING && shouldExploreMore()) {
        return chooseExploreDirection();
    }
    const Cell here = current.robot.position();
    return FloodFill::cheapestNeighbour(current.maze, dist, here.x, here.y);
}

Dir Navigator::chooseExploreDirection() const {
    const Cell here = current.robot.position();
    long best = LONG_MAX;
    Dir bestDir = NONE;

    for (uint8_t d = 0; d < 4; ++d) {
        Dir dir = Dir(d);
        if (current.maze.isWall(here, dir)) continue;
        Cell n = here.step(dir);
        if (!dist.reachable(n)) continue;

        long score = dist.at(n);
        if (!current.robot.isVisited(n)) score -= cfg.unvisitedBias;   // pull toward new ground
        if (score < best) { best = score; bestDir = dir; }
    }
    return bestDir;
}

void Navigator::turnToDirection(Dir target) {
    const Dir h = current.robot.heading();
    const uint8_t diff = (uint8_t(target) - uint8_t(h) + 4) & 3;

    if (diff == 1) {
        api.turnRight();
        current.robot.turnRight();
    } else if (diff == 3) {
        api.turnLeft();
        current.robot.turnLeft();
    } else if (diff == 2) {
        api.turnRight();
        api.turnRight();
        current.robot.turnRight();
        current.robot.turnRight();
    }
}

void Navigator::moveForward() {
    api.moveForward(1);
    current.robot.advance();
    const Cell at = current.robot.position();
    log << "Moved to (" << at.x << ", " << at.y << ")" << std::endl;
}
