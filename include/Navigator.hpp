#ifndef NAVIGATOR_HPP
#define NAVIGATOR_HPP

#include <ostream>
#include "Config.hpp"
#include "ControllerState.hpp"
#include "FloodFill.hpp"
#include "MouseApi.hpp"
#include "ResetHandler.hpp"

enum CycleStatus { CONTINUE, COMPLETE, FATAL };
enum FailReason { NO_FAILURE, NO_VALID_MOVE, STEP_LIMIT };

const char* failReasonName(FailReason r);

struct CycleResult {
    CycleStatus status;
    FailReason reason;

    CycleResult(CycleStatus s = CONTINUE, FailReason r = NO_FAILURE) : status(s), reason(r) {}
};

struct RunResult {
    CycleStatus status;
    FailReason reason;
    int steps;
};

class Navigator {
public:
    // Queries the maze size from the api; log receives the diagnostic lines
    Navigator(MouseApi& api, std::ostream& log, const NavigatorConfig& cfg = NavigatorConfig());

    Navigator(const Navigator&) = delete;
    Navigator& operator=(const Navigator&) = delete;

    // Log the setup and paint the start/goal markers
    void start();

    // One scan / flood / decide / move cycle
    CycleResult step();

    // start() then step() until COMPLETE or FATAL
    RunResult run();

    // Rotate in place, open loop, using at most two turn commands
    void turnToDirection(Dir target);

    bool shouldExploreMore() const;
    Dir  chooseDirection() const;

    const ControllerState& state() const { return current; }
    const DistanceMap& distances() const { return dist; }
    int steps() const { return stepCount; }

private:
    MouseApi& api;
    NavigatorConfig cfg;
    std::ostream& log;
    ControllerState current;
    DistanceMap dist;
    ResetHandler resets;
    int stepCount;

    static ControllerState queryState(MouseApi& api);

    void scanWalls();
    void recomputeDistances();
    void publishDistances();
    void moveForward();

    Dir chooseExploreDirection() const;

    CycleResult fail(FailReason reason, const char* message);
    void logGoals();
};

#endif // NAVIGATOR_HPP
