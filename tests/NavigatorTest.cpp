#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <type_traits>

#include "../include/Navigator.hpp"
#include "VirtualMaze.hpp"

namespace {

// Every wall the navigator believes in must really be there
void expectKnownWallsAreReal(const Maze& known, const Maze& truth) {
    for (int y = 0; y < truth.height(); ++y) {
        for (int x = 0; x < truth.width(); ++x) {
            EXPECT_EQ(known.wallMask(x, y) & ~truth.wallMask(x, y), 0)
                << "phantom wall at (" << x << ", " << y << ")";
        }
    }
}

}  // namespace

TEST(NavigatorTest, QueriesMazeSizeOnConstruction) {
    VirtualMaze vm(9, 8);
    std::ostringstream log;
    Navigator nav(vm, log);
    EXPECT_EQ(9, nav.state().maze.width());
    EXPECT_EQ(8, nav.state().maze.height());
    EXPECT_EQ(2u, nav.state().goals.size());
}

TEST(NavigatorTest, StartPaintsMarkersAndLogsSetup) {
    VirtualMaze vm(16, 16);
    std::ostringstream log;
    Navigator nav(vm, log);
    nav.start();

    EXPECT_EQ('G', vm.colorAt(0, 0));
    EXPECT_EQ('R', vm.colorAt(7, 7));
    EXPECT_EQ('R', vm.colorAt(8, 8));
    EXPECT_NE(std::string::npos, log.str().find("Maze size: 16x16"));
    EXPECT_NE(std::string::npos, log.str().find("Goals: [(7, 7), (8, 7), (7, 8), (8, 8)]"));
}

TEST(NavigatorTest, TurnNorthToEastIsOneRightTurn) {
    VirtualMaze vm(3, 3);
    std::ostringstream log;
    Navigator nav(vm, log);

    nav.turnToDirection(EAST);
    EXPECT_EQ(EAST, nav.state().robot.heading());
    EXPECT_EQ(1, vm.count("turnRight"));
    EXPECT_EQ(0, vm.count("turnLeft"));
}

TEST(NavigatorTest, TurnToDirectionCoversEveryHeadingPair) {
    for (uint8_t from = 0; from < 4; ++from) {
        for (uint8_t to = 0; to < 4; ++to) {
            VirtualMaze vm(3, 3);
            std::ostringstream log;
            Navigator nav(vm, log);
            nav.turnToDirection(Dir(from));
            vm.clearCommands();

            nav.turnToDirection(Dir(to));
            EXPECT_EQ(Dir(to), nav.state().robot.heading());
            EXPECT_EQ(Dir(to), vm.heading());

            int turns = vm.count("turnRight") + vm.count("turnLeft");
            EXPECT_LE(turns, 2);
            uint8_t diff = (to - from + 4) & 3;
            if (diff == 0) EXPECT_EQ(0, turns);
            if (diff == 1) EXPECT_EQ(1, vm.count("turnRight"));
            if (diff == 3) EXPECT_EQ(1, vm.count("turnLeft"));
            if (diff == 2) EXPECT_EQ(2, vm.count("turnRight"));
        }
    }
}

TEST(NavigatorTest, FirstCycleScansPublishesAndMoves) {
    VirtualMaze vm(3, 3);
    std::ostringstream log;
    Navigator nav(vm, log);

    CycleResult r = nav.step();
    EXPECT_EQ(CONTINUE, r.status);

    // boundary walls behind and to the left, reported with absolute letters
    EXPECT_EQ(1, vm.count("setWall 0 0 s"));
    EXPECT_EQ(1, vm.count("setWall 0 0 w"));
    EXPECT_EQ('B', vm.colorAt(0, 0));
    EXPECT_EQ("0", vm.textAt(1, 1));
    EXPECT_EQ("2", vm.textAt(0, 0));
    EXPECT_EQ("2", vm.textAt(2, 2));

    // north and east tie; North comes first
    EXPECT_EQ(Cell(0, 1), nav.state().robot.position());
    EXPECT_EQ(Cell(0, 1), vm.position());
    EXPECT_EQ(1, vm.count("moveForward"));
    EXPECT_EQ(0, vm.count("turnRight"));
}

TEST(NavigatorTest, ScannedWallsAreTranslatedByHeading) {
    VirtualMaze vm(3, 3);
    vm.walls().setWall(0, 0, NORTH);
    std::ostringstream log;
    Navigator nav(vm, log);

    // facing East, the wall to the north is reported as the left one
    nav.turnToDirection(EAST);
    vm.clearCommands();
    ASSERT_EQ(CONTINUE, nav.step().status);

    EXPECT_EQ(1, vm.count("setWall 0 0 n"));
    EXPECT_TRUE(nav.state().maze.isWall(0, 1, SOUTH));
    EXPECT_EQ(Cell(1, 0), nav.state().robot.position());
    EXPECT_EQ(0, vm.count("turnRight") + vm.count("turnLeft"));
}

TEST(NavigatorTest, OpenThreeByThreeRunVisitsGoalAndReturns) {
    VirtualMaze vm(3, 3);
    std::ostringstream log;
    Navigator nav(vm, log);

    RunResult r = nav.run();
    EXPECT_EQ(COMPLETE, r.status);
    EXPECT_EQ(NO_FAILURE, r.reason);
    EXPECT_EQ(6, r.steps);

    EXPECT_EQ(Cell(0, 0), nav.state().robot.position());
    EXPECT_EQ(WEST, nav.state().robot.heading());
    EXPECT_EQ(SPEED_RUNNING, nav.state().robot.phase());
    EXPECT_EQ(4, nav.state().robot.visitedCount());
    EXPECT_TRUE(nav.state().robot.isVisited(Cell(1, 1)));
    EXPECT_TRUE(nav.state().robot.isVisited(Cell(1, 0)));

    EXPECT_EQ(4, vm.count("moveForward"));
    EXPECT_EQ(3, vm.count("turnRight"));
    EXPECT_EQ(0, vm.count("turnLeft"));
    EXPECT_EQ('G', vm.colorAt(0, 0));
    // the goal is painted on arrival, then repainted on the first speed-run cycle
    EXPECT_EQ(1, vm.count("setColor 1 1 G"));
    EXPECT_EQ('Y', vm.colorAt(1, 1));
    EXPECT_NE(std::string::npos, log.str().find("Reached goal! Switching to speed run mode."));
    EXPECT_NE(std::string::npos, log.str().find("Speed run complete!"));
}

TEST(NavigatorTest, ReachingGoalWhileExploringSwitchesToReturnLeg) {
    VirtualMaze vm(3, 1);
    std::ostringstream log;
    Navigator nav(vm, log);

    ASSERT_EQ(CONTINUE, nav.step().status);
    EXPECT_EQ(Cell(1, 0), nav.state().robot.position());

    ASSERT_EQ(CONTINUE, nav.step().status);
    EXPECT_EQ(SPEED_RUNNING, nav.state().robot.phase());
    ASSERT_EQ(1u, nav.state().goals.size());
    EXPECT_EQ(Cell(0, 0), nav.state().goals[0]);
    EXPECT_EQ(Cell(1, 0), nav.state().robot.position());

    ASSERT_EQ(CONTINUE, nav.step().status);
    EXPECT_EQ(Cell(0, 0), nav.state().robot.position());
    EXPECT_EQ(WEST, nav.state().robot.heading());

    CycleResult last = nav.step();
    EXPECT_EQ(COMPLETE, last.status);
    EXPECT_EQ(4, nav.steps());
}

TEST(NavigatorTest, SpeedRunStopsExploringAndHeadsHome) {
    VirtualMaze vm(3, 1);
    std::ostringstream log;
    Navigator nav(vm, log);
    nav.step();
    EXPECT_TRUE(nav.shouldExploreMore());
    nav.step();
    EXPECT_FALSE(nav.shouldExploreMore());

    nav.step();
    EXPECT_EQ(Cell(0, 0), nav.state().robot.position());
    EXPECT_EQ(3, vm.count("turnRight"));
}

namespace {

// The mouse heads (0,0) -> (1,0) -> (1,1) -> (1,2), then finds (1,2) closed
// to the north and east: the visited (1,1) is 2 from the goal, the
// unvisited (0,2) is 4.
VirtualMaze dogLegMaze() {
    VirtualMaze vm(5, 5);
    vm.walls().setWall(0, 0, NORTH);
    vm.walls().setWall(1, 2, NORTH);
    vm.walls().setWall(1, 2, EAST);
    return vm;
}

}  // namespace

TEST(NavigatorTest, ExplorationPrefersUnvisitedNeighbourOverCloserVisitedOne) {
    VirtualMaze vm = dogLegMaze();
    std::ostringstream log;
    Navigator nav(vm, log);

    for (int i = 0; i < 3; ++i) ASSERT_EQ(CONTINUE, nav.step().status);
    ASSERT_EQ(Cell(1, 2), nav.state().robot.position());
    ASSERT_TRUE(nav.state().robot.isVisited(Cell(1, 1)));

    ASSERT_EQ(CONTINUE, nav.step().status);
    EXPECT_EQ(2, nav.distances().at(1, 1));
    EXPECT_EQ(4, nav.distances().at(0, 2));
    EXPECT_EQ(Cell(0, 2), nav.state().robot.position());
    EXPECT_EQ(WEST, nav.state().robot.heading());
    EXPECT_EQ(Cell(0, 2), vm.position());
}

TEST(NavigatorTest, WithoutUnvisitedBiasExplorationFollowsDistance) {
    VirtualMaze vm = dogLegMaze();
    std::ostringstream log;
    NavigatorConfig cfg;
    cfg.unvisitedBias = 0;
    Navigator nav(vm, log, cfg);

    for (int i = 0; i < 3; ++i) ASSERT_EQ(CONTINUE, nav.step().status);
    ASSERT_EQ(Cell(1, 2), nav.state().robot.position());
    vm.clearCommands();

    ASSERT_EQ(CONTINUE, nav.step().status);
    EXPECT_EQ(Cell(1, 1), nav.state().robot.position());
    EXPECT_EQ(SOUTH, nav.state().robot.heading());
    EXPECT_EQ(2, vm.count("turnRight"));
    EXPECT_EQ(Cell(1, 1), vm.position());
}

TEST(NavigatorTest, DefaultCoverageSharesCompareInDoublePrecision) {
    NavigatorConfig cfg;
    // 90 * 0.7 falls just below 63 in double precision
    EXPECT_GT(63, 90 * cfg.goalCoverage);
}

TEST(NavigatorTest, IsNotCopyable) {
    EXPECT_FALSE(std::is_copy_constructible<Navigator>::value);
    EXPECT_FALSE(std::is_copy_assignable<Navigator>::value);
}

TEST(NavigatorTest, BoxedInStartIsFatal) {
    VirtualMaze vm(3, 1);
    vm.walls().setWall(0, 0, EAST);
    std::ostringstream log;
    Navigator nav(vm, log);

    RunResult r = nav.run();
    EXPECT_EQ(FATAL, r.status);
    EXPECT_EQ(NO_VALID_MOVE, r.reason);
    EXPECT_EQ(1, r.steps);
    EXPECT_EQ(0, vm.count("moveForward"));
    EXPECT_NE(std::string::npos, log.str().find("No valid moves available!"));
    EXPECT_NE(std::string::npos, log.str().find("=== Maze Map"));
}

TEST(NavigatorTest, StepCeilingIsFatal) {
    VirtualMaze vm(3, 1);
    std::ostringstream log;
    NavigatorConfig cfg;
    cfg.maxSteps = 1;
    Navigator nav(vm, log, cfg);

    RunResult r = nav.run();
    EXPECT_EQ(FATAL, r.status);
    EXPECT_EQ(STEP_LIMIT, r.reason);
    EXPECT_EQ(2, r.steps);
    EXPECT_EQ(1, vm.count("moveForward"));
    EXPECT_NE(std::string::npos, log.str().find("Maximum steps reached, terminating"));
}

TEST(NavigatorTest, ResetMidRunRestoresFreshStateAndRunStillCompletes) {
    VirtualMaze vm(3, 3);
    std::ostringstream log;
    Navigator nav(vm, log);
    nav.start();
    nav.step();
    nav.step();
    ASSERT_NE(Cell(0, 0), nav.state().robot.position());

    vm.requestReset();
    vm.clearCommands();
    EXPECT_EQ(CONTINUE, nav.step().status);
    EXPECT_EQ("ackReset", vm.commands().front());
    EXPECT_EQ(0, vm.count("moveForward"));
    EXPECT_TRUE(nav.state() == ControllerState(3, 3));
    EXPECT_NE(std::string::npos, log.str().find("Reset detected!"));

    CycleResult r;
    do { r = nav.step(); } while (r.status == CONTINUE);
    EXPECT_EQ(COMPLETE, r.status);
    EXPECT_EQ(Cell(0, 0), vm.position());
}

TEST(NavigatorTest, CompletesCarvedMazesWithinTheCeiling) {
    for (unsigned seed = 1; seed <= 8; ++seed) {
        Maze layout = carvePerfectMaze(8, 8, seed);
        VirtualMaze vm(layout);
        std::ostringstream log;
        Navigator nav(vm, log);

        RunResult r = nav.run();
        EXPECT_EQ(COMPLETE, r.status) << "seed " << seed;
        EXPECT_LE(r.steps, 10000);
        EXPECT_EQ(Cell(0, 0), vm.position());
        EXPECT_EQ(nav.state().robot.position(), vm.position());
        expectKnownWallsAreReal(nav.state().maze, layout);
    }
}

TEST(NavigatorTest, CompletesOddSizedMazeWithTwoGoals) {
    Maze layout = carvePerfectMaze(6, 5, 42);
    VirtualMaze vm(layout);
    std::ostringstream log;
    Navigator nav(vm, log);

    RunResult r = nav.run();
    EXPECT_EQ(COMPLETE, r.status);
    expectKnownWallsAreReal(nav.state().maze, layout);
}
