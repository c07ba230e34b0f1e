#ifndef SIMULATOR_API_HPP
#define SIMULATOR_API_HPP

#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include "MouseApi.hpp"

class SimulatorError : public std::runtime_error {
public:
    explicit SimulatorError(const std::string& what) : std::runtime_error(what) {}
};

// MouseApi over the simulator's line protocol: one command per line out,
// one answer per line back for queries.
class SimulatorApi : public MouseApi {
public:
    SimulatorApi(std::istream& in, std::ostream& out);

    int mazeWidth();
    int mazeHeight();

    bool wallFront();
    bool wallRight();
    bool wallLeft();
    bool wallBack();

    void moveForward(int distance = 1);
    void turnRight();
    void turnLeft();

    void setWall(int x, int y, char direction);
    void clearWall(int x, int y, char direction);

    void setColor(int x, int y, char color);
    void clearColor(int x, int y);
    void clearAllColor();

    void setText(int x, int y, const std::string& text);
    void clearText(int x, int y);
    void clearAllText();

    bool wasReset();
    void ackReset();

private:
    std::istream& in;
    std::ostream& out;

    void command(const std::string& cmd);
    std::string query(const std::string& cmd);
    int  queryInt(const std::string& cmd);
    bool queryBool(const std::string& cmd);
};

#endif // SIMULATOR_API_HPP
