#include "../include/SimulatorApi.hpp"

#include <cerrno>
#include <cstdlib>
#include <sstream>

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

}  // namespace

SimulatorApi::SimulatorApi(std::istream& in, std::ostream& out) : in(in), out(out) {}

void SimulatorApi::command(const std::string& cmd) {
    out << cmd << '\n';
    out.flush();
}

std::string SimulatorApi::query(const std::string& cmd) {
    command(cmd);

    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        // acknowledgements of earlier commands can arrive ahead of the answer
        if (line.empty() || line == "ack" || line == "reset") continue;
        return line;
    }
    throw SimulatorError("simulator closed the stream while answering '" + cmd + "'");
}

int SimulatorApi::queryInt(const std::string& cmd) {
    std::string reply = query(cmd);
    const char* begin = reply.c_str();
    char* end = 0;
    errno = 0;
    long v = std::strtol(begin, &end, 10);
    if (end == begin || *end != '\0' || errno == ERANGE) {
        throw SimulatorError("expected an integer for '" + cmd + "', got '" + reply + "'");
    }
    return static_cast<int>(v);
}

bool SimulatorApi::queryBool(const std::string& cmd) {
    return query(cmd) == "true";
}

int SimulatorApi::mazeWidth()  { return queryInt("mazeWidth"); }
int SimulatorApi::mazeHeight() { return queryInt("mazeHeight"); }

bool SimulatorApi::wallFront() { return queryBool("wallFront"); }
bool SimulatorApi::wallRight() { return queryBool("wallRight"); }
bool SimulatorApi::wallLeft()  { return queryBool("wallLeft"); }
bool SimulatorApi::wallBack()  { return queryBool("wallBack"); }

void SimulatorApi::moveForward(int distance) {
    std::ostringstream cmd;
    cmd << "moveForward " << distance;
    command(cmd.str());
}

void SimulatorApi::turnRight() { command("turnRight"); }
void SimulatorApi::turnLeft()  { command("turnLeft"); }

void SimulatorApi::setWall(int x, int y, char direction) {
    std::ostringstream cmd;
    cmd << "setWall " << x << " " << y << " " << direction;
    command(cmd.str());
}

void SimulatorApi::clearWall(int x, int y, char direction) {
    std::ostringstream cmd;
    cmd << "clearWall " << x << " " << y << " " << direction;
    command(cmd.str());
}

void SimulatorApi::setColor(int x, int y, char color) {
    std::ostringstream cmd;
    cmd << "setColor " << x << " " << y << " " << color;
    command(cmd.str());
}

void SimulatorApi::clearColor(int x, int y) {
    std::ostringstream cmd;
    cmd << "clearColor " << x << " " << y;
    command(cmd.str());
}

void SimulatorApi::clearAllColor() { command("clearAllColor"); }

void SimulatorApi::setText(int x, int y, const std::string& text) {
    std::ostringstream cmd;
    cmd << "setText " << x << " " << y << " " << text;
    command(cmd.str());
}

void SimulatorApi::clearText(int x, int y) {
    std::ostringstream cmd;
    cmd << "clearText " << x << " " << y;
    command(cmd.str());
}

void SimulatorApi::clearAllText() { command("clearAllText"); }

bool SimulatorApi::wasReset() { return queryBool("wasReset"); }
void SimulatorApi::ackReset() { command("ackReset"); }
