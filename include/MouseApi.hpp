#ifndef MOUSE_API_HPP
#define MOUSE_API_HPP

#include <string>

// Sensor/actuator access point used by the navigator.
// Queries block until the answer is available; commands are fire-and-forget.
class MouseApi {
public:
    virtual ~MouseApi() {}

    virtual int mazeWidth() = 0;
    virtual int mazeHeight() = 0;

    // Relative to the current heading, at the current cell
    virtual bool wallFront() = 0;
    virtual bool wallRight() = 0;
    virtual bool wallLeft() = 0;
    virtual bool wallBack() = 0;

    virtual void moveForward(int distance = 1) = 0;
    virtual void turnRight() = 0;
    virtual void turnLeft() = 0;

    // Visualizer only: direction is one of 'n', 'e', 's', 'w'
    virtual void setWall(int x, int y, char direction) = 0;
    virtual void clearWall(int x, int y, char direction) = 0;

    virtual void setColor(int x, int y, char color) = 0;
    virtual void clearColor(int x, int y) = 0;
    virtual void clearAllColor() = 0;

    virtual void setText(int x, int y, const std::string& text) = 0;
    virtual void clearText(int x, int y) = 0;
    virtual void clearAllText() = 0;

    virtual bool wasReset() = 0;
    virtual void ackReset() = 0;
};

#endif // MOUSE_API_HPP
