#include "../include/ResetHandler.hpp"

ResetHandler::ResetHandler(MouseApi& api, const NavigatorConfig& cfg) : api(api), cfg(cfg) {}

bool ResetHandler::poll() {
    return api.wasReset();
}

void ResetHandler::apply(ControllerState& state) {
    api.ackReset();

    state = ControllerState(state.maze.width(), state.maze.height());

    api.clearAllColor();
    api.clearAllText();
    paintMarkers(state);
}

void ResetHandler::paintMarkers(const ControllerState& state) {
    Cell start = ControllerState::startCell();
    api.setColor(start.x, start.y, cfg.startColor);
    for (size_t i = 0; i < state.goals.size(); ++i) {
        api.setColor(state.goals[i].x, state.goals[i].y, cfg.goalColor);
    }
}
