#pragma once
#include "Config.hpp"
#include "ControllerState.hpp"
#include "MouseApi.hpp"

// Brings the controller back to its start-of-run state when the
// simulator asks for a reset, without restarting the process.
class ResetHandler {
public:
    ResetHandler(MouseApi& api, const NavigatorConfig& cfg);

    bool poll();

    // Acknowledge, replace the state with a fresh one of the same size,
    // then clear the overlays and repaint start/goal markers.
    void apply(ControllerState& state);

    void paintMarkers(const ControllerState& state);

private:
    MouseApi& api;
    NavigatorConfig cfg;
};
