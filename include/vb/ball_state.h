#pragma once

#include "vb/enums.h"
#include "vb/vec2.h"

namespace vb {

struct BallState {
    Vec2 position{0.5, 0.92};
    Vec2 velocity{};
    Vec2 predictedLanding{0.5, 0.14};
    int touchCount = 0;             // resets when the ball changes sides
    TeamSide side = TeamSide::HOME; // half of the court the ball is over
    bool hasLastTouch = false;
    TeamSide lastTouchTeam = TeamSide::HOME;
    bool inFlight = false;          // travelling toward predictedLanding
    bool crossedNet = false;        // current flight already crossed
    Vec2 flightOrigin{0.5, 0.92};   // where the current flight started

    static BallState atServe(TeamSide serving) {
        BallState b;
        b.position = {0.5, serving == TeamSide::HOME ? 0.92 : 0.08};
        b.flightOrigin = b.position;
        b.predictedLanding = {0.5, serving == TeamSide::HOME ? 0.14 : 0.86};
        b.side = serving;
        return b;
    }

    bool operator==(const BallState& o) const {
        return position == o.position && velocity == o.velocity &&
               predictedLanding == o.predictedLanding && touchCount == o.touchCount &&
               side == o.side && hasLastTouch == o.hasLastTouch &&
               lastTouchTeam == o.lastTouchTeam && inFlight == o.inFlight &&
               crossedNet == o.crossedNet && flightOrigin == o.flightOrigin;
    }
};

} // namespace vb
