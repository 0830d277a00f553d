#pragma once

#include "vb/enums.h"
#include "vb/vec2.h"

namespace vb {

struct CourtModel {
    Vec2 boundsMin{0.0, -0.05};
    Vec2 boundsMax{1.0, 1.05};
    double netY = 0.5;
    double attackLineOffset = 0.1667;

    // HOME owns y >= netY
    TeamSide sideOf(Vec2 p) const {
        return p.y >= netY ? TeamSide::HOME : TeamSide::AWAY;
    }

    // Points are authored from the HOME perspective and reflected about the net for AWAY
    Vec2 forTeam(TeamSide team, Vec2 homePoint) const {
        if (team == TeamSide::HOME) return homePoint;
        return {homePoint.x, netY - (homePoint.y - netY)};
    }

    Vec2 clamp(Vec2 p) const { return clampVec(p, boundsMin, boundsMax); }

    // Inner playing area used to judge in/out landings
    static bool isInBounds(Vec2 p) {
        return p.x >= 0.05 && p.x <= 0.95 && p.y >= 0.05 && p.y <= 0.95;
    }

    bool operator==(const CourtModel& o) const {
        return boundsMin == o.boundsMin && boundsMax == o.boundsMax &&
               netY == o.netY && attackLineOffset == o.attackLineOffset;
    }
};

} // namespace vb
