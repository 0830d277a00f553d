#pragma once

#include "vb/blackboard.h"
#include "vb/court.h"

namespace vb {

struct GoalResolution {
    Vec2 target{};
    bool allowNetProximity = false;
    double desiredSpeedFactor = 1.0;
};

// Court target for a goal. Points are authored for HOME, mirrored about
// the net for AWAY and clamped to the court bounds.
GoalResolution resolveGoal(GoalType goal, const Player& self, const Blackboard& bb,
                           const CourtModel& court);

// Attack approach points, also used as set targets
Vec2 leftApproachPoint(const CourtModel& court, TeamSide team);
Vec2 rightApproachPoint(const CourtModel& court, TeamSide team);
Vec2 middleApproachPoint(const CourtModel& court, TeamSide team);
Vec2 settingZonePoint(const CourtModel& court, TeamSide team);

bool isApproachGoal(GoalType goal);

} // namespace vb
