#pragma once

#include "vb/enums.h"
#include "vb/vec2.h"
#include <string>

namespace vb {

struct SkillPair {
    double accuracy = 0.0;
    double consistency = 0.0;

    bool operator==(const SkillPair& o) const {
        return accuracy == o.accuracy && consistency == o.consistency;
    }
};

struct PlayerSkills {
    SkillPair passing{0.7, 0.6};
    SkillPair setting{0.7, 0.6};
    SkillPair attacking{0.65, 0.7};     // power, accuracy
    SkillPair serving{0.7, 0.65};
    SkillPair blocking{0.6, 0.5};       // timing, reach
    SkillPair movement{0.7, 0.6};       // speed, agility

    bool operator==(const PlayerSkills& o) const {
        return passing == o.passing && setting == o.setting && attacking == o.attacking &&
               serving == o.serving && blocking == o.blocking && movement == o.movement;
    }
};

// Externally supplied goal. The label is validated when a tree applies it.
struct GoalOverride {
    bool active = false;
    std::string goal;

    bool operator==(const GoalOverride& o) const {
        return active == o.active && goal == o.goal;
    }
};

struct Player {
    std::string id;                 // "H-S", "A-OH1", ...
    TeamSide team = TeamSide::HOME;
    Role role = Role::S;
    RoleCategory category = RoleCategory::SETTER;
    int priority = 1;
    Vec2 position{};
    Vec2 velocity{};
    double maxSpeed = 1.0;
    bool hasRequestedGoal = false;
    GoalType requestedGoal = GoalType::MaintainBaseResponsibility;
    GoalType baseGoal = GoalType::MaintainBaseResponsibility;
    GoalOverride override;
    bool active = true;
    PlayerSkills skills;

    // Goal the movement system steers toward this tick
    GoalType currentGoal() const {
        return hasRequestedGoal ? requestedGoal : baseGoal;
    }

    bool operator==(const Player& o) const;
    bool operator!=(const Player& o) const { return !(*this == o); }
};

// Category, priority and speed are derived from the role
Player makePlayer(const std::string& id, TeamSide team, Role role, Vec2 position);

std::string playerIdFor(TeamSide team, Role role);

} // namespace vb
