#include "vb/player.h"

namespace vb {

bool Player::operator==(const Player& o) const {
    return id == o.id && team == o.team && role == o.role && category == o.category &&
           priority == o.priority && position == o.position && velocity == o.velocity &&
           maxSpeed == o.maxSpeed && hasRequestedGoal == o.hasRequestedGoal &&
           requestedGoal == o.requestedGoal && baseGoal == o.baseGoal &&
           override == o.override && active == o.active && skills == o.skills;
}

Player makePlayer(const std::string& id, TeamSide team, Role role, Vec2 position) {
    Player p;
    p.id = id;
    p.team = team;
    p.role = role;
    p.category = categoryOf(role);
    p.priority = categoryPriority(p.category);
    p.position = position;
    p.maxSpeed = defaultMaxSpeed(p.category);
    return p;
}

std::string playerIdFor(TeamSide team, Role role) {
    return std::string(team == TeamSide::HOME ? "H-" : "A-") + toString(role);
}

} // namespace vb
