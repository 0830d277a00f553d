#pragma once

#include "vb/enums.h"
#include "vb/vec2.h"
#include <array>
#include <string>
#include <vector>

namespace vb {

// Base serving order for a 5-1: index i starts in zone i+1
constexpr std::array<Role, 6> BASE_ORDER = {
    Role::S, Role::OH1, Role::MB1, Role::OPP, Role::OH2, Role::MB2
};

inline bool isValidRotation(int rotation) {
    return rotation >= 1 && rotation <= 6;
}

// Zone (1-6) occupied by a role in the given rotation. The libero takes
// the zone of the middle it replaces.
int zoneForRole(int rotation, Role role);

// Zones 2, 3, 4
inline bool isFrontZone(int zone) {
    return zone >= 2 && zone <= 4;
}

bool isFrontRowRole(int rotation, Role role);

// Role standing in zone 1
Role serverRole(int rotation);

// Three hitters when the setter is back row
HitterMode hitterMode(int rotation);

inline int attackerCount(int rotation) {
    return hitterMode(rotation) == HitterMode::THREE_HITTER ? 3 : 2;
}

inline int advanceRotation(int rotation) {
    return (rotation % 6) + 1;
}

// Middle that sits in the back row (and is replaced by the libero)
Role backRowMiddle(int rotation);

// Zone center on the HOME half
Vec2 zoneAnchor(int zone);

struct RoleAssignment {
    Role role;
    std::string playerId;
};

struct RotationResponsibilities {
    int rotation = 1;
    std::vector<std::string> frontRowPlayers;
    std::vector<std::string> primaryPassers;
    std::vector<std::string> eligibleAttackers;
    std::string activeMiddle;           // empty if none
    bool liberoActive = false;
    std::string liberoId;
    Role liberoReplaces = Role::MB2;
};

RotationResponsibilities buildRotationResponsibilities(
    int rotation, const std::vector<RoleAssignment>& lineup);

std::string describeHitterMode(int rotation);

} // namespace vb
