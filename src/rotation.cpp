#include "vb/rotation.h"
#include <stdexcept>

namespace vb {

namespace {

// Zone sequence a player walks through as rotations advance
constexpr std::array<int, 6> ZONE_ORDER = {1, 6, 5, 4, 3, 2};

int baseZone(Role role) {
    for (size_t i = 0; i < BASE_ORDER.size(); ++i) {
        if (BASE_ORDER[i] == role) return static_cast<int>(i) + 1;
    }
    return 1;
}

const std::string* findId(const std::vector<RoleAssignment>& lineup, Role role) {
    for (const auto& a : lineup) {
        if (a.role == role) return &a.playerId;
    }
    return nullptr;
}

} // anonymous namespace

int zoneForRole(int rotation, Role role) {
    if (!isValidRotation(rotation)) {
        throw std::invalid_argument("Rotation must be 1-6");
    }
    if (role == Role::L) {
        return zoneForRole(rotation, backRowMiddle(rotation));
    }

    int start = baseZone(role);
    int index = 0;
    for (int i = 0; i < 6; ++i) {
        if (ZONE_ORDER[i] == start) index = i;
    }
    return ZONE_ORDER[(index + rotation - 1) % 6];
}

bool isFrontRowRole(int rotation, Role role) {
    return isFrontZone(zoneForRole(rotation, role));
}

Role serverRole(int rotation) {
    for (Role r : BASE_ORDER) {
        if (zoneForRole(rotation, r) == 1) return r;
    }
    return BASE_ORDER[0];
}

HitterMode hitterMode(int rotation) {
    return isFrontRowRole(rotation, Role::S) ? HitterMode::TWO_HITTER : HitterMode::THREE_HITTER;
}

Role backRowMiddle(int rotation) {
    bool mb1Back = !isFrontRowRole(rotation, Role::MB1);
    bool mb2Back = !isFrontRowRole(rotation, Role::MB2);
    if (mb1Back && !mb2Back) return Role::MB1;
    return Role::MB2;
}

Vec2 zoneAnchor(int zone) {
    switch (zone) {
        case 1: return {0.8333, 0.8333};
        case 6: return {0.5, 0.8333};
        case 5: return {0.1667, 0.8333};
        case 2: return {0.8333, 0.5833};
        case 3: return {0.5, 0.5833};
        case 4: return {0.1667, 0.5833};
        default: return {0.5, 0.5};
    }
}

RotationResponsibilities buildRotationResponsibilities(
    int rotation, const std::vector<RoleAssignment>& lineup) {
    RotationResponsibilities out;
    out.rotation = rotation;

    for (Role r : BASE_ORDER) {
        const std::string* id = findId(lineup, r);
        if (!id) continue;
        if (isFrontRowRole(rotation, r)) {
            out.frontRowPlayers.push_back(*id);
            out.eligibleAttackers.push_back(*id);
        }
        if (categoryOf(r) == RoleCategory::OUTSIDE) {
            out.primaryPassers.push_back(*id);
        }
    }

    for (Role mb : {Role::MB1, Role::MB2}) {
        const std::string* id = findId(lineup, mb);
        if (id && isFrontRowRole(rotation, mb)) {
            out.activeMiddle = *id;
            break;
        }
    }

    if (const std::string* libero = findId(lineup, Role::L)) {
        out.primaryPassers.push_back(*libero);
        out.liberoActive = true;
        out.liberoId = *libero;
        out.liberoReplaces = backRowMiddle(rotation);
    }
    return out;
}

std::string describeHitterMode(int rotation) {
    std::string r = "R" + std::to_string(rotation);
    if (hitterMode(rotation) == HitterMode::THREE_HITTER) {
        return "This is a 3-hitter rotation (" + r + ") - we have all three attack options";
    }
    return "This is a 2-hitter rotation (" + r + ") - we have " +
           std::to_string(attackerCount(rotation)) + " front-row attackers";
}

} // namespace vb
