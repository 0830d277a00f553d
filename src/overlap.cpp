#include "vb/overlap.h"
#include "vb/rotation.h"
#include <algorithm>

namespace vb {

namespace {

const std::vector<std::vector<int>> ADJACENT = {
    {},         // unused
    {2, 6},     // 1: back right
    {1, 3},     // 2: front right
    {2, 4, 6},  // 3: front center
    {3, 5},     // 4: front left
    {4, 6},     // 5: back left
    {1, 3, 5},  // 6: back center
};

const std::vector<int> NO_ZONES;

bool contains(const std::vector<int>& v, int x) {
    return std::find(v.begin(), v.end(), x) != v.end();
}

// Same-row ordering, left to right from the team's perspective
bool isLeftOf(int selfZone, int otherZone) {
    switch (selfZone) {
        case 4: return otherZone == 3 || otherZone == 2;
        case 3: return otherZone == 2;
        case 5: return otherZone == 6 || otherZone == 1;
        case 6: return otherZone == 1;
        default: return false;
    }
}

} // anonymous namespace

bool isDiagonalPair(int zone1, int zone2) {
    int lo = std::min(zone1, zone2);
    int hi = std::max(zone1, zone2);
    return (lo == 1 && hi == 4) || (lo == 2 && hi == 5) || (lo == 3 && hi == 6);
}

ZoneRelationType zoneRelationType(int zone) {
    return (zone == 3 || zone == 6) ? ZoneRelationType::T : ZoneRelationType::L;
}

const std::vector<int>& adjacentZones(int zone) {
    if (zone < 1 || zone > 6) return NO_ZONES;
    return ADJACENT[zone];
}

OverlapRelation overlapRelation(int zone1, int zone2) {
    if (zone1 == zone2) return OverlapRelation::NONE;
    if (isDiagonalPair(zone1, zone2)) return OverlapRelation::DIAGONAL;
    if (contains(adjacentZones(zone1), zone2)) return OverlapRelation::ADJACENT;
    return OverlapRelation::NONE;
}

std::string describeOverlapRelation(int selfZone, int otherZone, const std::string& otherRoleName) {
    switch (overlapRelation(selfZone, otherZone)) {
        case OverlapRelation::DIAGONAL:
            return "diagonal to the " + otherRoleName + " - I can position freely";
        case OverlapRelation::ADJACENT: {
            const char* type = zoneRelationType(selfZone) == ZoneRelationType::T ? "T" : "L";
            return std::string("in an ") + type + " relationship with the " + otherRoleName;
        }
        case OverlapRelation::NONE:
            break;
    }
    return "";
}

std::string constraintDescription(int selfZone, int otherZone, const std::string& otherRoleName) {
    if (!hasOverlapConstraint(selfZone, otherZone)) return "";

    bool selfFront = isFrontZone(selfZone);
    bool otherFront = isFrontZone(otherZone);

    if (selfFront == otherFront) {
        if (isLeftOf(selfZone, otherZone)) {
            return "I need to stay left of the " + otherRoleName;
        }
        return "I need to stay right of the " + otherRoleName;
    }
    if (selfFront) {
        return "I need to stay in front of the " + otherRoleName;
    }
    return "I need to stay behind the " + otherRoleName;
}

} // namespace vb
