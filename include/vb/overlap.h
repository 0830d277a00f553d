#pragma once

#include <string>
#include <vector>

namespace vb {

// Zone layout from the team's own perspective:
//   4 --- 3 --- 2   (front row)
//   5 --- 6 --- 1   (back row)

enum class ZoneRelationType { T, L };
enum class OverlapRelation { ADJACENT, DIAGONAL, NONE };

// (1,4), (2,5), (3,6): no overlap constraint between them
bool isDiagonalPair(int zone1, int zone2);

// Middle zones (3, 6) form a T with three neighbours, corners an L with two
ZoneRelationType zoneRelationType(int zone);

const std::vector<int>& adjacentZones(int zone);

OverlapRelation overlapRelation(int zone1, int zone2);

inline bool hasOverlapConstraint(int zone1, int zone2) {
    return overlapRelation(zone1, zone2) == OverlapRelation::ADJACENT;
}

// Empty string when there is nothing to say
std::string describeOverlapRelation(int selfZone, int otherZone, const std::string& otherRoleName);
std::string constraintDescription(int selfZone, int otherZone, const std::string& otherRoleName);

} // namespace vb
