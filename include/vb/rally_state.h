#pragma once

#include "vb/enums.h"
#include <string>
#include <vector>

namespace vb {

struct ContactRecord {
    ContactType type = ContactType::PASS;
    ContactQuality quality = ContactQuality::GOOD;
    std::string playerId;
    TeamSide team = TeamSide::HOME;
    double timeMs = 0.0;

    bool operator==(const ContactRecord& o) const {
        return type == o.type && quality == o.quality && playerId == o.playerId &&
               team == o.team && timeMs == o.timeMs;
    }
};

// Rally phase slice of the world: phase, score, touches and rotations
struct RallyState {
    RallyPhase phase = RallyPhase::PRE_SERVE;
    TeamSide serving = TeamSide::HOME;

    int touchCount = 0;
    bool hasLastTouch = false;
    TeamSide lastTouchTeam = TeamSide::HOME;

    std::vector<ContactRecord> possessionChain;
    bool hasLastContact = false;
    ContactRecord lastContact;

    bool inSystem = true;

    int homeScore = 0;
    int awayScore = 0;
    int homeRotation = 1;
    int awayRotation = 1;

    bool hasResult = false;
    RallyEndReason endReason = RallyEndReason::BALL_LANDED;
    TeamSide winner = TeamSide::HOME;

    int score(TeamSide side) const {
        return side == TeamSide::HOME ? homeScore : awayScore;
    }

    int rotation(TeamSide side) const {
        return side == TeamSide::HOME ? homeRotation : awayRotation;
    }

    void setRotation(TeamSide side, int r) {
        if (side == TeamSide::HOME) homeRotation = r;
        else awayRotation = r;
    }

    // Touches the given team has taken on its current possession
    int touchesFor(TeamSide side) const {
        return hasLastTouch && lastTouchTeam == side ? touchCount : 0;
    }

    bool operator==(const RallyState& o) const;
    bool operator!=(const RallyState& o) const { return !(*this == o); }
};

struct RallyEvent {
    enum class Type : uint8_t {
        START_RALLY, SERVE_CONTACT, BALL_CROSSED_NET, TEAM_TOUCHED_BALL, BALL_DEAD
    };

    Type type = Type::START_RALLY;
    TeamSide team = TeamSide::HOME;     // serving / fromSide / toucher / winner
    std::string playerId;
    ContactType contactType = ContactType::PASS;
    ContactQuality quality = ContactQuality::GOOD;
    RallyEndReason reason = RallyEndReason::BALL_LANDED;
    double timeMs = 0.0;

    static RallyEvent startRally(TeamSide serving);
    static RallyEvent serveContact(const std::string& playerId, double timeMs = 0.0);
    static RallyEvent ballCrossedNet(TeamSide fromSide);
    static RallyEvent touch(TeamSide team, const std::string& playerId, ContactType type,
                            ContactQuality quality, double timeMs);
    static RallyEvent ballDead(RallyEndReason reason, TeamSide winner);

    bool operator==(const RallyEvent& o) const {
        return type == o.type && team == o.team && playerId == o.playerId &&
               contactType == o.contactType && quality == o.quality &&
               reason == o.reason && timeMs == o.timeMs;
    }
};

const char* toString(RallyEvent::Type type);

} // namespace vb
