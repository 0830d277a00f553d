#include "vb/rally_fsm.h"
#include "vb/court.h"
#include "vb/rotation.h"

namespace vb {

// --- RallyState / RallyEvent ---

bool RallyState::operator==(const RallyState& o) const {
    return phase == o.phase && serving == o.serving && touchCount == o.touchCount &&
           hasLastTouch == o.hasLastTouch && lastTouchTeam == o.lastTouchTeam &&
           possessionChain == o.possessionChain && hasLastContact == o.hasLastContact &&
           lastContact == o.lastContact && inSystem == o.inSystem &&
           homeScore == o.homeScore && awayScore == o.awayScore &&
           homeRotation == o.homeRotation && awayRotation == o.awayRotation &&
           hasResult == o.hasResult && endReason == o.endReason && winner == o.winner;
}

RallyEvent RallyEvent::startRally(TeamSide serving) {
    RallyEvent e;
    e.type = Type::START_RALLY;
    e.team = serving;
    return e;
}

RallyEvent RallyEvent::serveContact(const std::string& playerId, double timeMs) {
    RallyEvent e;
    e.type = Type::SERVE_CONTACT;
    e.playerId = playerId;
    e.contactType = ContactType::SERVE;
    e.timeMs = timeMs;
    return e;
}

RallyEvent RallyEvent::ballCrossedNet(TeamSide fromSide) {
    RallyEvent e;
    e.type = Type::BALL_CROSSED_NET;
    e.team = fromSide;
    return e;
}

RallyEvent RallyEvent::touch(TeamSide team, const std::string& playerId, ContactType type,
                             ContactQuality quality, double timeMs) {
    RallyEvent e;
    e.type = Type::TEAM_TOUCHED_BALL;
    e.team = team;
    e.playerId = playerId;
    e.contactType = type;
    e.quality = quality;
    e.timeMs = timeMs;
    return e;
}

RallyEvent RallyEvent::ballDead(RallyEndReason reason, TeamSide winner) {
    RallyEvent e;
    e.type = Type::BALL_DEAD;
    e.reason = reason;
    e.team = winner;
    return e;
}

const char* toString(RallyEvent::Type type) {
    switch (type) {
        case RallyEvent::Type::START_RALLY: return "START_RALLY";
        case RallyEvent::Type::SERVE_CONTACT: return "SERVE_CONTACT";
        case RallyEvent::Type::BALL_CROSSED_NET: return "BALL_CROSSED_NET";
        case RallyEvent::Type::TEAM_TOUCHED_BALL: return "TEAM_TOUCHED_BALL";
        case RallyEvent::Type::BALL_DEAD: return "BALL_DEAD";
    }
    return "UNKNOWN";
}

// --- Reducer ---

namespace {

// Score the point, hand the serve to the winner and rotate on a sideout
void awardPoint(RallyState& s, RallyEndReason reason, TeamSide winner) {
    bool sideout = winner != s.serving;
    if (winner == TeamSide::HOME) s.homeScore++;
    else s.awayScore++;
    if (sideout) {
        s.setRotation(winner, advanceRotation(s.rotation(winner)));
    }
    s.serving = winner;
    s.phase = RallyPhase::BALL_DEAD;
    s.hasResult = true;
    s.endReason = reason;
    s.winner = winner;
}

RallyState onServeContact(const RallyState& state, const RallyEvent& e) {
    if (state.phase != RallyPhase::PRE_SERVE) return state;

    ContactRecord serve;
    serve.type = ContactType::SERVE;
    serve.quality = ContactQuality::GOOD;
    serve.playerId = e.playerId;
    serve.team = state.serving;
    serve.timeMs = e.timeMs;

    RallyState s = state;
    s.phase = RallyPhase::SERVE_IN_AIR;
    s.touchCount = 0;
    s.hasLastTouch = true;
    s.lastTouchTeam = state.serving;
    s.possessionChain = {serve};
    s.hasLastContact = true;
    s.lastContact = serve;
    return s;
}

RallyState onBallCrossedNet(const RallyState& state) {
    RallyState s = state;
    switch (state.phase) {
        case RallyPhase::SERVE_IN_AIR:
            s.phase = RallyPhase::SERVE_RECEIVE;
            s.touchCount = 0;
            s.inSystem = true;
            return s;
        case RallyPhase::ATTACK_PHASE:
        case RallyPhase::SET_PHASE:
        case RallyPhase::TRANSITION_TO_OFFENSE:
            s.phase = RallyPhase::DEFENSE_PHASE;
            s.touchCount = 0;
            s.inSystem = false;
            return s;
        default:
            return state;
    }
}

RallyState onTouch(const RallyState& state, const RallyEvent& e) {
    if (state.phase == RallyPhase::PRE_SERVE || state.phase == RallyPhase::BALL_DEAD) {
        return state;
    }

    ContactRecord contact;
    contact.type = e.contactType;
    contact.quality = e.quality;
    contact.playerId = e.playerId;
    contact.team = e.team;
    contact.timeMs = e.timeMs;

    RallyState s = state;
    int nextTouch = (state.hasLastTouch && state.lastTouchTeam == e.team) ? state.touchCount + 1 : 1;

    s.possessionChain.push_back(contact);
    s.hasLastContact = true;
    s.lastContact = contact;
    s.touchCount = nextTouch;
    s.hasLastTouch = true;
    s.lastTouchTeam = e.team;

    if (nextTouch > 3) {
        awardPoint(s, RallyEndReason::FOUR_TOUCHES, opponent(e.team));
        return s;
    }

    if (e.quality == ContactQuality::ERROR) {
        bool longError = e.contactType == ContactType::ATTACK || e.contactType == ContactType::SERVE;
        awardPoint(s, longError ? RallyEndReason::ERROR_OUT : RallyEndReason::ERROR_NET, opponent(e.team));
        return s;
    }

    if (e.contactType == ContactType::PASS || e.contactType == ContactType::DIG) {
        s.inSystem = e.quality == ContactQuality::PERFECT || e.quality == ContactQuality::GOOD;
    }

    switch (state.phase) {
        case RallyPhase::SERVE_RECEIVE:
            if (e.contactType == ContactType::PASS && nextTouch == 1) {
                s.phase = RallyPhase::TRANSITION_TO_OFFENSE;
            }
            break;
        case RallyPhase::TRANSITION_TO_OFFENSE:
            if (e.contactType == ContactType::SET && nextTouch == 2) {
                s.phase = RallyPhase::SET_PHASE;
            }
            break;
        case RallyPhase::SET_PHASE:
            if (e.contactType == ContactType::ATTACK && nextTouch == 3) {
                s.phase = RallyPhase::ATTACK_PHASE;
            }
            break;
        case RallyPhase::DEFENSE_PHASE:
            if ((e.contactType == ContactType::DIG || e.contactType == ContactType::PASS) && nextTouch == 1) {
                s.phase = RallyPhase::TRANSITION_TO_OFFENSE;
            }
            break;
        default:
            break;
    }
    return s;
}

} // anonymous namespace

RallyState createInitialRally(TeamSide serving, int homeScore, int awayScore) {
    RallyState s;
    s.serving = serving;
    s.homeScore = homeScore;
    s.awayScore = awayScore;
    return s;
}

RallyState reduceRally(const RallyState& state, const RallyEvent& event) {
    switch (event.type) {
        case RallyEvent::Type::START_RALLY: {
            RallyState s = createInitialRally(event.team, state.homeScore, state.awayScore);
            s.homeRotation = state.homeRotation;
            s.awayRotation = state.awayRotation;
            return s;
        }
        case RallyEvent::Type::SERVE_CONTACT:
            return onServeContact(state, event);
        case RallyEvent::Type::BALL_CROSSED_NET:
            return onBallCrossedNet(state);
        case RallyEvent::Type::TEAM_TOUCHED_BALL:
            return onTouch(state, event);
        case RallyEvent::Type::BALL_DEAD: {
            if (state.phase == RallyPhase::BALL_DEAD) return state;
            RallyState s = state;
            awardPoint(s, event.reason, event.team);
            return s;
        }
    }
    return state;
}

// --- Possession queries ---

int teamContactCount(const RallyState& state, TeamSide team) {
    int count = 0;
    for (auto it = state.possessionChain.rbegin(); it != state.possessionChain.rend(); ++it) {
        if (it->team != team) break;
        count++;
    }
    return count;
}

const ContactRecord* lastContactOfType(const RallyState& state, TeamSide team, ContactType type) {
    for (auto it = state.possessionChain.rbegin(); it != state.possessionChain.rend(); ++it) {
        if (it->team == team && it->type == type) return &*it;
    }
    return nullptr;
}

RallyEvent createTouchEvent(TeamSide team, const std::string& playerId, ContactQuality quality,
                            double timeMs, int touchCount, bool isReceivingServe, bool isDefending) {
    ContactType type;
    if (touchCount == 0 || (touchCount == 1 && isReceivingServe)) {
        type = isReceivingServe ? ContactType::PASS : ContactType::DIG;
    } else if (touchCount == 1 && isDefending) {
        type = ContactType::DIG;
    } else if (touchCount == 1) {
        type = ContactType::PASS;
    } else if (touchCount == 2) {
        type = ContactType::SET;
    } else {
        type = ContactType::ATTACK;
    }
    return RallyEvent::touch(team, playerId, type, quality, timeMs);
}

// --- Contact quality ---

ContactQuality assessPassQuality(Vec2 landing, Vec2 setterPosition, TeamSide team) {
    Vec2 ideal{0.65, team == TeamSide::HOME ? 0.55 : 0.45};
    double combined = (landing.distanceTo(ideal) + landing.distanceTo(setterPosition)) / 2.0;

    if (combined < 0.08) return ContactQuality::PERFECT;
    if (combined < 0.15) return ContactQuality::GOOD;
    if (combined < 0.25) return ContactQuality::POOR;
    return ContactQuality::ERROR;
}

ContactQuality assessSetQuality(Vec2 setTarget, Vec2 hitterPosition, bool hitterApproaching) {
    bool atPin = setTarget.x < 0.25 || setTarget.x > 0.75;
    bool nearNet = std::abs(setTarget.y - 0.5) < 0.08;
    double toHitter = setTarget.distanceTo(hitterPosition);

    if (atPin && nearNet && hitterApproaching && toHitter < 0.15) return ContactQuality::PERFECT;
    if (nearNet && toHitter < 0.2) return ContactQuality::GOOD;
    if (toHitter < 0.3) return ContactQuality::POOR;
    return ContactQuality::ERROR;
}

ContactQuality assessAttackQuality(int blockersPresent, bool inBounds) {
    if (!inBounds) return ContactQuality::ERROR;
    if (blockersPresent == 0) return ContactQuality::PERFECT;
    if (blockersPresent == 1) return ContactQuality::GOOD;
    return ContactQuality::POOR;
}

// --- Termination ---

TerminationResult detectRallyTermination(bool ballLanded, Vec2 ballPosition,
                                         const RallyState& state) {
    TerminationResult r;
    if (!ballLanded) return r;
    r.terminated = true;

    TeamSide landedSide = ballPosition.y > 0.5 ? TeamSide::HOME : TeamSide::AWAY;

    if (!CourtModel::isInBounds(ballPosition)) {
        TeamSide loser = state.hasLastContact ? state.lastContact.team : state.serving;
        r.reason = RallyEndReason::ERROR_OUT;
        r.winner = opponent(loser);
        return r;
    }

    if (isServePhase(state.phase)) {
        r.reason = RallyEndReason::ACE;
        r.winner = state.serving;
        return r;
    }

    if ((state.phase == RallyPhase::ATTACK_PHASE || state.phase == RallyPhase::DEFENSE_PHASE) &&
        state.hasLastContact) {
        if (state.lastContact.type == ContactType::ATTACK) {
            r.reason = RallyEndReason::KILL;
            r.winner = state.lastContact.team;
            return r;
        }
        if (state.lastContact.type == ContactType::BLOCK) {
            r.reason = RallyEndReason::BLOCK_KILL;
            r.winner = state.lastContact.team;
            return r;
        }
    }

    r.reason = RallyEndReason::BALL_LANDED;
    r.winner = opponent(landedSide);
    return r;
}

// --- Phase flow ---

RallyPhase nextPhaseInFlow(RallyPhase phase) {
    switch (phase) {
        case RallyPhase::DEFENSE_PHASE:
        case RallyPhase::BALL_DEAD:
            return RallyPhase::PRE_SERVE;
        default:
            return static_cast<RallyPhase>(static_cast<int>(phase) + 1);
    }
}

RallyPhase previousPhaseInFlow(RallyPhase phase) {
    switch (phase) {
        case RallyPhase::PRE_SERVE: return RallyPhase::DEFENSE_PHASE;
        case RallyPhase::BALL_DEAD: return RallyPhase::DEFENSE_PHASE;
        default:
            return static_cast<RallyPhase>(static_cast<int>(phase) - 1);
    }
}

bool wouldLoopToStart(RallyPhase phase, bool forward) {
    if (forward) {
        return phase != RallyPhase::PRE_SERVE && nextPhaseInFlow(phase) == RallyPhase::PRE_SERVE;
    }
    return phase == RallyPhase::PRE_SERVE;
}

} // namespace vb
