#include "vb/world_state.h"
#include "vb/rally_fsm.h"
#include <stdexcept>

namespace vb {

// --- Player lookup ---

Player& WorldState::getPlayer(const std::string& id) {
    Player* p = findPlayer(id);
    if (!p) {
        throw std::out_of_range("Unknown player id: " + id);
    }
    return *p;
}

const Player& WorldState::getPlayer(const std::string& id) const {
    const Player* p = findPlayer(id);
    if (!p) {
        throw std::out_of_range("Unknown player id: " + id);
    }
    return *p;
}

Player* WorldState::findPlayer(const std::string& id) {
    for (auto& p : players) {
        if (p.id == id) return &p;
    }
    return nullptr;
}

const Player* WorldState::findPlayer(const std::string& id) const {
    for (const auto& p : players) {
        if (p.id == id) return &p;
    }
    return nullptr;
}

std::vector<Player> WorldState::teamPlayers(TeamSide side) const {
    std::vector<Player> out;
    for (const auto& p : players) {
        if (p.team == side) out.push_back(p);
    }
    return out;
}

std::vector<Player> WorldState::activePlayers() const {
    std::vector<Player> out;
    for (const auto& p : players) {
        if (p.active) out.push_back(p);
    }
    return out;
}

bool WorldState::operator==(const WorldState& o) const {
    return tick == o.tick && timeMs == o.timeMs && court == o.court &&
           players == o.players && ball == o.ball && rally == o.rally;
}

// --- Lineup ---

namespace {

Player* findRole(std::vector<Player>& players, TeamSide team, Role role) {
    for (auto& p : players) {
        if (p.team == team && p.role == role) return &p;
    }
    return nullptr;
}

// Swap the libero in for the back-row middle. The middle returning to the
// front row takes the libero's spot and the libero takes the outgoing middle's spot.
void substituteLibero(std::vector<Player>& players, TeamSide team, int rotation) {
    Player* libero = findRole(players, team, Role::L);
    if (!libero) return;

    Role outRole = backRowMiddle(rotation);
    Role inRole = outRole == Role::MB1 ? Role::MB2 : Role::MB1;
    Player* outgoing = findRole(players, team, outRole);
    Player* incoming = findRole(players, team, inRole);

    if (outgoing && outgoing->active) {
        if (incoming && !incoming->active) {
            incoming->position = libero->position;
            incoming->velocity = {};
            incoming->active = true;
        }
        libero->position = outgoing->position;
        libero->velocity = {};
        outgoing->active = false;
        outgoing->velocity = {};
    } else if (incoming) {
        incoming->active = true;
    }
    libero->active = true;
}

} // anonymous namespace

std::vector<Player> createDefaultPlayers(int homeRotation, int awayRotation,
                                         const PlayerLayout& layout, bool useLibero) {
    CourtModel court;
    std::vector<Player> players;

    for (TeamSide team : {TeamSide::HOME, TeamSide::AWAY}) {
        int rotation = team == TeamSide::HOME ? homeRotation : awayRotation;

        for (Role role : BASE_ORDER) {
            std::string id = playerIdFor(team, role);
            Vec2 pos = court.forTeam(team, zoneAnchor(zoneForRole(rotation, role)));
            auto it = layout.find(id);
            if (it != layout.end()) pos = it->second;
            players.push_back(makePlayer(id, team, role, pos));
        }

        if (useLibero) {
            std::string id = playerIdFor(team, Role::L);
            Vec2 pos = court.forTeam(team, zoneAnchor(zoneForRole(rotation, Role::L)));
            players.push_back(makePlayer(id, team, Role::L, pos));
            substituteLibero(players, team, rotation);
            auto it = layout.find(id);
            if (it != layout.end()) players.back().position = it->second;
        }
    }
    return players;
}

WorldState createWorldState(const WorldConfig& config) {
    if (!isValidRotation(config.homeRotation) || !isValidRotation(config.awayRotation)) {
        throw std::invalid_argument("Rotation must be 1-6");
    }

    WorldState world;
    world.court = config.court;
    world.players = config.players.empty()
        ? createDefaultPlayers(config.homeRotation, config.awayRotation,
                               config.layout, config.useLibero)
        : config.players;
    world.ball = BallState::atServe(config.serving);
    world.rally = createInitialRally(config.serving);
    world.rally.homeRotation = config.homeRotation;
    world.rally.awayRotation = config.awayRotation;
    return world;
}

void applyLiberoSubstitution(WorldState& world, TeamSide team) {
    substituteLibero(world.players, team, world.rally.rotation(team));
}

std::vector<RoleAssignment> lineupFor(const WorldState& world, TeamSide team) {
    std::vector<RoleAssignment> out;
    for (const auto& p : world.players) {
        if (p.team == team) out.push_back({p.role, p.id});
    }
    return out;
}

} // namespace vb
