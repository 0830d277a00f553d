#include "vb/serialization.h"
#include <nlohmann/json.hpp>

namespace vb {

using nlohmann::json;

namespace {

// --- Writing ---

json vecJson(Vec2 v) {
    return json::array({v.x, v.y});
}

json pairJson(const SkillPair& s) {
    return json{{"accuracy", s.accuracy}, {"consistency", s.consistency}};
}

json playerJson(const Player& p) {
    json skills{
        {"passing", pairJson(p.skills.passing)},
        {"setting", pairJson(p.skills.setting)},
        {"attacking", pairJson(p.skills.attacking)},
        {"serving", pairJson(p.skills.serving)},
        {"blocking", pairJson(p.skills.blocking)},
        {"movement", pairJson(p.skills.movement)},
    };
    json j{
        {"id", p.id},
        {"team", toString(p.team)},
        {"role", toString(p.role)},
        {"priority", p.priority},
        {"position", vecJson(p.position)},
        {"velocity", vecJson(p.velocity)},
        {"max_speed", p.maxSpeed},
        {"base_goal", toString(p.baseGoal)},
        {"override", {{"active", p.override.active}, {"goal", p.override.goal}}},
        {"active", p.active},
        {"skills", skills},
    };
    j["has_requested_goal"] = p.hasRequestedGoal;
    j["requested_goal"] = toString(p.requestedGoal);
    return j;
}

json ballJson(const BallState& b) {
    json j{
        {"position", vecJson(b.position)},
        {"velocity", vecJson(b.velocity)},
        {"predicted_landing", vecJson(b.predictedLanding)},
        {"touch_count", b.touchCount},
        {"side", toString(b.side)},
        {"in_flight", b.inFlight},
        {"crossed_net", b.crossedNet},
        {"flight_origin", vecJson(b.flightOrigin)},
    };
    j["has_last_touch"] = b.hasLastTouch;
    j["last_touch_team"] = toString(b.lastTouchTeam);
    return j;
}

json contactJson(const ContactRecord& c) {
    return json{
        {"type", toString(c.type)},
        {"quality", toString(c.quality)},
        {"player_id", c.playerId},
        {"team", toString(c.team)},
        {"time_ms", c.timeMs},
    };
}

json rallyJson(const RallyState& r) {
    json chain = json::array();
    for (const auto& c : r.possessionChain) chain.push_back(contactJson(c));

    json j{
        {"phase", toString(r.phase)},
        {"serving", toString(r.serving)},
        {"touch_count", r.touchCount},
        {"possession_chain", chain},
        {"in_system", r.inSystem},
        {"home_score", r.homeScore},
        {"away_score", r.awayScore},
        {"home_rotation", r.homeRotation},
        {"away_rotation", r.awayRotation},
    };
    j["has_last_touch"] = r.hasLastTouch;
    j["last_touch_team"] = toString(r.lastTouchTeam);
    j["has_last_contact"] = r.hasLastContact;
    j["last_contact"] = contactJson(r.lastContact);
    j["has_result"] = r.hasResult;
    j["end_reason"] = toString(r.endReason);
    j["winner"] = toString(r.winner);
    return j;
}

// --- Reading ---

template<typename T>
T readLabel(const json& j, const char* key, bool (*parse)(const std::string&, T&)) {
    std::string label = j.at(key).get<std::string>();
    T out{};
    if (!parse(label, out)) {
        throw StateFormatError(std::string("unknown value '") + label + "' for " + key);
    }
    return out;
}

Vec2 readVec(const json& j, const char* key) {
    const json& v = j.at(key);
    if (!v.is_array() || v.size() != 2) {
        throw StateFormatError(std::string("expected [x, y] for ") + key);
    }
    return {v.at(0).get<double>(), v.at(1).get<double>()};
}

SkillPair readPair(const json& j, const char* key) {
    const json& s = j.at(key);
    return {s.at("accuracy").get<double>(), s.at("consistency").get<double>()};
}

Player readPlayer(const json& j) {
    Player p;
    p.id = j.at("id").get<std::string>();
    p.team = readLabel(j, "team", parseTeamSide);
    p.role = readLabel(j, "role", parseRole);
    p.category = categoryOf(p.role);
    p.priority = j.at("priority").get<int>();
    p.position = readVec(j, "position");
    p.velocity = readVec(j, "velocity");
    p.maxSpeed = j.at("max_speed").get<double>();
    p.baseGoal = readLabel(j, "base_goal", parseGoalType);

    p.hasRequestedGoal = j.at("has_requested_goal").get<bool>();
    p.requestedGoal = readLabel(j, "requested_goal", parseGoalType);

    const json& o = j.at("override");
    p.override.active = o.at("active").get<bool>();
    p.override.goal = o.at("goal").get<std::string>();
    p.active = j.at("active").get<bool>();

    const json& s = j.at("skills");
    p.skills.passing = readPair(s, "passing");
    p.skills.setting = readPair(s, "setting");
    p.skills.attacking = readPair(s, "attacking");
    p.skills.serving = readPair(s, "serving");
    p.skills.blocking = readPair(s, "blocking");
    p.skills.movement = readPair(s, "movement");
    return p;
}

BallState readBall(const json& j) {
    BallState b;
    b.position = readVec(j, "position");
    b.velocity = readVec(j, "velocity");
    b.predictedLanding = readVec(j, "predicted_landing");
    b.touchCount = j.at("touch_count").get<int>();
    b.side = readLabel(j, "side", parseTeamSide);
    b.hasLastTouch = j.at("has_last_touch").get<bool>();
    b.lastTouchTeam = readLabel(j, "last_touch_team", parseTeamSide);
    b.inFlight = j.at("in_flight").get<bool>();
    b.crossedNet = j.at("crossed_net").get<bool>();
    b.flightOrigin = readVec(j, "flight_origin");
    return b;
}

ContactRecord readContact(const json& j) {
    ContactRecord c;
    c.type = readLabel(j, "type", parseContactType);
    c.quality = readLabel(j, "quality", parseContactQuality);
    c.playerId = j.at("player_id").get<std::string>();
    c.team = readLabel(j, "team", parseTeamSide);
    c.timeMs = j.at("time_ms").get<double>();
    return c;
}

RallyState readRally(const json& j) {
    RallyState r;
    r.phase = readLabel(j, "phase", parseRallyPhase);
    r.serving = readLabel(j, "serving", parseTeamSide);
    r.touchCount = j.at("touch_count").get<int>();
    r.hasLastTouch = j.at("has_last_touch").get<bool>();
    r.lastTouchTeam = readLabel(j, "last_touch_team", parseTeamSide);

    for (const auto& c : j.at("possession_chain")) r.possessionChain.push_back(readContact(c));
    r.hasLastContact = j.at("has_last_contact").get<bool>();
    r.lastContact = readContact(j.at("last_contact"));

    r.inSystem = j.at("in_system").get<bool>();
    r.homeScore = j.at("home_score").get<int>();
    r.awayScore = j.at("away_score").get<int>();
    r.homeRotation = j.at("home_rotation").get<int>();
    r.awayRotation = j.at("away_rotation").get<int>();
    if (!isValidRotation(r.homeRotation) || !isValidRotation(r.awayRotation)) {
        throw StateFormatError("rotation out of range");
    }

    r.hasResult = j.at("has_result").get<bool>();
    r.endReason = readLabel(j, "end_reason", parseRallyEndReason);
    r.winner = readLabel(j, "winner", parseTeamSide);
    return r;
}

} // anonymous namespace

std::string serializeWorldState(const WorldState& world) {
    json players = json::array();
    for (const auto& p : world.players) players.push_back(playerJson(p));

    const CourtModel& c = world.court;
    json j{
        {"version", 1},
        {"tick", world.tick},
        {"time_ms", world.timeMs},
        {"court", {
            {"bounds_min", vecJson(c.boundsMin)},
            {"bounds_max", vecJson(c.boundsMax)},
            {"net_y", c.netY},
            {"attack_line_offset", c.attackLineOffset},
        }},
        {"players", players},
        {"ball", ballJson(world.ball)},
        {"rally", rallyJson(world.rally)},
    };
    return j.dump();
}

WorldState deserializeWorldState(const std::string& text) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) throw StateFormatError("world state must be an object");

        WorldState world;
        world.tick = j.at("tick").get<int>();
        world.timeMs = j.at("time_ms").get<double>();

        const json& c = j.at("court");
        world.court.boundsMin = readVec(c, "bounds_min");
        world.court.boundsMax = readVec(c, "bounds_max");
        world.court.netY = c.at("net_y").get<double>();
        world.court.attackLineOffset = c.at("attack_line_offset").get<double>();

        for (const auto& p : j.at("players")) world.players.push_back(readPlayer(p));
        world.ball = readBall(j.at("ball"));
        world.rally = readRally(j.at("rally"));
        return world;
    } catch (const json::exception& e) {
        throw StateFormatError(std::string("invalid world state: ") + e.what());
    }
}

} // namespace vb
