#include "vb/tunables.h"
#include <nlohmann/json.hpp>
#include <fstream>

namespace vb {

// --- Presets and modifiers ---

void applyPreset(Tunables& t, Preset preset) {
    t.preset = preset;
    switch (preset) {
        case Preset::BEGINNER:
            t.offSpeed = {0.2, 0.5, 0.8};
            break;
        case Preset::HIGH_SCHOOL:
            t.offSpeed = OffSpeedFrequency{};
            break;
        case Preset::CLUB:
        case Preset::COLLEGE:
            break;
    }
}

void applyPlayStyle(Tunables& t, PlayStyle style) {
    t.playStyle = style;
    switch (style) {
        case PlayStyle::CONSERVATIVE:
            t.offSpeed = {0.15, 0.4, 0.8};
            break;
        case PlayStyle::BALANCED:
            break;
        case PlayStyle::AGGRESSIVE:
            t.offSpeed = {0.05, 0.2, 0.6};
            break;
    }
}

void applyPace(Tunables& t, Pace pace) {
    t.pace = pace;
    double k = 1.0;
    if (pace == Pace::SLOW) k = 1.2;
    else if (pace == Pace::FAST) k = 0.85;
    if (k == 1.0) return;

    for (TimeWindow* w : {&t.timing.serveFlight, &t.timing.passToSet, &t.timing.quickSet,
                          &t.timing.highSet, &t.timing.outOfSystemSet}) {
        w->min *= k;
        w->max *= k;
    }
}

// --- Labels ---

namespace {

const char* const FORMATION_NAMES[] = {"3-person", "2-person", "4-person"};
const char* const PRESET_NAMES[] = {"beginner", "high_school", "club", "college"};
const char* const STYLE_NAMES[] = {"conservative", "balanced", "aggressive"};
const char* const PACE_NAMES[] = {"slow", "normal", "fast"};

template<typename E, size_t N>
bool parseLabel(const std::string& s, const char* const (&names)[N], E& out) {
    for (size_t i = 0; i < N; ++i) {
        if (s == names[i]) {
            out = static_cast<E>(i);
            return true;
        }
    }
    return false;
}

} // anonymous namespace

const char* toString(ReceiveFormation formation) { return FORMATION_NAMES[static_cast<int>(formation)]; }
const char* toString(Preset preset) { return PRESET_NAMES[static_cast<int>(preset)]; }
const char* toString(PlayStyle style) { return STYLE_NAMES[static_cast<int>(style)]; }
const char* toString(Pace pace) { return PACE_NAMES[static_cast<int>(pace)]; }

bool parsePreset(const std::string& s, Preset& out) { return parseLabel(s, PRESET_NAMES, out); }
bool parsePlayStyle(const std::string& s, PlayStyle& out) { return parseLabel(s, STYLE_NAMES, out); }
bool parsePace(const std::string& s, Pace& out) { return parseLabel(s, PACE_NAMES, out); }

// --- JSON ---

namespace {

using nlohmann::json;

json windowJson(const TimeWindow& w) {
    return {{"min", w.min}, {"max", w.max}};
}

template<typename T, typename F>
json tierJson(const TierTable<T>& table, F&& fields) {
    return {{"high", fields(table.high)}, {"medium", fields(table.medium)}, {"low", fields(table.low)}};
}

void readNumber(const json& j, const char* key, double& out) {
    if (j.is_object() && j.contains(key) && j[key].is_number()) {
        out = j[key].get<double>();
    }
}

void readWindow(const json& j, const char* key, TimeWindow& out) {
    if (!j.is_object() || !j.contains(key)) return;
    readNumber(j[key], "min", out.min);
    readNumber(j[key], "max", out.max);
}

template<typename T, typename F>
void readTier(const json& j, const char* key, TierTable<T>& table, F&& fields) {
    if (!j.is_object() || !j.contains(key)) return;
    const json& t = j[key];
    if (t.contains("high")) fields(t["high"], table.high);
    if (t.contains("medium")) fields(t["medium"], table.medium);
    if (t.contains("low")) fields(t["low"], table.low);
}

json toJson(const Tunables& t) {
    json j;
    j["formation"] = toString(t.formation);
    j["preset"] = toString(t.preset);
    j["play_style"] = toString(t.playStyle);
    j["pace"] = toString(t.pace);

    const auto& tw = t.timing;
    j["timing"] = {
        {"serve_flight", windowJson(tw.serveFlight)},
        {"pass_to_set", windowJson(tw.passToSet)},
        {"quick_set", windowJson(tw.quickSet)},
        {"high_set", windowJson(tw.highSet)},
        {"out_of_system_set", windowJson(tw.outOfSystemSet)},
        {"approach", windowJson(tw.approach)},
        {"block_reaction", windowJson(tw.blockReaction)},
        {"dig_reaction", windowJson(tw.digReaction)},
    };

    const auto& sv = t.skills;
    j["skills"] = {
        {"pass", tierJson(sv.pass, [](const PassVariance& v) {
            return json{{"within_target", v.withinTarget}, {"radius", v.radius}};
        })},
        {"set", tierJson(sv.set, [](const SetVariance& v) {
            return json{{"location_variance", v.locationVariance},
                        {"height_consistency", v.heightConsistency}};
        })},
        {"attack", tierJson(sv.attack, [](const AttackVariance& v) {
            return json{{"in_system_kill", v.inSystemKill},
                        {"out_of_system_kill", v.outOfSystemKill},
                        {"error_rate", v.errorRate}};
        })},
        {"serve", tierJson(sv.serve, [](const ServeVariance& v) {
            return json{{"in_rate", v.inRate}, {"target_zone", v.targetZone},
                        {"difficulty", v.difficulty}};
        })},
        {"block", tierJson(sv.block, [](const BlockVariance& v) {
            return json{{"touch", v.touch}, {"stuff", v.stuff}, {"timing", v.timing}};
        })},
        {"dig", tierJson(sv.dig, [](const DigVariance& v) {
            return json{{"positioning", v.positioning}, {"reaction", v.reaction}};
        })},
    };

    j["off_speed"] = {
        {"no_block", t.offSpeed.noBlock},
        {"single_double", t.offSpeed.singleDouble},
        {"triple_block", t.offSpeed.tripleBlock},
    };

    const auto& th = t.thresholds;
    j["thresholds"] = {
        {"in_system_radius", th.inSystemRadius},
        {"setter_bail_distance", th.setterBailDistance},
        {"blocker_band", th.blockerBand},
        {"gap_half_width", th.gapHalfWidth},
        {"approach_radius", th.approachRadius},
        {"high_set_distance", th.highSetDistance},
        {"reach_weight", th.reachWeight},
        {"contact_radius", th.contactRadius},
    };
    return j;
}

void readLabel(const json& j, const char* key, std::string& out) {
    if (j.contains(key) && j[key].is_string()) out = j[key].get<std::string>();
}

Tunables fromJson(const json& j) {
    Tunables t;
    if (!j.is_object()) return t;

    std::string label;
    readLabel(j, "formation", label);
    parseLabel(label, FORMATION_NAMES, t.formation);
    label.clear();
    readLabel(j, "preset", label);
    parsePreset(label, t.preset);
    label.clear();
    readLabel(j, "play_style", label);
    parsePlayStyle(label, t.playStyle);
    label.clear();
    readLabel(j, "pace", label);
    parsePace(label, t.pace);

    if (j.contains("timing")) {
        const json& tj = j["timing"];
        auto& tw = t.timing;
        readWindow(tj, "serve_flight", tw.serveFlight);
        readWindow(tj, "pass_to_set", tw.passToSet);
        readWindow(tj, "quick_set", tw.quickSet);
        readWindow(tj, "high_set", tw.highSet);
        readWindow(tj, "out_of_system_set", tw.outOfSystemSet);
        readWindow(tj, "approach", tw.approach);
        readWindow(tj, "block_reaction", tw.blockReaction);
        readWindow(tj, "dig_reaction", tw.digReaction);
    }

    if (j.contains("skills")) {
        const json& sj = j["skills"];
        auto& sv = t.skills;
        readTier(sj, "pass", sv.pass, [](const json& v, PassVariance& out) {
            readNumber(v, "within_target", out.withinTarget);
            readNumber(v, "radius", out.radius);
        });
        readTier(sj, "set", sv.set, [](const json& v, SetVariance& out) {
            readNumber(v, "location_variance", out.locationVariance);
            readNumber(v, "height_consistency", out.heightConsistency);
        });
        readTier(sj, "attack", sv.attack, [](const json& v, AttackVariance& out) {
            readNumber(v, "in_system_kill", out.inSystemKill);
            readNumber(v, "out_of_system_kill", out.outOfSystemKill);
            readNumber(v, "error_rate", out.errorRate);
        });
        readTier(sj, "serve", sv.serve, [](const json& v, ServeVariance& out) {
            readNumber(v, "in_rate", out.inRate);
            readNumber(v, "target_zone", out.targetZone);
            readNumber(v, "difficulty", out.difficulty);
        });
        readTier(sj, "block", sv.block, [](const json& v, BlockVariance& out) {
            readNumber(v, "touch", out.touch);
            readNumber(v, "stuff", out.stuff);
            readNumber(v, "timing", out.timing);
        });
        readTier(sj, "dig", sv.dig, [](const json& v, DigVariance& out) {
            readNumber(v, "positioning", out.positioning);
            readNumber(v, "reaction", out.reaction);
        });
    }

    if (j.contains("off_speed")) {
        const json& oj = j["off_speed"];
        readNumber(oj, "no_block", t.offSpeed.noBlock);
        readNumber(oj, "single_double", t.offSpeed.singleDouble);
        readNumber(oj, "triple_block", t.offSpeed.tripleBlock);
    }

    if (j.contains("thresholds")) {
        const json& hj = j["thresholds"];
        auto& th = t.thresholds;
        readNumber(hj, "in_system_radius", th.inSystemRadius);
        readNumber(hj, "setter_bail_distance", th.setterBailDistance);
        readNumber(hj, "blocker_band", th.blockerBand);
        readNumber(hj, "gap_half_width", th.gapHalfWidth);
        readNumber(hj, "approach_radius", th.approachRadius);
        readNumber(hj, "high_set_distance", th.highSetDistance);
        readNumber(hj, "reach_weight", th.reachWeight);
        readNumber(hj, "contact_radius", th.contactRadius);
    }
    return t;
}

} // anonymous namespace

std::string tunablesToJson(const Tunables& t) {
    return toJson(t).dump(2);
}

Tunables tunablesFromJson(const std::string& json) {
    return fromJson(nlohmann::json::parse(json));
}

std::unique_ptr<Tunables> loadTunables(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return nullptr;
    nlohmann::json j = nlohmann::json::parse(file);
    return std::make_unique<Tunables>(fromJson(j));
}

std::unique_ptr<Tunables> loadTunablesFromString(const std::string& json) {
    return std::make_unique<Tunables>(tunablesFromJson(json));
}

} // namespace vb
