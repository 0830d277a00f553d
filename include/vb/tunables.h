#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace vb {

enum class ReceiveFormation : uint8_t { THREE_PERSON, TWO_PERSON, FOUR_PERSON };
enum class Preset : uint8_t { BEGINNER, HIGH_SCHOOL, CLUB, COLLEGE };
enum class PlayStyle : uint8_t { CONSERVATIVE, BALANCED, AGGRESSIVE };
enum class Pace : uint8_t { SLOW, NORMAL, FAST };

// Seconds
struct TimeWindow {
    double min = 0.0;
    double max = 0.0;

    double mid() const { return (min + max) / 2.0; }
};

struct TimingWindows {
    TimeWindow serveFlight{1.0, 1.5};
    TimeWindow passToSet{0.5, 1.0};
    TimeWindow quickSet{0.3, 0.5};
    TimeWindow highSet{1.0, 1.5};
    TimeWindow outOfSystemSet{1.5, 2.0};
    TimeWindow approach{0.8, 1.2};
    TimeWindow blockReaction{0.3, 0.5};
    TimeWindow digReaction{0.2, 0.4};
};

// Skill ratings >= 0.75 use the high tier, >= 0.5 medium, otherwise low
template<typename T>
struct TierTable {
    T high;
    T medium;
    T low;

    const T& forSkill(double skill) const {
        if (skill >= 0.75) return high;
        if (skill >= 0.5) return medium;
        return low;
    }
};

struct PassVariance {
    double withinTarget = 0.0;  // probability the pass lands on target
    double radius = 0.0;        // miss radius in feet
};

struct SetVariance {
    double locationVariance = 0.0;  // feet
    double heightConsistency = 0.0;
};

struct AttackVariance {
    double inSystemKill = 0.0;
    double outOfSystemKill = 0.0;
    double errorRate = 0.0;
};

struct ServeVariance {
    double inRate = 0.0;
    double targetZone = 0.0;
    double difficulty = 0.0;
};

struct BlockVariance {
    double touch = 0.0;
    double stuff = 0.0;
    double timing = 0.0;
};

struct DigVariance {
    double positioning = 0.0;
    double reaction = 0.0;
};

struct SkillVariance {
    TierTable<PassVariance> pass{{0.8, 3.0}, {0.65, 5.0}, {0.45, 8.0}};
    TierTable<SetVariance> set{{1.5, 0.9}, {3.5, 0.7}, {5.5, 0.5}};
    TierTable<AttackVariance> attack{{0.55, 0.35, 0.08}, {0.35, 0.2, 0.15}, {0.2, 0.1, 0.25}};
    TierTable<ServeVariance> serve{{0.92, 0.7, 0.8}, {0.83, 0.4, 0.5}, {0.73, 0.2, 0.3}};
    TierTable<BlockVariance> block{{0.25, 0.08, 0.9}, {0.15, 0.04, 0.6}, {0.08, 0.01, 0.3}};
    TierTable<DigVariance> dig{{0.85, 0.9}, {0.65, 0.7}, {0.45, 0.5}};
};

// Probability of an off-speed shot by blockers faced
struct OffSpeedFrequency {
    double noBlock = 0.1;
    double singleDouble = 0.3;
    double tripleBlock = 0.7;
};

// Normalized court distances used by the condition library
struct Thresholds {
    double inSystemRadius = 0.15;
    double setterBailDistance = 0.25;
    double blockerBand = 0.08;
    double gapHalfWidth = 0.2;
    double approachRadius = 0.12;
    double highSetDistance = 0.15;
    double reachWeight = 0.01;
    double contactRadius = 0.08;
};

struct Tunables {
    ReceiveFormation formation = ReceiveFormation::THREE_PERSON;
    TimingWindows timing;
    SkillVariance skills;
    OffSpeedFrequency offSpeed;
    Thresholds thresholds;
    Preset preset = Preset::HIGH_SCHOOL;
    PlayStyle playStyle = PlayStyle::BALANCED;
    Pace pace = Pace::NORMAL;
};

inline Tunables defaultTunables() { return Tunables{}; }

void applyPreset(Tunables& t, Preset preset);
void applyPlayStyle(Tunables& t, PlayStyle style);

// Scales serve flight, pass-to-set and set windows
void applyPace(Tunables& t, Pace pace);

const char* toString(ReceiveFormation formation);
const char* toString(Preset preset);
const char* toString(PlayStyle style);
const char* toString(Pace pace);

bool parsePreset(const std::string& s, Preset& out);
bool parsePlayStyle(const std::string& s, PlayStyle& out);
bool parsePace(const std::string& s, Pace& out);

std::string tunablesToJson(const Tunables& t);

// Recognized fields override defaults, anything else is ignored.
// Malformed JSON throws nlohmann::json::parse_error.
Tunables tunablesFromJson(const std::string& json);

// nullptr if the file cannot be opened
std::unique_ptr<Tunables> loadTunables(const std::string& path);
std::unique_ptr<Tunables> loadTunablesFromString(const std::string& json);

} // namespace vb
