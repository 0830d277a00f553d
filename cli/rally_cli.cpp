#include "vb/rally_fsm.h"
#include "vb/sim_controller.h"
#include "vb/tunables.h"
#include <chrono>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <string>

using namespace vb;

namespace {

struct Options {
    int rallies = 25;
    uint32_t seed = 42;
    int maxTicks = 1200;
    int alignTicks = 30;
    std::string tunablesPath;
    std::string preset;
    std::string style;
    std::string pace;
    std::string exportPath;
    bool verbose = false;
};

void printUsage() {
    std::cout << "Usage: rally_cli [options]\n"
              << "\nOptions:\n"
              << "  --rallies=N       Number of rallies (default: 25)\n"
              << "  --seed=N          RNG seed (default: 42)\n"
              << "  --max-ticks=N     Tick limit per rally (default: 1200)\n"
              << "  --tunables=PATH   Tunables JSON file\n"
              << "  --preset=P        beginner, high_school, club, college\n"
              << "  --style=S         conservative, balanced, aggressive\n"
              << "  --pace=P          slow, normal, fast\n"
              << "  --export=PATH     Write the final world state as JSON\n"
              << "  --verbose         Print per-rally results and rally events\n"
              << "  --help            Show this help\n";
}

Options parseArgs(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.find("--rallies=") == 0) opts.rallies = std::stoi(arg.substr(10));
        else if (arg.find("--seed=") == 0) opts.seed = static_cast<uint32_t>(std::stoul(arg.substr(7)));
        else if (arg.find("--max-ticks=") == 0) opts.maxTicks = std::stoi(arg.substr(12));
        else if (arg.find("--tunables=") == 0) opts.tunablesPath = arg.substr(11);
        else if (arg.find("--preset=") == 0) opts.preset = arg.substr(9);
        else if (arg.find("--style=") == 0) opts.style = arg.substr(8);
        else if (arg.find("--pace=") == 0) opts.pace = arg.substr(7);
        else if (arg.find("--export=") == 0) opts.exportPath = arg.substr(9);
        else if (arg == "--verbose") opts.verbose = true;
        else if (arg == "--help") { printUsage(); exit(0); }
        else { std::cerr << "Unknown option: " << arg << "\n"; printUsage(); exit(1); }
    }
    return opts;
}

bool buildTunables(const Options& opts, Tunables& out) {
    if (!opts.tunablesPath.empty()) {
        std::unique_ptr<Tunables> loaded = loadTunables(opts.tunablesPath);
        if (!loaded) {
            std::cerr << "Failed to load tunables from: " << opts.tunablesPath << "\n";
            return false;
        }
        out = *loaded;
        std::cout << "Loaded tunables from " << opts.tunablesPath << "\n";
    }
    if (!opts.preset.empty()) {
        Preset p;
        if (!parsePreset(opts.preset, p)) {
            std::cerr << "Unknown preset: " << opts.preset << "\n";
            return false;
        }
        applyPreset(out, p);
    }
    if (!opts.style.empty()) {
        PlayStyle s;
        if (!parsePlayStyle(opts.style, s)) {
            std::cerr << "Unknown style: " << opts.style << "\n";
            return false;
        }
        applyPlayStyle(out, s);
    }
    if (!opts.pace.empty()) {
        Pace p;
        if (!parsePace(opts.pace, p)) {
            std::cerr << "Unknown pace: " << opts.pace << "\n";
            return false;
        }
        applyPace(out, p);
    }
    return true;
}

void printEvent(int tick, const RallyEvent& e) {
    std::cout << "  [" << tick << "] " << toString(e.type);
    switch (e.type) {
        case RallyEvent::Type::TEAM_TOUCHED_BALL:
            std::cout << " " << e.playerId << " " << toString(e.contactType)
                      << " (" << toString(e.quality) << ")";
            break;
        case RallyEvent::Type::BALL_CROSSED_NET:
            std::cout << " from " << toString(e.team);
            break;
        case RallyEvent::Type::BALL_DEAD:
            std::cout << " " << toString(e.reason) << ", point " << toString(e.team);
            break;
        default:
            break;
    }
    std::cout << "\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Options opts = parseArgs(argc, argv);

    Tunables tunables;
    if (!buildTunables(opts, tunables)) return 1;

    SimControllerConfig config;
    config.tunables = tunables;
    config.seed = opts.seed;
    SimController sim(config);

    std::cout << "Rallies: " << opts.rallies << " (seed " << opts.seed << ", preset "
              << toString(tunables.preset) << ", style " << toString(tunables.playStyle)
              << ", pace " << toString(tunables.pace) << ")\n";

    std::map<std::string, int> reasons;
    int unfinished = 0;
    long totalTicks = 0;

    auto benchStart = std::chrono::steady_clock::now();

    for (int r = 0; r < opts.rallies; ++r) {
        if (r > 0) sim.resetRally();

        // Let both sides settle into their serve formations
        for (int t = 0; t < opts.alignTicks; ++t) sim.step();
        sim.serve();

        int ticks = 0;
        while (!isRallyOver(sim.getWorld().rally) && ticks < opts.maxTicks) {
            TickResult result = sim.step();
            ++ticks;
            if (opts.verbose) {
                for (const auto& e : result.events) printEvent(result.nextWorld.tick, e);
            }
        }
        totalTicks += ticks;

        const RallyState& rally = sim.getWorld().rally;
        if (!isRallyOver(rally)) {
            ++unfinished;
            if (opts.verbose) std::cout << "Rally " << (r + 1) << ": no result after " << ticks << " ticks\n";
            continue;
        }
        reasons[toString(rally.endReason)]++;
        if (opts.verbose) {
            std::cout << "Rally " << (r + 1) << ": " << toString(rally.winner) << " ("
                      << toString(rally.endReason) << ") " << rally.homeScore << "-"
                      << rally.awayScore << ", " << ticks << " ticks\n";
        }
    }

    auto benchEnd = std::chrono::steady_clock::now();
    double totalSec = std::chrono::duration<double>(benchEnd - benchStart).count();

    std::pair<int, int> score = sim.getScore();
    std::cout << "\n=== Results ===\n";
    std::cout << "Score:      HOME " << score.first << " - " << score.second << " AWAY\n";
    std::cout << "Rotations:  HOME R" << sim.getRotation(TeamSide::HOME)
              << ", AWAY R" << sim.getRotation(TeamSide::AWAY) << "\n";
    for (const auto& kv : reasons) {
        std::cout << "  " << kv.first << ": " << kv.second << "\n";
    }
    if (unfinished > 0) std::cout << "Unfinished: " << unfinished << "\n";
    std::cout << "Avg ticks:  " << (opts.rallies > 0 ? 1.0 * totalTicks / opts.rallies : 0.0) << "\n";
    std::cout << "Time:       " << totalSec << "s\n";

    if (!opts.exportPath.empty()) {
        std::ofstream out(opts.exportPath);
        if (!out) {
            std::cerr << "Failed to write: " << opts.exportPath << "\n";
            return 1;
        }
        out << sim.exportState() << "\n";
        std::cout << "Exported state to " << opts.exportPath << "\n";
    }
    return 0;
}
