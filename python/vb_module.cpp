#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>

#include "vb/enums.h"
#include "vb/vec2.h"
#include "vb/player.h"
#include "vb/ball_state.h"
#include "vb/rally_state.h"
#include "vb/world_state.h"
#include "vb/intent.h"
#include "vb/decision_trace.h"
#include "vb/tunables.h"
#include "vb/tick.h"
#include "vb/serialization.h"
#include "vb/sim_controller.h"

namespace py = pybind11;

PYBIND11_MODULE(vb_engine, m) {
    m.doc() = "Volleyball rally simulation engine - Python bindings";

    // --- Enums ---
    py::enum_<vb::TeamSide>(m, "TeamSide")
        .value("HOME", vb::TeamSide::HOME)
        .value("AWAY", vb::TeamSide::AWAY);

    py::enum_<vb::Role>(m, "Role")
        .value("S", vb::Role::S)
        .value("OH1", vb::Role::OH1)
        .value("OH2", vb::Role::OH2)
        .value("MB1", vb::Role::MB1)
        .value("MB2", vb::Role::MB2)
        .value("OPP", vb::Role::OPP)
        .value("L", vb::Role::L);

    py::enum_<vb::RoleCategory>(m, "RoleCategory")
        .value("SETTER", vb::RoleCategory::SETTER)
        .value("OUTSIDE", vb::RoleCategory::OUTSIDE)
        .value("MIDDLE", vb::RoleCategory::MIDDLE)
        .value("OPPOSITE", vb::RoleCategory::OPPOSITE)
        .value("LIBERO", vb::RoleCategory::LIBERO);

    py::enum_<vb::RallyPhase>(m, "RallyPhase")
        .value("PRE_SERVE", vb::RallyPhase::PRE_SERVE)
        .value("SERVE_IN_AIR", vb::RallyPhase::SERVE_IN_AIR)
        .value("SERVE_RECEIVE", vb::RallyPhase::SERVE_RECEIVE)
        .value("TRANSITION_TO_OFFENSE", vb::RallyPhase::TRANSITION_TO_OFFENSE)
        .value("SET_PHASE", vb::RallyPhase::SET_PHASE)
        .value("ATTACK_PHASE", vb::RallyPhase::ATTACK_PHASE)
        .value("TRANSITION_TO_DEFENSE", vb::RallyPhase::TRANSITION_TO_DEFENSE)
        .value("DEFENSE_PHASE", vb::RallyPhase::DEFENSE_PHASE)
        .value("BALL_DEAD", vb::RallyPhase::BALL_DEAD);

    py::enum_<vb::RallyEndReason>(m, "RallyEndReason")
        .value("ACE", vb::RallyEndReason::ACE)
        .value("KILL", vb::RallyEndReason::KILL)
        .value("BLOCK_KILL", vb::RallyEndReason::BLOCK_KILL)
        .value("ERROR_NET", vb::RallyEndReason::ERROR_NET)
        .value("ERROR_OUT", vb::RallyEndReason::ERROR_OUT)
        .value("FOUR_TOUCHES", vb::RallyEndReason::FOUR_TOUCHES)
        .value("DOUBLE_HIT", vb::RallyEndReason::DOUBLE_HIT)
        .value("BALL_LANDED", vb::RallyEndReason::BALL_LANDED);

    py::enum_<vb::IntentSource>(m, "IntentSource")
        .value("AI", vb::IntentSource::AI)
        .value("HUMAN", vb::IntentSource::HUMAN)
        .value("OVERRIDE", vb::IntentSource::OVERRIDE);

    // Goals travel as labels: the vocabulary is large and shared with overrides
    m.def("goal_names", []() {
        std::vector<std::string> names;
        for (int i = 0; i < vb::NUM_GOAL_TYPES; ++i) {
            names.push_back(vb::toString(static_cast<vb::GoalType>(i)));
        }
        return names;
    });

    // --- Vec2 ---
    py::class_<vb::Vec2>(m, "Vec2")
        .def(py::init<>())
        .def(py::init([](double x, double y) { return vb::Vec2{x, y}; }))
        .def_readwrite("x", &vb::Vec2::x)
        .def_readwrite("y", &vb::Vec2::y)
        .def("distance_to", &vb::Vec2::distanceTo)
        .def("__repr__", [](const vb::Vec2& v) {
            return "Vec2(" + std::to_string(v.x) + ", " + std::to_string(v.y) + ")";
        })
        .def("__eq__", [](const vb::Vec2& a, const vb::Vec2& b) { return a == b; });

    // --- Player ---
    py::class_<vb::Player>(m, "Player")
        .def_readonly("id", &vb::Player::id)
        .def_readonly("team", &vb::Player::team)
        .def_readonly("role", &vb::Player::role)
        .def_readonly("category", &vb::Player::category)
        .def_readonly("priority", &vb::Player::priority)
        .def_readonly("position", &vb::Player::position)
        .def_readonly("velocity", &vb::Player::velocity)
        .def_readonly("active", &vb::Player::active)
        .def_property_readonly("current_goal", [](const vb::Player& p) {
            return std::string(vb::toString(p.currentGoal()));
        });

    // --- BallState ---
    py::class_<vb::BallState>(m, "BallState")
        .def_readonly("position", &vb::BallState::position)
        .def_readonly("velocity", &vb::BallState::velocity)
        .def_readonly("predicted_landing", &vb::BallState::predictedLanding)
        .def_readonly("touch_count", &vb::BallState::touchCount)
        .def_readonly("side", &vb::BallState::side)
        .def_readonly("in_flight", &vb::BallState::inFlight);

    // --- RallyState ---
    py::class_<vb::RallyState>(m, "RallyState")
        .def_readonly("phase", &vb::RallyState::phase)
        .def_readonly("serving", &vb::RallyState::serving)
        .def_readonly("touch_count", &vb::RallyState::touchCount)
        .def_readonly("home_score", &vb::RallyState::homeScore)
        .def_readonly("away_score", &vb::RallyState::awayScore)
        .def_readonly("home_rotation", &vb::RallyState::homeRotation)
        .def_readonly("away_rotation", &vb::RallyState::awayRotation)
        .def_readonly("has_result", &vb::RallyState::hasResult)
        .def_readonly("end_reason", &vb::RallyState::endReason)
        .def_readonly("winner", &vb::RallyState::winner);

    // --- WorldState ---
    py::class_<vb::WorldState>(m, "WorldState")
        .def_readonly("tick", &vb::WorldState::tick)
        .def_readonly("time_ms", &vb::WorldState::timeMs)
        .def_readonly("players", &vb::WorldState::players)
        .def_readonly("ball", &vb::WorldState::ball)
        .def_readonly("rally", &vb::WorldState::rally)
        .def("get_player", [](const vb::WorldState& w, const std::string& id) {
            return w.getPlayer(id);
        })
        .def("to_json", &vb::serializeWorldState)
        .def("__eq__", [](const vb::WorldState& a, const vb::WorldState& b) { return a == b; });

    // --- Intent ---
    py::class_<vb::Intent>(m, "Intent")
        .def_readonly("id", &vb::Intent::id)
        .def_readonly("actor", &vb::Intent::actor)
        .def_readonly("rationale", &vb::Intent::rationale)
        .def_readonly("source", &vb::Intent::source)
        .def_readonly("confidence", &vb::Intent::confidence)
        .def_property_readonly("goal", [](const vb::Intent& i) {
            return std::string(vb::toString(i.goal));
        })
        .def_property_readonly("reason", [](const vb::Intent& i) {
            return std::string(vb::toString(i.reason));
        });

    // --- DecisionTrace ---
    py::class_<vb::DecisionTrace>(m, "DecisionTrace")
        .def_readonly("player_id", &vb::DecisionTrace::playerId)
        .def_readonly("tick", &vb::DecisionTrace::tick)
        .def_readonly("phase", &vb::DecisionTrace::phase)
        .def_readonly("has_selected_intent", &vb::DecisionTrace::hasSelectedIntent)
        .def_readonly("selected_intent", &vb::DecisionTrace::selectedIntent)
        .def("summary", [](const vb::DecisionTrace& t) { return vb::summarizeTrace(t.root); })
        .def("depth", [](const vb::DecisionTrace& t) { return vb::traceDepth(t.root); });

    // --- TickResult ---
    py::class_<vb::TickResult>(m, "TickResult")
        .def_readonly("next_world", &vb::TickResult::nextWorld)
        .def_readonly("intents", &vb::TickResult::intents)
        .def_readonly("traces", &vb::TickResult::traces);

    py::class_<vb::SimulateResult>(m, "SimulateResult")
        .def_readonly("final_world", &vb::SimulateResult::finalWorld)
        .def_readonly("ticks_run", &vb::SimulateResult::ticksRun);

    // --- Tunables ---
    py::class_<vb::Tunables>(m, "Tunables")
        .def(py::init<>())
        .def("to_json", &vb::tunablesToJson)
        .def_static("from_json", &vb::tunablesFromJson)
        .def("apply_preset", [](vb::Tunables& t, const std::string& label) {
            vb::Preset p;
            if (!vb::parsePreset(label, p)) throw py::value_error("unknown preset: " + label);
            vb::applyPreset(t, p);
        })
        .def("apply_style", [](vb::Tunables& t, const std::string& label) {
            vb::PlayStyle s;
            if (!vb::parsePlayStyle(label, s)) throw py::value_error("unknown style: " + label);
            vb::applyPlayStyle(t, s);
        })
        .def("apply_pace", [](vb::Tunables& t, const std::string& label) {
            vb::Pace p;
            if (!vb::parsePace(label, p)) throw py::value_error("unknown pace: " + label);
            vb::applyPace(t, p);
        });

    // --- Snapshot ---
    py::class_<vb::Snapshot>(m, "Snapshot")
        .def_readonly("id", &vb::Snapshot::id)
        .def_readonly("timestamp", &vb::Snapshot::timestamp)
        .def_readonly("label", &vb::Snapshot::label)
        .def_readonly("world", &vb::Snapshot::world)
        .def_readonly("rng_state", &vb::Snapshot::rngState);

    py::register_exception<vb::StateFormatError>(m, "StateFormatError");

    // --- SimController ---
    py::class_<vb::SimController>(m, "SimController")
        .def(py::init([](uint32_t seed, int homeRotation, int awayRotation,
                         vb::TeamSide serving, bool useLibero) {
            vb::SimControllerConfig config;
            config.seed = seed;
            config.world.homeRotation = homeRotation;
            config.world.awayRotation = awayRotation;
            config.world.serving = serving;
            config.world.useLibero = useLibero;
            return new vb::SimController(config);
        }), py::arg("seed") = 42, py::arg("home_rotation") = 1, py::arg("away_rotation") = 1,
            py::arg("serving") = vb::TeamSide::HOME, py::arg("use_libero") = true)
        .def("pause", &vb::SimController::pause)
        .def("resume", &vb::SimController::resume)
        .def("toggle_pause", &vb::SimController::togglePause)
        .def("is_paused", &vb::SimController::isPaused)
        .def("step", [](vb::SimController& s, bool commit) {
            vb::StepOptions options;
            options.commit = commit;
            return s.step(options);
        }, py::arg("commit") = true)
        .def("dry_run", [](const vb::SimController& s) { return s.dryRun(); })
        .def("simulate_until_rally_over", [](vb::SimController& s, int maxTicks) {
            return s.simulateUntil([](const vb::WorldState& w) {
                return w.rally.phase == vb::RallyPhase::BALL_DEAD;
            }, maxTicks);
        }, py::arg("max_ticks") = 1000)
        .def("serve", &vb::SimController::serve)
        .def("reset_rally", [](vb::SimController& s) { s.resetRally(); })
        .def("reset", &vb::SimController::reset)
        .def("move_player", &vb::SimController::movePlayer)
        .def("set_player_goal", [](vb::SimController& s, const std::string& id,
                                   const std::string& goal) {
            s.setPlayerGoal(id, goal);
        })
        .def("clear_player_goal", &vb::SimController::clearPlayerGoal)
        .def("set_ball_position", &vb::SimController::setBallPosition)
        .def("set_rotation", &vb::SimController::setRotation)
        .def("create_snapshot", &vb::SimController::createSnapshot, py::arg("label") = "")
        .def("restore_snapshot", [](vb::SimController& s, const std::string& id) {
            return s.restoreSnapshot(id);
        })
        .def("get_snapshots", &vb::SimController::getSnapshots)
        .def("clear_snapshots", &vb::SimController::clearSnapshots)
        .def("export_state", &vb::SimController::exportState)
        .def("import_state", &vb::SimController::importState)
        .def("get_world", &vb::SimController::getWorld)
        .def("get_phase", &vb::SimController::getPhase)
        .def("get_score", &vb::SimController::getScore)
        .def("get_rotation", &vb::SimController::getRotation);
}
