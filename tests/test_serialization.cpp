#include <gtest/gtest.h>
#include "vb/ball_handler.h"
#include "vb/random_source.h"
#include "vb/serialization.h"
#include "vb/tick.h"
#include "vb/tunables.h"
#include <nlohmann/json.hpp>
#include <functional>

using namespace vb;
using nlohmann::json;

namespace {

std::string edited(const WorldState& world, const std::function<void(json&)>& edit) {
    json j = json::parse(serializeWorldState(world));
    edit(j);
    return j.dump();
}

} // anonymous namespace

TEST(Serialization, RoundTripFreshWorld) {
    WorldState world = createWorldState();
    WorldState back = deserializeWorldState(serializeWorldState(world));
    EXPECT_EQ(back, world);
}

TEST(Serialization, RoundTripMidRally) {
    WorldConfig config;
    config.homeRotation = 4;
    config.awayRotation = 2;
    config.serving = TeamSide::AWAY;
    WorldState world = createWorldState(config);

    Tunables tunables;
    RandomSource rng(11);
    launchServe(world, tunables, rng);
    StepOptions options;
    options.rng = &rng;
    world = simulateUntil(world, [](const WorldState& w) { return w.tick >= 45; }, 100, options).finalWorld;

    world.getPlayer("H-OH2").override = {true, "CoverTips"};
    world.rally.homeScore = 7;

    std::string text = serializeWorldState(world);
    WorldState back = deserializeWorldState(text);
    EXPECT_EQ(back, world);
    EXPECT_EQ(serializeWorldState(back), text);
}

TEST(Serialization, Layout) {
    json j = json::parse(serializeWorldState(createWorldState()));
    EXPECT_EQ(j.at("version").get<int>(), 1);
    EXPECT_EQ(j.at("players").size(), 14u);
    EXPECT_EQ(j.at("players")[0].at("id").get<std::string>(), "H-S");
    EXPECT_EQ(j.at("players")[0].at("role").get<std::string>(), "S");
    EXPECT_EQ(j.at("rally").at("phase").get<std::string>(), "PRE_SERVE");
    EXPECT_TRUE(j.at("ball").at("position").is_array());
}

TEST(Serialization, MalformedJson) {
    EXPECT_THROW(deserializeWorldState("{not json"), StateFormatError);
    EXPECT_THROW(deserializeWorldState("[1, 2]"), StateFormatError);
    EXPECT_THROW(deserializeWorldState(""), StateFormatError);
}

TEST(Serialization, MissingField) {
    WorldState world = createWorldState();
    EXPECT_THROW(deserializeWorldState(edited(world, [](json& j) { j.erase("tick"); })),
                 StateFormatError);
    EXPECT_THROW(deserializeWorldState(edited(world, [](json& j) {
        j["players"][3].erase("position");
    })), StateFormatError);
}

TEST(Serialization, UnknownLabel) {
    WorldState world = createWorldState();
    EXPECT_THROW(deserializeWorldState(edited(world, [](json& j) {
        j["players"][0]["role"] = "QB";
    })), StateFormatError);
    EXPECT_THROW(deserializeWorldState(edited(world, [](json& j) {
        j["rally"]["phase"] = "HALFTIME";
    })), StateFormatError);
}

TEST(Serialization, BadShapes) {
    WorldState world = createWorldState();
    EXPECT_THROW(deserializeWorldState(edited(world, [](json& j) {
        j["ball"]["position"] = json::array({0.5});
    })), StateFormatError);
    EXPECT_THROW(deserializeWorldState(edited(world, [](json& j) {
        j["rally"]["home_rotation"] = 9;
    })), StateFormatError);
    EXPECT_THROW(deserializeWorldState(edited(world, [](json& j) {
        j["tick"] = "soon";
    })), StateFormatError);
}

TEST(Serialization, CategoryFollowsRole) {
    WorldState world = createWorldState();
    std::string text = edited(world, [](json& j) { j["players"][1]["role"] = "MB1"; });
    WorldState back = deserializeWorldState(text);
    EXPECT_EQ(back.players[1].category, RoleCategory::MIDDLE);
}
