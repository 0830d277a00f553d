#include <gtest/gtest.h>
#include "vb/court.h"
#include "vb/vec2.h"

using namespace vb;

TEST(Vec2, Arithmetic) {
    Vec2 a{0.2, 0.3};
    Vec2 b{0.1, 0.5};
    EXPECT_EQ(a + b, (Vec2{0.2 + 0.1, 0.3 + 0.5}));
    EXPECT_EQ(a - b, (Vec2{0.2 - 0.1, 0.3 - 0.5}));
    EXPECT_EQ(a * 2.0, (Vec2{0.4, 0.6}));
    EXPECT_DOUBLE_EQ((Vec2{3.0, 4.0}).length(), 5.0);
    EXPECT_DOUBLE_EQ((Vec2{0.0, 0.0}).distanceTo({0.3, 0.4}), 0.5);
}

TEST(Vec2, NormalizedZeroStaysZero) {
    EXPECT_EQ((Vec2{0.0, 0.0}).normalized(), (Vec2{0.0, 0.0}));
    Vec2 n = Vec2{0.0, 2.0}.normalized();
    EXPECT_DOUBLE_EQ(n.x, 0.0);
    EXPECT_DOUBLE_EQ(n.y, 1.0);
}

TEST(Vec2, ClampAndLerp) {
    EXPECT_EQ(clampVec({1.5, -0.2}, {0.0, 0.0}, {1.0, 1.0}), (Vec2{1.0, 0.0}));
    Vec2 mid = lerp({0.0, 0.0}, {1.0, 0.5}, 0.5);
    EXPECT_DOUBLE_EQ(mid.x, 0.5);
    EXPECT_DOUBLE_EQ(mid.y, 0.25);
}

TEST(CourtModel, SideOfNet) {
    CourtModel court;
    EXPECT_EQ(court.sideOf({0.5, 0.8}), TeamSide::HOME);
    EXPECT_EQ(court.sideOf({0.5, 0.5}), TeamSide::HOME);
    EXPECT_EQ(court.sideOf({0.5, 0.2}), TeamSide::AWAY);
}

TEST(CourtModel, ForTeamMirrorsAboutNet) {
    CourtModel court;
    Vec2 home{0.3, 0.8};
    EXPECT_EQ(court.forTeam(TeamSide::HOME, home), home);
    Vec2 away = court.forTeam(TeamSide::AWAY, home);
    EXPECT_DOUBLE_EQ(away.x, 0.3);
    EXPECT_NEAR(away.y, 0.2, 1e-12);
}

TEST(CourtModel, InBounds) {
    EXPECT_TRUE(CourtModel::isInBounds({0.5, 0.5}));
    EXPECT_FALSE(CourtModel::isInBounds({0.5, 0.98}));
    EXPECT_FALSE(CourtModel::isInBounds({0.01, 0.5}));
}
