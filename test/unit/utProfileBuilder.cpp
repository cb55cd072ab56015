#include "UnitTestCommon.h"

#include <engine/ProfileBuilder.h>
#include <engine/ProfileParameters.h>

#include <cmath>

using namespace StbGeom::Engine;
using StbGeom::Test::loopSize;

class utProfileBuilder : public ::testing::Test {
protected:
    static Profile build(const ProfileParams& params, int segments = 32) {
        auto profile = buildProfile(params, segments);
        EXPECT_TRUE(profile.has_value());
        return profile.value_or(Profile{});
    }

    static void expectCentered(const Loop& loop) {
        const glm::dvec2 c = areaCentroid(loop);
        EXPECT_NEAR(0.0, c.x, 1e-9);
        EXPECT_NEAR(0.0, c.y, 1e-9);
    }
};

TEST_F(utProfileBuilder, defaultsApplyWithoutDimensions) {
    const auto h = std::get<HParams>(mapProfileParameters(nullptr, SectionFamily::H));
    EXPECT_DOUBLE_EQ(450.0, h.overallDepth);
    EXPECT_DOUBLE_EQ(200.0, h.overallWidth);
    EXPECT_DOUBLE_EQ(9.0, h.webThickness);
    EXPECT_DOUBLE_EQ(14.0, h.flangeThickness);
    EXPECT_DOUBLE_EQ(13.0, h.filletRadius);

    const auto pipe = std::get<PipeParams>(mapProfileParameters(nullptr, SectionFamily::Pipe));
    EXPECT_DOUBLE_EQ(150.0, pipe.outerDiameter);
    EXPECT_DOUBLE_EQ(6.0, pipe.wallThickness);

    for (int i = 0; i <= static_cast<int>(SectionFamily::CrossH); ++i) {
        const auto family = static_cast<SectionFamily>(i);
        EXPECT_EQ(family, familyOf(defaultParameters(family)));
        EXPECT_TRUE(buildProfile(defaultParameters(family))) << sectionFamilyName(family);
    }
}

TEST_F(utProfileBuilder, mapperPrefersOverallAndSecondaryFields) {
    auto dims = normalizeDimensions({ { "A", 400.0 }, { "B", 200.0 }, { "t1", 8.0 }, { "t2", 13.0 } });
    ASSERT_TRUE(dims);
    const auto h = std::get<HParams>(mapProfileParameters(&*dims, SectionFamily::H));
    EXPECT_DOUBLE_EQ(400.0, h.overallDepth);
    EXPECT_DOUBLE_EQ(200.0, h.overallWidth);
    EXPECT_DOUBLE_EQ(8.0, h.webThickness);
    EXPECT_DOUBLE_EQ(13.0, h.flangeThickness);

    // Non-positive values fall back to the family default.
    auto partial = normalizeDimensions({ { "B", 300.0 }, { "H", -5.0 } });
    ASSERT_TRUE(partial);
    const auto rect = std::get<RectangleParams>(mapProfileParameters(&*partial, SectionFamily::Rectangle));
    EXPECT_DOUBLE_EQ(300.0, rect.width);
    EXPECT_DOUBLE_EQ(400.0, rect.height);
}

TEST_F(utProfileBuilder, rectangleIsCenteredAndCounterClockwise) {
    const Profile p = build(RectangleParams{ 600.0, 300.0 });
    ASSERT_EQ(4u, p.outer.size());
    EXPECT_DOUBLE_EQ(600.0 * 300.0, signedArea(p.outer));
    expectCentered(p.outer);
}

TEST_F(utProfileBuilder, circleHasRequestedSegmentCount) {
    const Profile p = build(CircleParams{ 200.0 }, 48);
    ASSERT_EQ(48u, p.outer.size());
    EXPECT_GT(signedArea(p.outer), 0.0);
    for (const auto& v : p.outer) {
        EXPECT_NEAR(200.0, std::hypot(v.x, v.y), 1e-9);
    }
}

TEST_F(utProfileBuilder, hSectionOutline) {
    HParams params;
    params.overallDepth = 450.0;
    params.overallWidth = 200.0;
    params.webThickness = 9.0;
    params.flangeThickness = 14.0;
    const Profile p = build(params);
    ASSERT_EQ(12u, p.outer.size());
    EXPECT_NEAR(2.0 * 200.0 * 14.0 + 9.0 * (450.0 - 28.0), signedArea(p.outer), 1e-6);
    const glm::dvec2 size = loopSize(p.outer);
    EXPECT_DOUBLE_EQ(200.0, size.x);
    EXPECT_DOUBLE_EQ(450.0, size.y);
}

TEST_F(utProfileBuilder, boxAndPipeHaveSmallerOppositeHoles) {
    const Profile box = build(BoxParams{ 300.0, 200.0, 10.0 });
    ASSERT_EQ(1u, box.holes.size());
    EXPECT_LT(signedArea(box.holes[0]), 0.0);
    EXPECT_DOUBLE_EQ(280.0, loopSize(box.holes[0]).x);
    EXPECT_DOUBLE_EQ(180.0, loopSize(box.holes[0]).y);
    EXPECT_DOUBLE_EQ(300.0 * 200.0 - 280.0 * 180.0, netArea(box));

    const Profile pipe = build(PipeParams{ 200.0, 10.0 }, 32);
    ASSERT_EQ(1u, pipe.holes.size());
    ASSERT_EQ(32u, pipe.holes[0].size());
    EXPECT_LT(signedArea(pipe.holes[0]), 0.0);
    EXPECT_LT(std::abs(signedArea(pipe.holes[0])), signedArea(pipe.outer));
}

TEST_F(utProfileBuilder, wallsWithoutAHollowAreRejected) {
    EXPECT_FALSE(buildProfile(BoxParams{ 100.0, 100.0, 60.0 }));
    EXPECT_FALSE(buildProfile(BoxParams{ 300.0, 100.0, 50.0 }));
    EXPECT_FALSE(buildProfile(PipeParams{ 200.0, 100.0 }, 32));
    EXPECT_FALSE(buildProfile(PipeParams{ 200.0, 150.0 }, 32));
    EXPECT_TRUE(buildProfile(PipeParams{ 200.0, 99.0 }, 32));
}

TEST_F(utProfileBuilder, openSectionsAreCentroidCentered) {
    const Profile channel = build(ChannelParams{ 300.0, 90.0, 9.0, 13.0 });
    EXPECT_EQ(8u, channel.outer.size());
    expectCentered(channel.outer);

    const Profile angle = build(AngleParams{ 65.0, 65.0, 6.0 });
    EXPECT_EQ(6u, angle.outer.size());
    EXPECT_NEAR(65.0 * 6.0 + 59.0 * 6.0, signedArea(angle.outer), 1e-9);
    expectCentered(angle.outer);

    const Profile tee = build(TeeParams{ 200.0, 150.0, 8.0, 12.0 });
    EXPECT_EQ(8u, tee.outer.size());
    expectCentered(tee.outer);
}

TEST_F(utProfileBuilder, crossHKeepsTwoSeparateArms) {
    CrossHParams params;
    params.overallDepthX = 400.0;
    params.overallWidthX = 200.0;
    params.overallDepthY = 300.0;
    params.overallWidthY = 150.0;
    const Profile p = build(params);
    ASSERT_EQ(1u, p.auxiliaryOutlines.size());
    EXPECT_EQ(12u, p.outer.size());
    EXPECT_EQ(12u, p.auxiliaryOutlines[0].size());
    // The Y arm is turned a quarter so its depth runs along X.
    EXPECT_DOUBLE_EQ(300.0, loopSize(p.auxiliaryOutlines[0]).x);
    EXPECT_DOUBLE_EQ(150.0, loopSize(p.auxiliaryOutlines[0]).y);
    EXPECT_GT(signedArea(p.auxiliaryOutlines[0]), 0.0);
}

TEST_F(utProfileBuilder, invalidParametersGiveNull) {
    EXPECT_FALSE(buildProfile(RectangleParams{ 0.0, 300.0 }));
    EXPECT_FALSE(buildProfile(CircleParams{ -1.0 }));
    EXPECT_FALSE(buildProfile(CircleParams{ 100.0 }, 2));
    HParams webTooWide;
    webTooWide.webThickness = 250.0;
    EXPECT_FALSE(buildProfile(webTooWide));
    EXPECT_FALSE(buildProfile(AngleParams{ 65.0, 65.0, 70.0 }));
}

TEST_F(utProfileBuilder, interpolationNeedsMatchingLoops) {
    const Profile a = rectangleProfile(400.0, 400.0);
    const Profile b = rectangleProfile(300.0, 300.0);
    auto mid = interpolateProfiles(a, b, 0.5);
    ASSERT_TRUE(mid);
    EXPECT_DOUBLE_EQ(350.0, loopSize(mid->outer).x);
    EXPECT_FALSE(interpolateProfiles(a, build(CircleParams{ 100.0 }), 0.5));
}
