#include "UnitTestCommon.h"

#include <engine/Placement.h>

#include <glm/gtc/constants.hpp>
#include <limits>

using namespace StbGeom::Engine;

namespace {

void expectVecNear(const glm::dvec3& expected, const glm::dvec3& actual, double tolerance = 1e-9) {
    EXPECT_NEAR(expected.x, actual.x, tolerance);
    EXPECT_NEAR(expected.y, actual.y, tolerance);
    EXPECT_NEAR(expected.z, actual.z, tolerance);
}

} // namespace

class utPlacement : public ::testing::Test {};

TEST_F(utPlacement, verticalMember) {
    auto placement = computeVerticalPlacement({ 0.0, 0.0, 0.0 }, { 0.0, 0.0, 3000.0 },
        glm::dvec2(0.0), glm::dvec2(0.0), 0.0);
    ASSERT_TRUE(placement);
    EXPECT_DOUBLE_EQ(3000.0, placement->length);
    expectVecNear({ 0.0, 0.0, 1.0 }, placement->direction);
    expectVecNear({ 0.0, 0.0, 1500.0 }, placement->center);
    expectVecNear({ 1.0, 0.0, 0.0 }, placement->localX());
}

TEST_F(utPlacement, offsetsMoveEndsHorizontally) {
    auto placement = computeVerticalPlacement({ 0.0, 0.0, 0.0 }, { 0.0, 0.0, 4000.0 },
        glm::dvec2(100.0, 0.0), glm::dvec2(100.0, 0.0), 0.0);
    ASSERT_TRUE(placement);
    expectVecNear({ 100.0, 0.0, 2000.0 }, placement->center);
    EXPECT_DOUBLE_EQ(4000.0, placement->length);
}

TEST_F(utPlacement, directionIsUnitAndMatchesRotation) {
    const glm::dvec3 bottom(120.0, -40.0, 15.0);
    for (const glm::dvec3& top : { glm::dvec3(900.0, 300.0, 3100.0), glm::dvec3(120.0, -40.0, -500.0),
             glm::dvec3(-3000.0, 0.0, 15.0) }) {
        auto placement = computeVerticalPlacement(bottom, top, glm::dvec2(0.0), glm::dvec2(0.0), 0.3);
        ASSERT_TRUE(placement);
        EXPECT_NEAR(1.0, glm::length(placement->direction), 1e-12);
        expectVecNear(placement->direction, placement->rotation * glm::dvec3(0.0, 0.0, 1.0), 1e-9);
    }
}

TEST_F(utPlacement, rollTurnsAboutTheMemberAxis) {
    auto placement = computeVerticalPlacement({ 0.0, 0.0, 0.0 }, { 0.0, 0.0, 3000.0 },
        glm::dvec2(0.0), glm::dvec2(0.0), glm::half_pi<double>());
    ASSERT_TRUE(placement);
    expectVecNear({ 0.0, 1.0, 0.0 }, placement->localX());
    expectVecNear({ 0.0, 0.0, 1.0 }, placement->direction);
}

TEST_F(utPlacement, coincidentAnchorsFail) {
    EXPECT_FALSE(computeVerticalPlacement({ 5.0, 5.0, 5.0 }, { 5.0, 5.0, 5.0 },
        glm::dvec2(0.0), glm::dvec2(0.0), 0.0));
    HorizontalPlacementInput input;
    input.start = { 0.0, 0.0, 0.0 };
    input.end = { 1000.0, 0.0, 0.0 };
    input.endOffset = { -1000.0, 0.0, 0.0 };
    EXPECT_FALSE(computeHorizontalPlacement(input));
}

TEST_F(utPlacement, nonFiniteAnchorsFail) {
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(computeVerticalPlacement({ 0.0, 0.0, 0.0 }, { 0.0, 0.0, inf },
        glm::dvec2(0.0), glm::dvec2(0.0), 0.0));
}

TEST_F(utPlacement, topAlignedBeamHangsBelowTheLine) {
    HorizontalPlacementInput input;
    input.start = { 0.0, 0.0, 3500.0 };
    input.end = { 6000.0, 0.0, 3500.0 };
    input.mode = BeamPlacementMode::TopAligned;
    input.sectionHeight = 600.0;
    auto placement = computeHorizontalPlacement(input);
    ASSERT_TRUE(placement);
    EXPECT_DOUBLE_EQ(6000.0, placement->length);
    expectVecNear({ 3000.0, 0.0, 3200.0 }, placement->center);
    expectVecNear({ 1.0, 0.0, 0.0 }, placement->direction);
    // Profile +Y points up.
    expectVecNear({ 0.0, 0.0, 1.0 }, placement->localY());

    input.mode = BeamPlacementMode::Center;
    auto centered = computeHorizontalPlacement(input);
    ASSERT_TRUE(centered);
    expectVecNear({ 3000.0, 0.0, 3500.0 }, centered->center);
}

TEST_F(utPlacement, oppositeVectors) {
    const glm::dquat q = rotationBetween({ 0.0, 0.0, 1.0 }, { 0.0, 0.0, -1.0 });
    expectVecNear({ 0.0, 0.0, -1.0 }, q * glm::dvec3(0.0, 0.0, 1.0));
}

TEST_F(utPlacement, explicitBasis) {
    LocalBasis basis;
    basis.xAxis = { 0.0, 1.0, 0.0 };
    basis.yAxis = { 0.0, 0.0, 1.0 };
    basis.zAxis = { 1.0, 0.0, 0.0 };
    auto placement = placementFromBasis({ 10.0, 20.0, 30.0 }, basis, 200.0);
    ASSERT_TRUE(placement);
    expectVecNear(basis.xAxis, placement->localX());
    expectVecNear(basis.yAxis, placement->localY());
    expectVecNear(basis.zAxis, placement->direction);
    EXPECT_FALSE(placementFromBasis({ 0.0, 0.0, 0.0 }, basis, 0.0));
}
