#include "UnitTestCommon.h"

#include <engine/Placement.h>
#include <engine/ProfileBuilder.h>
#include <engine/TaperedSolid.h>
#include <engine/geometry/SolidConverter.h>

#include <algorithm>
#include <limits>

using namespace StbGeom;
using namespace StbGeom::Engine;
using StbGeom::Test::RecordingLogger;

class utSolidConverter : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        CadKernel::initialize();
    }

    static GeneratedSolid vertical(SolidShape shape, const glm::dvec3& bottom, const glm::dvec3& top) {
        GeneratedSolid solid;
        solid.elementId = "C1";
        solid.shape = std::move(shape);
        solid.placement = *computeVerticalPlacement(bottom, top, glm::dvec2(0.0), glm::dvec2(0.0), 0.0);
        return solid;
    }

    struct MeshBounds {
        glm::dvec3 min{ std::numeric_limits<double>::max() };
        glm::dvec3 max{ std::numeric_limits<double>::lowest() };
    };

    static MeshBounds boundsOf(const CadKernel::MeshBuffers& mesh) {
        MeshBounds bounds;
        for (size_t i = 0; i + 2 < mesh.vertices.size(); i += 3) {
            const glm::dvec3 p(mesh.vertices[i], mesh.vertices[i + 1], mesh.vertices[i + 2]);
            bounds.min = glm::min(bounds.min, p);
            bounds.max = glm::max(bounds.max, p);
        }
        return bounds;
    }

    RecordingLogger logger;
};

TEST_F(utSolidConverter, extrudedRectangle) {
    auto geometry = convertSolid(vertical(rectangleProfile(400.0, 400.0), { 0.0, 0.0, 0.0 }, { 0.0, 0.0, 3000.0 }), logger);
    ASSERT_NE(nullptr, geometry);
    ASSERT_NE(nullptr, geometry->getShape());
    EXPECT_NEAR(4.8e8, geometry->volume(), 4.8e8 * 1e-6);
    EXPECT_EQ(0u, logger.count(LogLevel::Error));
}

TEST_F(utSolidConverter, holesAreSubtracted) {
    BoxParams box;
    box.width = 400.0;
    box.height = 400.0;
    box.wallThickness = 22.0;
    auto profile = buildProfile(box);
    ASSERT_TRUE(profile);

    auto geometry = convertSolid(vertical(*profile, { 0.0, 0.0, 0.0 }, { 0.0, 0.0, 3000.0 }), logger);
    ASSERT_NE(nullptr, geometry);
    const double expected = (400.0 * 400.0 - 356.0 * 356.0) * 3000.0;
    EXPECT_NEAR(expected, geometry->volume(), expected * 1e-6);
}

TEST_F(utSolidConverter, auxiliaryOutlinesStaySeparate) {
    Profile cross = rectangleProfile(400.0, 100.0);
    cross.auxiliaryOutlines.push_back(rectangleProfile(100.0, 400.0).outer);

    auto geometry = convertSolid(vertical(cross, { 0.0, 0.0, 0.0 }, { 0.0, 0.0, 1000.0 }), logger);
    ASSERT_NE(nullptr, geometry);
    // Both prisms count in full, the overlap is not merged.
    EXPECT_NEAR(2.0 * 40000.0 * 1000.0, geometry->volume(), 8.0e7 * 1e-6);
}

TEST_F(utSolidConverter, taperedLoftVolume) {
    MultiSectionSpec spec;
    spec.sections = { { AxialPosition::named(AxialPosition::Kind::Bottom), rectangleProfile(400.0, 400.0) },
        { AxialPosition::named(AxialPosition::Kind::Top), rectangleProfile(300.0, 300.0) } };
    auto loft = buildLoftedSolid(spec, 3000.0, GeometryOptions{});
    ASSERT_TRUE(loft);

    auto geometry = convertSolid(vertical(*loft, { 0.0, 0.0, 0.0 }, { 0.0, 0.0, 3000.0 }), logger);
    ASSERT_NE(nullptr, geometry);
    // Square frustum.
    const double expected = 3000.0 / 3.0 * (160000.0 + 90000.0 + 120000.0);
    EXPECT_NEAR(expected, geometry->volume(), expected * 1e-6);

    const MeshBounds bounds = boundsOf(geometry->getRenderMesh());
    EXPECT_NEAR(-200.0, bounds.min.x, 1e-2);
    EXPECT_NEAR(0.0, bounds.min.z, 1e-2);
    EXPECT_NEAR(3000.0, bounds.max.z, 1e-2);
}

TEST_F(utSolidConverter, placedInWorldCoordinates) {
    auto geometry = convertSolid(vertical(rectangleProfile(400.0, 600.0), { 1000.0, 2000.0, 0.0 },
        { 1000.0, 2000.0, 3000.0 }), logger);
    ASSERT_NE(nullptr, geometry);

    const auto mesh = geometry->getRenderMesh();
    ASSERT_FALSE(mesh.isEmpty());
    EXPECT_EQ(mesh.vertices.size(), mesh.normals.size());
    const MeshBounds bounds = boundsOf(mesh);
    EXPECT_NEAR(800.0, bounds.min.x, 1e-2);
    EXPECT_NEAR(1200.0, bounds.max.x, 1e-2);
    EXPECT_NEAR(1700.0, bounds.min.y, 1e-2);
    EXPECT_NEAR(2300.0, bounds.max.y, 1e-2);
    EXPECT_NEAR(0.0, bounds.min.z, 1e-2);
    EXPECT_NEAR(3000.0, bounds.max.z, 1e-2);
}

TEST_F(utSolidConverter, horizontalMemberKeepsProfileYUp) {
    HorizontalPlacementInput input;
    input.start = { 0.0, 0.0, 0.0 };
    input.end = { 6000.0, 0.0, 0.0 };

    GeneratedSolid solid;
    solid.elementId = "B1";
    solid.family = ElementFamily::Beam;
    solid.shape = rectangleProfile(200.0, 400.0);
    solid.placement = *computeHorizontalPlacement(input);

    auto geometry = convertSolid(solid, logger);
    ASSERT_NE(nullptr, geometry);
    const MeshBounds bounds = boundsOf(geometry->getRenderMesh());
    EXPECT_NEAR(0.0, bounds.min.x, 1e-2);
    EXPECT_NEAR(6000.0, bounds.max.x, 1e-2);
    EXPECT_NEAR(-100.0, bounds.min.y, 1e-2);
    EXPECT_NEAR(100.0, bounds.max.y, 1e-2);
    EXPECT_NEAR(-200.0, bounds.min.z, 1e-2);
    EXPECT_NEAR(200.0, bounds.max.z, 1e-2);
}

TEST_F(utSolidConverter, finerDetailGivesMoreTriangles) {
    PipeParams pipe;
    pipe.outerDiameter = 165.2;
    pipe.wallThickness = 5.0;
    auto profile = buildProfile(pipe, 64);
    ASSERT_TRUE(profile);

    auto geometry = convertSolid(vertical(*profile, { 0.0, 0.0, 0.0 }, { 0.0, 0.0, 2000.0 }), logger);
    ASSERT_NE(nullptr, geometry);
    const auto coarse = geometry->getRenderMesh();
    EXPECT_FALSE(coarse.isEmpty());
    EXPECT_GE(geometry->getRenderMesh(2.0).triangleCount(), coarse.triangleCount());
}

TEST_F(utSolidConverter, kernelRejectsBadInput) {
    std::vector<CadKernel::LoftSection> single = { { 0.0, CadKernel::SectionLoops{ rectangleProfile(100.0, 100.0).outer } } };
    EXPECT_EQ(nullptr, CadKernel::LoftSections(single, 1000.0));

    CadKernel::SectionLoops line;
    line.outer = { { 0.0, 0.0 }, { 100.0, 0.0 } };
    EXPECT_EQ(nullptr, CadKernel::MakeSectionFace(line));
    EXPECT_EQ(nullptr, CadKernel::ExtrudeSection(line, 1000.0));
}
