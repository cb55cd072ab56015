#include "GeneratorCommon.h"

#include <fmt/core.h>
#include <algorithm>
#include <array>

namespace StbGeom::Engine::Generators {

    namespace {
        constexpr double kDefaultWallThickness = 200.0;

        bool openingFits(const WallOpening& opening, double width, double height) {
            return opening.lengthX > 0.0 && opening.lengthY > 0.0
                && opening.positionX >= 0.0 && opening.positionY >= 0.0
                && opening.positionX + opening.lengthX <= width
                && opening.positionY + opening.lengthY <= height;
        }
    }

    ElementOutcome generateWall(const WallElement& element, const GenerationContext& context) {
        if (element.nodes.size() != 4) {
            return skipped(element.id, element.family, { SkipReason::MissingNodes,
                fmt::format("wall needs 4 nodes, got {}", element.nodes.size()) });
        }

        std::array<glm::dvec3, 4> corners;
        for (size_t i = 0; i < corners.size(); ++i) {
            auto point = resolveNode(element.nodes[i], context);
            if (!point) {
                return skipped(element.id, element.family, { SkipReason::MissingNodes,
                    fmt::format("unresolved {}", describeNode(element.nodes[i])) });
            }
            corners[i] = *point;
        }
        if (!allFinite({ corners[0], corners[1], corners[2], corners[3] })) {
            return skipped(element.id, element.family, { SkipReason::DegenerateGeometry, "non-finite node coordinates" });
        }

        Failure failure;
        const SectionRecord* section = findSection(element.sectionId, context, failure);
        if (!section) {
            return skipped(element.id, element.family, std::move(failure));
        }
        double thickness = section->attributes.firstNumber({ "t", "thickness" }).value_or(kDefaultWallThickness);
        if (!(thickness > 0.0)) thickness = kDefaultWallThickness;

        // The two lowest nodes form the base edge, in the order they were listed.
        std::array<size_t, 4> order{ 0, 1, 2, 3 };
        std::stable_sort(order.begin(), order.end(),
            [&corners](size_t a, size_t b) { return corners[a].z < corners[b].z; });
        const size_t first = std::min(order[0], order[1]);
        const size_t second = std::max(order[0], order[1]);
        const glm::dvec3 a = corners[first];
        const glm::dvec3 b = corners[second];

        double minZ = corners[0].z;
        double maxZ = corners[0].z;
        for (const auto& c : corners) {
            minZ = std::min(minZ, c.z);
            maxZ = std::max(maxZ, c.z);
        }

        const glm::dvec3 edge(b.x - a.x, b.y - a.y, 0.0);
        const double width = glm::length(edge);
        const double height = maxZ - minZ;
        const double minimum = context.options.minimumWallExtent;
        if (width < minimum || height < minimum) {
            return skipped(element.id, element.family, { SkipReason::DegenerateGeometry,
                fmt::format("wall extent {} x {} below {}", width, height, minimum) });
        }

        LocalBasis basis;
        basis.xAxis = edge / width;
        basis.yAxis = glm::dvec3(0.0, 0.0, 1.0);
        basis.zAxis = glm::cross(basis.xAxis, basis.yAxis);

        glm::dvec3 center = (a + b) / 2.0;
        center.z = minZ + height / 2.0;

        auto placement = placementFromBasis(center, basis, thickness);
        if (!placement) {
            return skipped(element.id, element.family, { SkipReason::DegenerateGeometry, "wall frame is not finite" });
        }

        Profile profile = rectangleProfile(width, height);
        for (const auto& opening : element.openings) {
            if (!openingFits(opening, width, height)) {
                context.logger.warn("WallGenerator", "{}: opening at ({}, {}) size {} x {} is outside the wall, ignored",
                    element.id, opening.positionX, opening.positionY, opening.lengthX, opening.lengthY);
                continue;
            }
            Loop hole = rectangleProfile(opening.lengthX, opening.lengthY).outer;
            std::reverse(hole.begin(), hole.end());
            translateLoop(hole, glm::dvec2(opening.positionX + opening.lengthX / 2.0 - width / 2.0,
                opening.positionY + opening.lengthY / 2.0 - height / 2.0));
            profile.holes.push_back(std::move(hole));
        }

        SolidMetadata metadata;
        metadata.profileSource = ProfileSource::Calculator;
        metadata.family = SectionFamily::Rectangle;
        metadata.sectionId = section->id;
        metadata.rawSection = section->attributes;

        ElementOutcome outcome;
        if (!emitSolid(outcome, element.id, element.family, SolidRole::Main, std::move(profile), *placement,
                std::move(metadata), failure)) {
            return skipped(element.id, element.family, std::move(failure));
        }
        return outcome;
    }

} // namespace StbGeom::Engine::Generators
