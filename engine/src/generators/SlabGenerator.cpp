#include "GeneratorCommon.h"

#include <fmt/core.h>
#include <algorithm>

namespace StbGeom::Engine::Generators {

    namespace {
        constexpr double kDefaultSlabDepth = 150.0;

        // Newell's method, robust for slightly non-planar outlines.
        glm::dvec3 newellNormal(const std::vector<glm::dvec3>& points) {
            glm::dvec3 n(0.0);
            for (size_t i = 0, count = points.size(); i < count; ++i) {
                const glm::dvec3& a = points[i];
                const glm::dvec3& b = points[(i + 1) % count];
                n.x += (a.y - b.y) * (a.z + b.z);
                n.y += (a.z - b.z) * (a.x + b.x);
                n.z += (a.x - b.x) * (a.y + b.y);
            }
            return n;
        }
    }

    ElementOutcome generateSlab(const SlabElement& element, const GenerationContext& context) {
        const ElementFamily family = ElementFamily::Slab;
        if (element.nodes.size() < 3) {
            return skipped(element.id, family, { SkipReason::MissingNodes,
                fmt::format("slab needs at least 3 nodes, got {}", element.nodes.size()) });
        }

        std::vector<glm::dvec3> points;
        points.reserve(element.nodes.size());
        for (size_t i = 0; i < element.nodes.size(); ++i) {
            auto point = resolveNode(element.nodes[i], context);
            if (!point) {
                return skipped(element.id, family, { SkipReason::MissingNodes,
                    fmt::format("unresolved {}", describeNode(element.nodes[i])) });
            }
            if (i < element.offsets.size()) *point += element.offsets[i];
            if (!isFinite(*point)) {
                return skipped(element.id, family, { SkipReason::DegenerateGeometry, "non-finite node coordinates" });
            }
            points.push_back(*point);
        }

        Failure failure;
        const SectionRecord* section = findSection(element.sectionId, context, failure);
        if (!section) {
            return skipped(element.id, family, std::move(failure));
        }
        double depth = section->attributes.firstNumber({ "depth", "thickness", "t" }).value_or(kDefaultSlabDepth);
        if (!(depth > 0.0)) depth = kDefaultSlabDepth;

        glm::dvec3 normal = newellNormal(points);
        if (glm::length(normal) < 1e-9) {
            return skipped(element.id, family, { SkipReason::DegenerateGeometry, "slab outline has no area" });
        }
        normal = glm::normalize(normal);
        if (normal.z < 0.0) normal = -normal;

        glm::dvec3 centroid(0.0);
        for (const auto& p : points) centroid += p;
        centroid /= static_cast<double>(points.size());

        LocalBasis basis;
        basis.zAxis = normal;
        glm::dvec3 edge = points[1] - points[0];
        edge -= normal * glm::dot(edge, normal);
        if (glm::length(edge) < 1e-9) {
            return skipped(element.id, family, { SkipReason::DegenerateGeometry, "first slab edge is degenerate" });
        }
        basis.xAxis = glm::normalize(edge);
        basis.yAxis = glm::cross(basis.zAxis, basis.xAxis);

        Profile profile;
        for (const auto& p : points) {
            const glm::dvec3 d = p - centroid;
            profile.outer.emplace_back(glm::dot(d, basis.xAxis), glm::dot(d, basis.yAxis));
        }
        if (signedArea(profile.outer) < 0.0) {
            std::reverse(profile.outer.begin(), profile.outer.end());
        }
        const glm::dvec2 shift = areaCentroid(profile.outer);
        translateLoop(profile.outer, -shift);
        centroid += basis.xAxis * shift.x + basis.yAxis * shift.y;

        // The node plane is the top face, the slab hangs below it.
        auto placement = placementFromBasis(centroid - normal * (depth / 2.0), basis, depth);
        if (!placement) {
            return skipped(element.id, family, { SkipReason::DegenerateGeometry, "slab frame is not finite" });
        }

        SolidMetadata metadata;
        metadata.profileSource = ProfileSource::Calculator;
        metadata.family = SectionFamily::Rectangle;
        metadata.sectionId = section->id;
        metadata.rawSection = section->attributes;

        ElementOutcome outcome;
        if (!emitSolid(outcome, element.id, family, SolidRole::Main, std::move(profile), *placement,
                std::move(metadata), failure)) {
            return skipped(element.id, family, std::move(failure));
        }
        return outcome;
    }

} // namespace StbGeom::Engine::Generators
