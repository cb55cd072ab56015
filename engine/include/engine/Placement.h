#ifndef STBGEOM_PLACEMENT_H
#define STBGEOM_PLACEMENT_H

#include "engine/engine_export.h"
#include "engine/GeometryOptions.h"

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <optional>

namespace StbGeom::Engine {

    // Rigid transform of a member: the solid is modeled in a local frame with
    // its axis on +Z from -length/2 to +length/2, then rotated and moved to center.
    struct Placement {
        glm::dvec3 center{ 0.0 };
        double length = 0.0;
        glm::dvec3 direction{ 0.0, 0.0, 1.0 };
        glm::dquat rotation{ 1.0, 0.0, 0.0, 0.0 };
        double rollAngle = 0.0; // radians

        // Local (profile) axes in world space.
        glm::dvec3 localX() const { return rotation * glm::dvec3(1.0, 0.0, 0.0); }
        glm::dvec3 localY() const { return rotation * glm::dvec3(0.0, 1.0, 0.0); }

        glm::dvec3 toWorld(const glm::dvec3& local) const { return center + rotation * local; }
    };

    struct LocalBasis {
        glm::dvec3 xAxis{ 1.0, 0.0, 0.0 };
        glm::dvec3 yAxis{ 0.0, 1.0, 0.0 };
        glm::dvec3 zAxis{ 0.0, 0.0, 1.0 };
    };

    struct HorizontalPlacementInput {
        glm::dvec3 start{ 0.0 };
        glm::dvec3 end{ 0.0 };
        glm::dvec3 startOffset{ 0.0 };
        glm::dvec3 endOffset{ 0.0 };
        double rollAngle = 0.0; // radians
        BeamPlacementMode mode = BeamPlacementMode::Center;
        // Only used by TopAligned.
        double sectionHeight = 0.0;
    };

    // Shortest-arc rotation taking from onto to. Opposite vectors turn 180
    // degrees about an arbitrary perpendicular axis.
    STBGEOM_ENGINE_API glm::dquat rotationBetween(const glm::dvec3& from, const glm::dvec3& to);

    // Member basis with +Z along direction. Near-vertical members use the global
    // X axis as reference, the others keep local Y pointing up.
    STBGEOM_ENGINE_API LocalBasis memberBasis(const glm::dvec3& direction);

    STBGEOM_ENGINE_API glm::dquat rotationFromBasis(const LocalBasis& basis);

    // Columns and piles. Offsets move the ends horizontally only. nullopt for
    // coincident or non-finite anchors.
    STBGEOM_ENGINE_API std::optional<Placement> computeVerticalPlacement(
        const glm::dvec3& bottom, const glm::dvec3& top,
        const glm::dvec2& bottomOffset, const glm::dvec2& topOffset,
        double rollAngle);

    // Beams and braces. TopAligned lowers the axis by half the section height
    // so the top face lies on the anchor line.
    STBGEOM_ENGINE_API std::optional<Placement> computeHorizontalPlacement(const HorizontalPlacementInput& input);

    // Placement from an explicit frame (walls, slabs, footings).
    STBGEOM_ENGINE_API std::optional<Placement> placementFromBasis(
        const glm::dvec3& center, const LocalBasis& basis, double length);

    STBGEOM_ENGINE_API bool isFinite(const glm::dvec3& v);
    STBGEOM_ENGINE_API bool isPlacementValid(const Placement& placement);

} // namespace StbGeom::Engine

#endif // STBGEOM_PLACEMENT_H
