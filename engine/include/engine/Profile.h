#ifndef STBGEOM_PROFILE_H
#define STBGEOM_PROFILE_H

#include "engine/engine_export.h"

#include <glm/glm.hpp>
#include <optional>
#include <vector>

namespace StbGeom::Engine {

    // Closed polygon, last vertex implicitly joins the first.
    using Loop = std::vector<glm::dvec2>;

    // 2D cross-section in the member's local XY plane. The member axis is +Z.
    struct Profile {
        Loop outer;
        // Wound opposite to the outer loop (BOX, PIPE, wall openings).
        std::vector<Loop> holes;
        // Further outer loops extruded alongside the main one without a boolean
        // union (the second arm of a CROSS_H section).
        std::vector<Loop> auxiliaryOutlines;

        size_t vertexCount() const;
        bool hasSameTopology(const Profile& other) const;
    };

    struct Bounds2D {
        glm::dvec2 min{ 0.0 };
        glm::dvec2 max{ 0.0 };
        glm::dvec2 size() const { return max - min; }
    };

    // Positive for counter-clockwise loops.
    STBGEOM_ENGINE_API double signedArea(const Loop& loop);
    STBGEOM_ENGINE_API glm::dvec2 areaCentroid(const Loop& loop);
    STBGEOM_ENGINE_API Bounds2D loopBounds(const Loop& loop);
    STBGEOM_ENGINE_API Bounds2D profileBounds(const Profile& profile);

    // Outer area minus hole areas.
    STBGEOM_ENGINE_API double netArea(const Profile& profile);

    STBGEOM_ENGINE_API void translateLoop(Loop& loop, const glm::dvec2& offset);

    // Vertex-wise linear interpolation; nullopt if the loop structures differ.
    STBGEOM_ENGINE_API std::optional<Profile> interpolateProfiles(const Profile& from, const Profile& to, double t);

    // At least three outer vertices, finite coordinates and a non-zero area.
    STBGEOM_ENGINE_API bool isProfileUsable(const Profile& profile);

} // namespace StbGeom::Engine

#endif // STBGEOM_PROFILE_H
