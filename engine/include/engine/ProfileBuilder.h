#ifndef STBGEOM_PROFILE_BUILDER_H
#define STBGEOM_PROFILE_BUILDER_H

#include "engine/engine_export.h"
#include "engine/Profile.h"
#include "engine/ProfileParameters.h"

#include <optional>

namespace StbGeom::Engine {

    // Closed-form outline for one family, centered on the local origin.
    // Returns nullopt for non-positive or geometrically impossible parameters
    // (a web thicker than the flange width, a BOX or PIPE wall that leaves no
    // hollow inside).
    STBGEOM_ENGINE_API std::optional<Profile> buildProfile(const ProfileParams& params, int circleSegments = 32);

    STBGEOM_ENGINE_API Profile rectangleProfile(double width, double height);
    STBGEOM_ENGINE_API Loop circleLoop(double radius, int segments);

} // namespace StbGeom::Engine

#endif // STBGEOM_PROFILE_BUILDER_H
