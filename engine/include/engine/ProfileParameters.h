#ifndef STBGEOM_PROFILE_PARAMETERS_H
#define STBGEOM_PROFILE_PARAMETERS_H

#include "engine/engine_export.h"
#include "engine/DimensionNormalizer.h"
#include "engine/SectionClassifier.h"

#include <variant>

namespace StbGeom::Engine {

    struct RectangleParams {
        double width = 400.0;
        double height = 400.0;
    };

    struct CircleParams {
        double radius = 100.0;
    };

    struct HParams {
        double overallDepth = 450.0;
        double overallWidth = 200.0;
        double webThickness = 9.0;
        double flangeThickness = 14.0;
        double filletRadius = 13.0;
    };

    struct BoxParams {
        double width = 150.0;
        double height = 150.0;
        double wallThickness = 9.0;
    };

    struct PipeParams {
        double outerDiameter = 150.0;
        double wallThickness = 6.0;
    };

    struct ChannelParams {
        double overallDepth = 300.0;
        double flangeWidth = 90.0;
        double webThickness = 9.0;
        double flangeThickness = 13.0;
    };

    struct AngleParams {
        double depth = 65.0;
        double width = 65.0;
        double thickness = 6.0;
    };

    struct TeeParams {
        double overallDepth = 200.0;
        double flangeWidth = 150.0;
        double webThickness = 8.0;
        double flangeThickness = 12.0;
    };

    // Two H arms: X along local X, Y rotated a quarter turn.
    struct CrossHParams {
        double overallDepthX = 400.0;
        double overallWidthX = 200.0;
        double overallDepthY = 400.0;
        double overallWidthY = 200.0;
        double webThickness = 9.0;
        double flangeThickness = 14.0;
    };

    // One alternative per SectionFamily, default-constructed values are the
    // documented fallbacks.
    using ProfileParams = std::variant<
        RectangleParams, CircleParams, HParams, BoxParams, PipeParams,
        ChannelParams, AngleParams, TeeParams, CrossHParams>;

    STBGEOM_ENGINE_API SectionFamily familyOf(const ProfileParams& params);

    // Default parameter record for a family.
    STBGEOM_ENGINE_API ProfileParams defaultParameters(SectionFamily family);

    // Maps normalized dimensions onto the family's parameter record, each
    // missing or non-positive field falls back to its default. dims may be null.
    STBGEOM_ENGINE_API ProfileParams mapProfileParameters(const NormalizedDimensions* dims, SectionFamily family);

} // namespace StbGeom::Engine

#endif // STBGEOM_PROFILE_PARAMETERS_H
