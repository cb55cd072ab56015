#pragma once

#include "engine/GeometryOptions.h"
#include "engine/Logger.h"
#include "engine/Providers.h"

namespace StbGeom::Engine {

    // Everything one batch reads. The providers are shared read-only between
    // workers, the logger must tolerate concurrent calls when workerCount > 1.
    struct GenerationContext {
        const INodeProvider& nodes;
        const ISectionProvider& sections;
        const ISteelShapeProvider& steelShapes;
        ILogger& logger;
        GeometryOptions options;
    };

} // namespace StbGeom::Engine
