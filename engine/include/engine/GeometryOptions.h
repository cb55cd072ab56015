#pragma once

#include <cstddef>

namespace StbGeom::Engine {

    enum class BeamPlacementMode {
        Center,
        TopAligned
    };

    // Tunables shared by every calculator of one batch.
    struct GeometryOptions {
        // Polygon segment count used for CIRCLE and PIPE sections.
        int circleSegments = 32;
        // Axial width of an abrupt section change (haunch and joint zones), in mm.
        double jointEpsilon = 0.1;
        // Zone of a lone START+CENTER or CENTER+END pair as a fraction of the
        // span when no length is given.
        double defaultTransitionRatio = 0.2;
        // Estimated pile length = factor * diameter when no length is given.
        double pileLengthFactor = 20.0;
        // Beams and girders. Braces are always centered.
        BeamPlacementMode beamPlacementMode = BeamPlacementMode::TopAligned;
        // Walls narrower or lower than this are skipped.
        double minimumWallExtent = 1.0;
        // 1 runs the batch on the calling thread.
        size_t workerCount = 1;
    };

} // namespace StbGeom::Engine
