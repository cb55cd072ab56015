#ifndef STBGEOM_ELEMENT_GENERATOR_H
#define STBGEOM_ELEMENT_GENERATOR_H

#include "engine/engine_export.h"
#include "engine/Elements.h"
#include "engine/GeneratedSolid.h"
#include "engine/GenerationContext.h"

#include <atomic>
#include <vector>

namespace StbGeom::Engine {

    // Runs one element through node resolution, section resolution,
    // classification, profile building, placement and validation. Failures
    // come back as a tagged SkippedElement, never as an exception.
    STBGEOM_ENGINE_API ElementOutcome generateElement(const ElementRecord& element, const GenerationContext& context);

    // One bad record never stops the batch. Results keep the input order, also
    // when GeometryOptions::workerCount spreads the work over threads. Setting
    // cancel abandons the elements not started yet.
    STBGEOM_ENGINE_API BatchResult generateBatch(
        const std::vector<ElementRecord>& elements,
        const GenerationContext& context,
        const std::atomic<bool>* cancel = nullptr);

} // namespace StbGeom::Engine

#endif // STBGEOM_ELEMENT_GENERATOR_H
