#ifndef STBGEOM_SECTION_CLASSIFIER_H
#define STBGEOM_SECTION_CLASSIFIER_H

#include "engine/engine_export.h"
#include "engine/DimensionNormalizer.h"

#include <optional>
#include <string>
#include <string_view>

namespace StbGeom::Engine {

    enum class SectionFamily {
        Rectangle,
        Circle,
        H,
        Box,
        Pipe,
        C,
        L,
        T,
        CrossH
    };

    // "RECTANGLE", "CIRCLE", "H", "BOX", "PIPE", "C", "L", "T", "CROSS_H".
    STBGEOM_ENGINE_API const char* sectionFamilyName(SectionFamily family);

    // Explicit type hints carried by a section record, in resolution order.
    struct SectionTypeHints {
        std::optional<std::string> sectionType;
        std::optional<std::string> profileType;
        std::optional<std::string> steelShapeType;
    };

    // Resolves one type string through the alias table, then by family prefix
    // ("H-400x200x8x13" -> H). Empty and "UNKNOWN" never resolve.
    STBGEOM_ENGINE_API std::optional<SectionFamily> resolveFamilyAlias(std::string_view typeName);

    // Inference from which dimension fields are present. Always returns a family.
    STBGEOM_ENGINE_API SectionFamily inferFamilyFromDimensions(const NormalizedDimensions& dims);

    // Hints first, then dimension inference, then RECTANGLE. Never fails.
    STBGEOM_ENGINE_API SectionFamily classifySection(const SectionTypeHints& hints, const NormalizedDimensions* dims);

    // Adds 90 degrees (mod 360) when the section's reference direction is
    // explicitly false. true or absent leave the rotation untouched.
    STBGEOM_ENGINE_API double applyReferenceDirection(double baseRotationDeg, std::optional<bool> isReferenceDirection);

} // namespace StbGeom::Engine

#endif // STBGEOM_SECTION_CLASSIFIER_H
