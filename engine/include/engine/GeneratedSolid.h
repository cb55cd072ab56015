#ifndef STBGEOM_GENERATED_SOLID_H
#define STBGEOM_GENERATED_SOLID_H

#include "engine/engine_export.h"
#include "engine/AttributeBag.h"
#include "engine/DimensionNormalizer.h"
#include "engine/Elements.h"
#include "engine/Placement.h"
#include "engine/Profile.h"
#include "engine/SectionClassifier.h"
#include "engine/TaperedSolid.h"

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace StbGeom::Engine {

    enum class ProfileSource {
        // Closed-form outline from the section's own dimensions.
        Calculator,
        // Outline from a resolved catalog steel shape.
        IfcEquivalent,
        // No usable dimensions, the family's default parameters were used.
        Fallback
    };

    enum class SolidRole {
        Main,
        BasePlate,
        Concrete
    };

    enum class SkipReason {
        MissingNodes,
        MissingSection,
        InvalidLength,
        DegenerateProfile,
        DegenerateGeometry,
        InsufficientSections
    };

    STBGEOM_ENGINE_API const char* profileSourceName(ProfileSource source);
    STBGEOM_ENGINE_API const char* solidRoleName(SolidRole role);
    // "missing-nodes", "missing-section", ...
    STBGEOM_ENGINE_API const char* skipReasonName(SkipReason reason);

    // Why a shape was chosen, for inspection tools.
    struct SolidMetadata {
        ProfileSource profileSource = ProfileSource::Calculator;
        SectionFamily family = SectionFamily::Rectangle;
        std::string sectionId;
        AttributeBag rawSection;
        std::optional<std::string> steelShape;
        std::optional<PileType> pileType;
    };

    using SolidShape = std::variant<Profile, LoftedSolid>;

    struct GeneratedSolid {
        std::string elementId;
        ElementFamily family = ElementFamily::Column;
        SolidRole role = SolidRole::Main;
        SolidShape shape;
        Placement placement;
        SolidMetadata metadata;

        double length() const { return placement.length; }
        bool isLofted() const { return std::holds_alternative<LoftedSolid>(shape); }
    };

    struct SkippedElement {
        std::string elementId;
        ElementFamily family = ElementFamily::Column;
        SkipReason reason = SkipReason::DegenerateGeometry;
        std::string detail;
    };

    struct ElementOutcome {
        std::vector<GeneratedSolid> solids;
        std::optional<SkippedElement> skipped;

        bool succeeded() const { return !skipped && !solids.empty(); }
    };

    struct BatchResult {
        std::vector<GeneratedSolid> solids;
        std::vector<SkippedElement> skipped;
        size_t processed = 0;
        bool cancelled = false;
    };

} // namespace StbGeom::Engine

#endif // STBGEOM_GENERATED_SOLID_H
