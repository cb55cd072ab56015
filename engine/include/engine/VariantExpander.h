#ifndef STBGEOM_VARIANT_EXPANDER_H
#define STBGEOM_VARIANT_EXPANDER_H

#include "engine/engine_export.h"
#include "engine/AttributeBag.h"
#include "engine/AxialPosition.h"

#include <optional>
#include <string>
#include <vector>

namespace StbGeom::Engine {

    // One element of a section's variation markup, with its sub-elements.
    struct MarkupNode {
        std::string tag;
        AttributeBag attributes;
        std::vector<MarkupNode> children;
    };

    enum class VariantCategory {
        Same,
        NotSame,
        MultiSection,
        Fallback
    };

    struct SectionDescriptor {
        VariantCategory category = VariantCategory::Fallback;
        std::string tag;
        std::string shape;
        std::optional<std::string> endShape;
        AxialPosition position;
        std::optional<std::string> strengthMain;
        AttributeBag attributes;
    };

    struct VariantExpansion {
        // Same markup or the depth-first fallback.
        std::optional<SectionDescriptor> uniform;
        std::vector<SectionDescriptor> variants;
        std::vector<SectionDescriptor> multiSection;

        // Shape of whichever category won, empty when nothing matched.
        std::string primaryShape() const;
        bool empty() const { return !uniform && variants.empty() && multiSection.empty(); }
    };

    // Same > NotSame > beam multi-section > first descendant carrying a shape.
    // Same wins even when NotSame markup is present as well.
    STBGEOM_ENGINE_API VariantExpansion expandSectionVariants(const std::vector<MarkupNode>& markup);

    STBGEOM_ENGINE_API bool isSameTag(const std::string& tag);
    STBGEOM_ENGINE_API bool isNotSameTag(const std::string& tag);
    STBGEOM_ENGINE_API bool isMultiSectionTag(const std::string& tag);
    // Haunch vs joint style of a beam multi-section tag.
    STBGEOM_ENGINE_API bool isJointTag(const std::string& tag);

} // namespace StbGeom::Engine

#endif // STBGEOM_VARIANT_EXPANDER_H
