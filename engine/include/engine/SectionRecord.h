#pragma once

#include "engine/AttributeBag.h"
#include "engine/VariantExpander.h"

#include <optional>
#include <string>
#include <vector>

namespace StbGeom::Engine {

    // Catalog steel shape ("H-400x200x8x13") with its own dimensions.
    struct SteelShapeRecord {
        std::string name;
        // H, BOX, PIPE, L, ... as written by the catalog.
        std::string typeTag;
        AttributeBag dimensions;
    };

    struct SectionRecord {
        std::string id;
        // Raw attributes/dimensions of the section element.
        AttributeBag attributes;
        // Steel shape already attached by the parser.
        std::optional<SteelShapeRecord> steelShape;
        // Same/NotSame/Haunch/... sub-elements.
        std::vector<MarkupNode> variantMarkup;
        // Encasing concrete of an SRC or CFT composite section.
        std::optional<AttributeBag> concrete;
        // B_X, B_Y, t, offset_X, offset_Y of a column base plate.
        std::optional<AttributeBag> basePlate;
        std::optional<bool> isReferenceDirection;
    };

    // Explicit flag first, then an "isReferenceDirection" attribute.
    inline std::optional<bool> referenceDirectionOf(const SectionRecord& section) {
        if (section.isReferenceDirection) return section.isReferenceDirection;
        if (auto text = section.attributes.text("isReferenceDirection")) {
            if (*text == "false" || *text == "FALSE" || *text == "0") return false;
            if (*text == "true" || *text == "TRUE" || *text == "1") return true;
        }
        return std::nullopt;
    }

} // namespace StbGeom::Engine
