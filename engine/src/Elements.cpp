#include "engine/Elements.h"

#include <type_traits>

namespace StbGeom::Engine {

    const char* elementFamilyName(ElementFamily family) {
        switch (family) {
            case ElementFamily::Column: return "Column";
            case ElementFamily::Post: return "Post";
            case ElementFamily::FoundationColumn: return "FoundationColumn";
            case ElementFamily::Girder: return "Girder";
            case ElementFamily::Beam: return "Beam";
            case ElementFamily::StripFooting: return "StripFooting";
            case ElementFamily::Brace: return "Brace";
            case ElementFamily::Pile: return "Pile";
            case ElementFamily::Footing: return "Footing";
            case ElementFamily::Slab: return "Slab";
            case ElementFamily::Wall: return "Wall";
            case ElementFamily::Parapet: return "Parapet";
        }
        return "Unknown";
    }

    const std::string& elementIdOf(const ElementRecord& element) {
        return std::visit([](const auto& record) -> const std::string& { return record.id; }, element);
    }

    ElementFamily elementFamilyOf(const ElementRecord& element) {
        return std::visit([](const auto& record) -> ElementFamily {
            using T = std::decay_t<decltype(record)>;
            if constexpr (std::is_same_v<T, BraceElement>) return ElementFamily::Brace;
            else if constexpr (std::is_same_v<T, PileElement>) return ElementFamily::Pile;
            else if constexpr (std::is_same_v<T, FootingElement>) return ElementFamily::Footing;
            else if constexpr (std::is_same_v<T, SlabElement>) return ElementFamily::Slab;
            else return record.family;
        }, element);
    }

} // namespace StbGeom::Engine
