#ifndef STBGEOM_ELEMENTS_H
#define STBGEOM_ELEMENTS_H

#include "engine/engine_export.h"
#include "engine/GeometryOptions.h"

#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace StbGeom::Engine {

    enum class ElementFamily {
        Column,
        Post,
        FoundationColumn,
        Girder,
        Beam,
        StripFooting,
        Brace,
        Pile,
        Footing,
        Slab,
        Wall,
        Parapet
    };

    STBGEOM_ENGINE_API const char* elementFamilyName(ElementFamily family);

    // A node id resolved through INodeProvider, or raw coordinates (JSON input).
    using NodeRef = std::variant<std::string, glm::dvec3>;

    // Column, Post, FoundationColumn.
    struct ColumnElement {
        std::string id;
        ElementFamily family = ElementFamily::Column;
        NodeRef bottom;
        NodeRef top;
        std::string sectionId;
        glm::dvec2 offsetBottom{ 0.0 };
        glm::dvec2 offsetTop{ 0.0 };
        double rotation = 0.0; // degrees
    };

    // Beam, Girder, StripFooting.
    struct BeamElement {
        std::string id;
        ElementFamily family = ElementFamily::Beam;
        NodeRef start;
        NodeRef end;
        std::string sectionId;
        glm::dvec3 offsetStart{ 0.0 };
        glm::dvec3 offsetEnd{ 0.0 };
        double rotation = 0.0; // degrees
        std::optional<double> haunchStart;
        std::optional<double> haunchEnd;
        std::optional<double> jointStart;
        std::optional<double> jointEnd;
        // Overrides GeometryOptions::beamPlacementMode.
        std::optional<BeamPlacementMode> placementMode;
    };

    struct BraceElement {
        std::string id;
        NodeRef start;
        NodeRef end;
        std::string sectionId;
        glm::dvec3 offsetStart{ 0.0 };
        glm::dvec3 offsetEnd{ 0.0 };
        double rotation = 0.0; // degrees
    };

    // Two-node piles give both ends. Single-node piles hang below their head
    // node, the length comes from lengthAll, the section's length_pile or an
    // estimate.
    struct PileElement {
        std::string id;
        NodeRef top;
        std::optional<NodeRef> bottom;
        std::string sectionId;
        glm::dvec2 offset{ 0.0 };
        std::optional<double> levelTop;
        std::optional<double> lengthAll;
        double rotation = 0.0; // degrees
    };

    struct FootingElement {
        std::string id;
        NodeRef node;
        std::string sectionId;
        glm::dvec2 offset{ 0.0 };
        std::optional<double> levelBottom;
        double rotation = 0.0; // degrees
    };

    struct SlabElement {
        std::string id;
        std::vector<NodeRef> nodes;
        // Per-node offsets, missing entries count as zero.
        std::vector<glm::dvec3> offsets;
        std::string sectionId;
    };

    // Measured from the wall's first bottom node and its bottom edge.
    struct WallOpening {
        double positionX = 0.0;
        double positionY = 0.0;
        double lengthX = 0.0;
        double lengthY = 0.0;
    };

    // Wall, Parapet.
    struct WallElement {
        std::string id;
        ElementFamily family = ElementFamily::Wall;
        std::vector<NodeRef> nodes;
        std::string sectionId;
        std::vector<WallOpening> openings;
    };

    using ElementRecord = std::variant<
        ColumnElement, BeamElement, BraceElement, PileElement,
        FootingElement, SlabElement, WallElement>;

    STBGEOM_ENGINE_API const std::string& elementIdOf(const ElementRecord& element);
    STBGEOM_ENGINE_API ElementFamily elementFamilyOf(const ElementRecord& element);

} // namespace StbGeom::Engine

#endif // STBGEOM_ELEMENTS_H
