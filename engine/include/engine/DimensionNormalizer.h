#ifndef STBGEOM_DIMENSION_NORMALIZER_H
#define STBGEOM_DIMENSION_NORMALIZER_H

#include "engine/engine_export.h"
#include "engine/AttributeBag.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace StbGeom::Engine {

    enum class ProfileHint {
        Circle,
        ExtendedPile
    };

    enum class PileType {
        ExtendedFoot,
        ExtendedTop,
        ExtendedTopFoot
    };

    STBGEOM_ENGINE_API const char* profileHintName(ProfileHint hint);
    STBGEOM_ENGINE_API const char* pileTypeName(PileType type);

    // Canonical dimension record derived once from an AttributeBag.
    struct NormalizedDimensions {
        std::optional<double> width;
        std::optional<double> height;
        std::optional<double> thickness;
        std::optional<double> diameter;
        std::optional<double> radius;
        std::optional<double> overallWidth;
        std::optional<double> overallDepth;
        // Set when the height came from the depth/Depth alias.
        std::optional<double> depth;
        std::optional<double> pileLength;
        std::optional<ProfileHint> profileHint;
        std::optional<PileType> pileType;

        // D_axial, D_extended_foot, ... keyed by their source name.
        std::map<std::string, double> extendedPile;
        // Recognized fields that are not one of the canonical ones above
        // (web_thickness, flange_width, t1, tf, ...).
        std::map<std::string, double> secondary;

        std::optional<double> secondaryValue(std::string_view key) const;
        std::optional<double> webThickness() const;
        std::optional<double> flangeThickness() const;
        std::optional<double> wallThickness() const;
        // Any cross-section size at all, as opposed to pile lengths or markers only.
        bool hasSectionSize() const;

        bool operator==(const NormalizedDimensions& other) const;
        bool operator!=(const NormalizedDimensions& other) const { return !(*this == other); }
    };

    // Extended-pile geometry pulled out of a normalized record.
    struct ExtendedPileSections {
        double axialDiameter = 0.0;
        std::optional<double> footDiameter;
        std::optional<double> topDiameter;
        double footLength = 0.0;
        double topLength = 0.0;
        double footTaperAngle = 0.0; // degrees
        double topTaperAngle = 0.0;  // degrees
    };

    struct DimensionIssue {
        std::string field;
        double value = 0.0;
    };

    // Returns nullopt when the bag has neither a recognizable dimension field nor
    // an extended-pile marker.
    STBGEOM_ENGINE_API std::optional<NormalizedDimensions> normalizeDimensions(const AttributeBag& attributes);

    // Every present numeric field that is not finite and strictly positive.
    STBGEOM_ENGINE_API std::vector<DimensionIssue> validateDimensions(const NormalizedDimensions& dims);

    STBGEOM_ENGINE_API std::optional<ExtendedPileSections> extendedPileSections(const NormalizedDimensions& dims);

    // Alias tables in priority order.
    STBGEOM_ENGINE_API const std::vector<std::string_view>& widthAliases();
    STBGEOM_ENGINE_API const std::vector<std::string_view>& heightAliases();
    STBGEOM_ENGINE_API const std::vector<std::string_view>& diameterAliases();

} // namespace StbGeom::Engine

#endif // STBGEOM_DIMENSION_NORMALIZER_H
