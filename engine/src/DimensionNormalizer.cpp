#include "engine/DimensionNormalizer.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace StbGeom::Engine {

    namespace {

        const std::vector<std::string_view> kThicknessAliases = {
            "t", "thickness", "Thickness", "T"
        };

        const std::vector<std::string_view> kExtendedPileKeys = {
            "D_axial", "D_extended_foot", "D_extended_top",
            "length_extended_foot", "length_extended_top",
            "angle_extended_foot_taper", "angle_extended_top_taper"
        };

        // Fields kept verbatim for the parameter mapper.
        const std::vector<std::string_view> kSecondaryKeys = {
            "web_thickness", "flange_thickness", "flange_width", "wall_thickness",
            "outer_height", "t1", "t2", "tw", "tf", "r", "r1", "r2", "fillet_radius",
            "length_all", "overall_depth_X", "overall_width_X",
            "overall_depth_Y", "overall_width_Y"
        };

        bool equalsIgnoreCase(std::string_view a, std::string_view b) {
            if (a.size() != b.size()) return false;
            for (size_t i = 0; i < a.size(); ++i) {
                if (std::tolower(static_cast<unsigned char>(a[i])) !=
                    std::tolower(static_cast<unsigned char>(b[i]))) {
                    return false;
                }
            }
            return true;
        }

        // ^width_?<axis>$, case-insensitive.
        bool matchesWidthAxis(std::string_view name, char axis) {
            if (name.size() < 6 || !equalsIgnoreCase(name.substr(0, 5), "width")) {
                return false;
            }
            std::string_view rest = name.substr(5);
            if (!rest.empty() && rest.front() == '_') {
                rest.remove_prefix(1);
            }
            return rest.size() == 1 &&
                std::tolower(static_cast<unsigned char>(rest.front())) == std::tolower(static_cast<unsigned char>(axis));
        }

        struct AliasHit {
            std::string_view alias;
            double value = 0.0;
        };

        std::optional<AliasHit> firstAlias(const AttributeBag& bag, const std::vector<std::string_view>& aliases) {
            for (std::string_view alias : aliases) {
                if (auto value = bag.number(alias)) {
                    return AliasHit{ alias, *value };
                }
            }
            return std::nullopt;
        }

        std::optional<double> regexFallback(const AttributeBag& bag, char axis) {
            for (const auto& entry : bag.entries()) {
                if (!matchesWidthAxis(entry.first, axis)) continue;
                if (auto value = toFiniteNumber(entry.second)) {
                    return value;
                }
            }
            return std::nullopt;
        }

        bool sameOptional(const std::optional<double>& a, const std::optional<double>& b) {
            return a.has_value() == b.has_value() && (!a || *a == *b);
        }

        std::optional<double> positiveEntry(const std::map<std::string, double>& map, std::string_view key) {
            auto it = map.find(std::string(key));
            if (it == map.end() || !(it->second > 0.0)) return std::nullopt;
            return it->second;
        }

    } // namespace

    const char* profileHintName(ProfileHint hint) {
        switch (hint) {
            case ProfileHint::Circle: return "CIRCLE";
            case ProfileHint::ExtendedPile: return "EXTENDED_PILE";
        }
        return "CIRCLE";
    }

    const char* pileTypeName(PileType type) {
        switch (type) {
            case PileType::ExtendedFoot: return "ExtendedFoot";
            case PileType::ExtendedTop: return "ExtendedTop";
            case PileType::ExtendedTopFoot: return "ExtendedTopFoot";
        }
        return "ExtendedFoot";
    }

    const std::vector<std::string_view>& widthAliases() {
        static const std::vector<std::string_view> aliases = {
            "width", "Width", "WIDTH", "B", "b", "outer_width", "overall_width", "X", "x"
        };
        return aliases;
    }

    const std::vector<std::string_view>& heightAliases() {
        static const std::vector<std::string_view> aliases = {
            "height", "Height", "HEIGHT", "H", "h", "depth", "Depth",
            "overall_depth", "overall_height", "Y", "y", "A", "a"
        };
        return aliases;
    }

    const std::vector<std::string_view>& diameterAliases() {
        static const std::vector<std::string_view> aliases = {
            "D", "d", "diameter", "Diameter", "outer_diameter"
        };
        return aliases;
    }

    std::optional<double> NormalizedDimensions::secondaryValue(std::string_view key) const {
        auto it = secondary.find(std::string(key));
        if (it == secondary.end()) return std::nullopt;
        return it->second;
    }

    std::optional<double> NormalizedDimensions::webThickness() const {
        for (std::string_view key : { "web_thickness", "t1", "tw" }) {
            if (auto v = secondaryValue(key)) return v;
        }
        return std::nullopt;
    }

    std::optional<double> NormalizedDimensions::flangeThickness() const {
        for (std::string_view key : { "flange_thickness", "t2", "tf" }) {
            if (auto v = secondaryValue(key)) return v;
        }
        return std::nullopt;
    }

    std::optional<double> NormalizedDimensions::wallThickness() const {
        if (auto v = secondaryValue("wall_thickness")) return v;
        return thickness;
    }

    bool NormalizedDimensions::hasSectionSize() const {
        for (const auto* field : { &width, &height, &thickness, &diameter, &radius, &overallWidth, &overallDepth, &depth }) {
            if (field->has_value()) return true;
        }
        return !secondary.empty();
    }

    bool NormalizedDimensions::operator==(const NormalizedDimensions& other) const {
        return sameOptional(width, other.width) &&
            sameOptional(height, other.height) &&
            sameOptional(thickness, other.thickness) &&
            sameOptional(diameter, other.diameter) &&
            sameOptional(radius, other.radius) &&
            sameOptional(overallWidth, other.overallWidth) &&
            sameOptional(overallDepth, other.overallDepth) &&
            sameOptional(depth, other.depth) &&
            sameOptional(pileLength, other.pileLength) &&
            profileHint == other.profileHint &&
            pileType == other.pileType &&
            extendedPile == other.extendedPile &&
            secondary == other.secondary;
    }

    std::optional<NormalizedDimensions> normalizeDimensions(const AttributeBag& attributes) {
        NormalizedDimensions out;

        bool explicitWidth = false;
        bool explicitHeight = false;

        if (auto hit = firstAlias(attributes, widthAliases())) {
            out.width = hit->value;
            explicitWidth = true;
        } else if (auto value = regexFallback(attributes, 'X')) {
            out.width = value;
            explicitWidth = true;
        }

        if (auto hit = firstAlias(attributes, heightAliases())) {
            out.height = hit->value;
            explicitHeight = true;
            if (hit->alias == "depth" || hit->alias == "Depth") {
                out.depth = hit->value;
            }
        } else if (auto value = regexFallback(attributes, 'Y')) {
            out.height = value;
            explicitHeight = true;
        }

        if (auto hit = firstAlias(attributes, diameterAliases())) {
            out.diameter = hit->value;
            if (!out.width) out.width = hit->value;
            if (!out.height) out.height = hit->value;
        }

        if (auto hit = firstAlias(attributes, kThicknessAliases)) {
            out.thickness = hit->value;
        }

        out.pileLength = attributes.number("length_pile");

        for (std::string_view key : kExtendedPileKeys) {
            if (auto value = attributes.number(key)) {
                out.extendedPile.emplace(std::string(key), *value);
            }
        }
        for (std::string_view key : kSecondaryKeys) {
            if (auto value = attributes.number(key)) {
                out.secondary.emplace(std::string(key), *value);
            }
        }

        const bool hasExtended = !out.extendedPile.empty();
        if (hasExtended && !out.diameter) {
            if (auto axial = positiveEntry(out.extendedPile, "D_axial")) {
                out.diameter = axial;
                if (!out.width) out.width = axial;
                if (!out.height) out.height = axial;
            }
        }

        if (!out.width && !out.height && !out.pileLength && !hasExtended) {
            return std::nullopt;
        }

        if (out.width && *out.width != 0.0) out.overallWidth = out.width;
        if (out.height && *out.height != 0.0) out.overallDepth = out.height;

        if (out.diameter) {
            out.radius = *out.diameter / 2.0;
            if (!explicitWidth && !explicitHeight) {
                out.profileHint = ProfileHint::Circle;
            }
        }

        if (hasExtended) {
            const bool foot = positiveEntry(out.extendedPile, "D_extended_foot").has_value();
            const bool top = positiveEntry(out.extendedPile, "D_extended_top").has_value();
            if (foot && top) {
                out.pileType = PileType::ExtendedTopFoot;
            } else if (foot) {
                out.pileType = PileType::ExtendedFoot;
            } else if (top) {
                out.pileType = PileType::ExtendedTop;
            }
            if (out.pileType) {
                out.profileHint = ProfileHint::ExtendedPile;
            }
        }

        return out;
    }

    std::vector<DimensionIssue> validateDimensions(const NormalizedDimensions& dims) {
        std::vector<DimensionIssue> issues;
        auto check = [&](const char* field, const std::optional<double>& value) {
            if (value && !(std::isfinite(*value) && *value > 0.0)) {
                issues.push_back({ field, *value });
            }
        };
        check("width", dims.width);
        check("height", dims.height);
        check("thickness", dims.thickness);
        check("diameter", dims.diameter);
        check("radius", dims.radius);
        check("length_pile", dims.pileLength);
        for (const auto& [key, value] : dims.secondary) {
            check(key.c_str(), value);
        }
        for (const auto& [key, value] : dims.extendedPile) {
            // Taper angles may legitimately be zero.
            if (key.rfind("angle_", 0) == 0) {
                if (!std::isfinite(value) || value < 0.0) issues.push_back({ key, value });
                continue;
            }
            check(key.c_str(), value);
        }
        return issues;
    }

    std::optional<ExtendedPileSections> extendedPileSections(const NormalizedDimensions& dims) {
        if (!dims.pileType) return std::nullopt;

        ExtendedPileSections sections;
        if (auto axial = positiveEntry(dims.extendedPile, "D_axial")) {
            sections.axialDiameter = *axial;
        } else if (dims.diameter && *dims.diameter > 0.0) {
            sections.axialDiameter = *dims.diameter;
        } else {
            return std::nullopt;
        }

        auto entry = [&](const char* key) {
            auto it = dims.extendedPile.find(key);
            return it == dims.extendedPile.end() ? 0.0 : std::max(0.0, it->second);
        };

        if (*dims.pileType != PileType::ExtendedTop) {
            sections.footDiameter = positiveEntry(dims.extendedPile, "D_extended_foot");
            sections.footLength = entry("length_extended_foot");
            sections.footTaperAngle = entry("angle_extended_foot_taper");
        }
        if (*dims.pileType != PileType::ExtendedFoot) {
            sections.topDiameter = positiveEntry(dims.extendedPile, "D_extended_top");
            sections.topLength = entry("length_extended_top");
            sections.topTaperAngle = entry("angle_extended_top_taper");
        }
        return sections;
    }

} // namespace StbGeom::Engine
