#include "engine/SectionClassifier.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>
#include <vector>

namespace StbGeom::Engine {

    namespace {

        const std::vector<std::pair<std::string_view, SectionFamily>>& aliasTable() {
            static const std::vector<std::pair<std::string_view, SectionFamily>> table = {
                { "RECTANGLE", SectionFamily::Rectangle },
                { "RECTANGULAR", SectionFamily::Rectangle },
                { "RECT", SectionFamily::Rectangle },
                { "SQ", SectionFamily::Rectangle },
                { "SQUARE", SectionFamily::Rectangle },
                { "RC", SectionFamily::Rectangle },
                { "RC-SECTION", SectionFamily::Rectangle },
                { "FB", SectionFamily::Rectangle },
                { "CIRCLE", SectionFamily::Circle },
                { "CIRCULAR", SectionFamily::Circle },
                { "ROUND", SectionFamily::Circle },
                { "ROUND-BAR", SectionFamily::Circle },
                { "H", SectionFamily::H },
                { "I", SectionFamily::H },
                { "IBEAM", SectionFamily::H },
                { "H-SECTION", SectionFamily::H },
                { "WIDE_FLANGE", SectionFamily::H },
                { "BOX", SectionFamily::Box },
                { "RHS", SectionFamily::Box },
                { "SHS", SectionFamily::Box },
                { "BOX-SECTION", SectionFamily::Box },
                { "SQUARE-SECTION", SectionFamily::Box },
                { "BCP", SectionFamily::Box },
                { "BCR", SectionFamily::Box },
                { "PIPE", SectionFamily::Pipe },
                { "CHS", SectionFamily::Pipe },
                { "TUBE", SectionFamily::Pipe },
                { "HOLLOW", SectionFamily::Pipe },
                { "P", SectionFamily::Pipe },
                { "PIPE-SECTION", SectionFamily::Pipe },
                { "ROUND-SECTION", SectionFamily::Pipe },
                { "C", SectionFamily::C },
                { "CHANNEL", SectionFamily::C },
                { "U", SectionFamily::C },
                { "U-SHAPE", SectionFamily::C },
                { "LIPC", SectionFamily::C },
                { "L", SectionFamily::L },
                { "ANGLE", SectionFamily::L },
                { "L-SHAPE", SectionFamily::L },
                { "T", SectionFamily::T },
                { "TEE", SectionFamily::T },
                { "T-SHAPE", SectionFamily::T },
                { "CROSS_H", SectionFamily::CrossH },
                { "CROSS-H", SectionFamily::CrossH },
                { "CROSS", SectionFamily::CrossH },
                { "CRUCIFORM", SectionFamily::CrossH },
                { "+", SectionFamily::CrossH },
            };
            return table;
        }

        // Longest prefixes first so "CROSS-H-..." is not read as "C".
        const std::vector<std::pair<std::string_view, SectionFamily>>& prefixTable() {
            static const std::vector<std::pair<std::string_view, SectionFamily>> table = {
                { "CROSS", SectionFamily::CrossH },
                { "PIPE", SectionFamily::Pipe },
                { "BOX", SectionFamily::Box },
                { "RECT", SectionFamily::Rectangle },
                { "CHS", SectionFamily::Pipe },
                { "RHS", SectionFamily::Box },
                { "SHS", SectionFamily::Box },
                { "BCP", SectionFamily::Box },
                { "BCR", SectionFamily::Box },
                { "FB", SectionFamily::Rectangle },
                { "H", SectionFamily::H },
                { "I", SectionFamily::H },
                { "P", SectionFamily::Pipe },
                { "C", SectionFamily::C },
                { "L", SectionFamily::L },
                { "T", SectionFamily::T },
            };
            return table;
        }

        std::string upperTrimmed(std::string_view text) {
            size_t first = 0;
            size_t last = text.size();
            while (first < last && std::isspace(static_cast<unsigned char>(text[first]))) ++first;
            while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) --last;
            std::string out(text.substr(first, last - first));
            std::transform(out.begin(), out.end(), out.begin(),
                [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return out;
        }

        bool has(const std::optional<double>& value) {
            return value.has_value() && *value != 0.0;
        }

    } // namespace

    const char* sectionFamilyName(SectionFamily family) {
        switch (family) {
            case SectionFamily::Rectangle: return "RECTANGLE";
            case SectionFamily::Circle: return "CIRCLE";
            case SectionFamily::H: return "H";
            case SectionFamily::Box: return "BOX";
            case SectionFamily::Pipe: return "PIPE";
            case SectionFamily::C: return "C";
            case SectionFamily::L: return "L";
            case SectionFamily::T: return "T";
            case SectionFamily::CrossH: return "CROSS_H";
        }
        return "RECTANGLE";
    }

    std::optional<SectionFamily> resolveFamilyAlias(std::string_view typeName) {
        const std::string key = upperTrimmed(typeName);
        if (key.empty() || key == "UNKNOWN") {
            return std::nullopt;
        }
        for (const auto& [alias, family] : aliasTable()) {
            if (key == alias) return family;
        }
        // Catalog names such as "H-400x200x8x13" or "BOX-300x300x12".
        for (const auto& [prefix, family] : prefixTable()) {
            if (key.size() > prefix.size() && key.compare(0, prefix.size(), prefix) == 0) {
                const char next = key[prefix.size()];
                if (next == '-' || next == '_' || std::isdigit(static_cast<unsigned char>(next))) {
                    return family;
                }
            }
        }
        return std::nullopt;
    }

    SectionFamily inferFamilyFromDimensions(const NormalizedDimensions& dims) {
        const auto web = dims.webThickness();
        const auto flange = dims.flangeThickness();
        const auto wall = dims.secondaryValue("wall_thickness");
        const auto flangeWidth = dims.secondaryValue("flange_width");
        const auto outerHeight = dims.secondaryValue("outer_height");

        if (has(dims.diameter) && (has(wall) || has(dims.thickness))) {
            return SectionFamily::Pipe;
        }
        if (has(outerHeight) && has(dims.width) && has(wall)) {
            return SectionFamily::Box;
        }
        if (has(dims.width) && has(dims.height) && (has(dims.thickness) || has(wall))) {
            return SectionFamily::Box;
        }
        if (has(dims.overallDepth) && has(dims.overallWidth) && has(web) && has(flange)) {
            return SectionFamily::H;
        }
        if (has(dims.overallDepth) && has(flangeWidth) && has(web) && has(flange)) {
            return SectionFamily::C;
        }
        if (has(dims.depth) && has(dims.width) && has(dims.thickness) && !has(web) && !has(flange)) {
            return SectionFamily::L;
        }
        if (has(dims.diameter)) {
            return SectionFamily::Circle;
        }
        return SectionFamily::Rectangle;
    }

    SectionFamily classifySection(const SectionTypeHints& hints, const NormalizedDimensions* dims) {
        for (const auto* hint : { &hints.sectionType, &hints.profileType, &hints.steelShapeType }) {
            if (!hint->has_value()) continue;
            if (auto family = resolveFamilyAlias(**hint)) {
                return *family;
            }
        }
        if (dims) {
            return inferFamilyFromDimensions(*dims);
        }
        return SectionFamily::Rectangle;
    }

    double applyReferenceDirection(double baseRotationDeg, std::optional<bool> isReferenceDirection) {
        if (!isReferenceDirection.has_value() || *isReferenceDirection) {
            return baseRotationDeg;
        }
        double adjusted = std::fmod(baseRotationDeg + 90.0, 360.0);
        if (adjusted < 0.0) adjusted += 360.0;
        return adjusted;
    }

} // namespace StbGeom::Engine
