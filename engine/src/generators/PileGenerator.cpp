#include "GeneratorCommon.h"

#include <fmt/core.h>
#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace StbGeom::Engine::Generators {

    namespace {

        constexpr const char* kComponent = "PileGenerator";

        struct DiameterStation {
            double z;
            double diameter;
        };

        // Axial length over which an enlarged diameter returns to the shaft.
        double taperLength(double extended, double axial, double angleDeg) {
            if (!(angleDeg > 0.0) || angleDeg >= 90.0) return 0.0;
            return std::abs(extended - axial) / 2.0 / std::tan(glm::radians(angleDeg));
        }

        // Diameter stations measured from the pile foot (z = 0) to the head.
        // A zone without a taper angle tapers linearly to the next station.
        std::vector<DiameterStation> pileDiameterStations(const ExtendedPileSections& s, double length) {
            std::vector<DiameterStation> raw;
            if (s.footDiameter) {
                raw.push_back({ 0.0, *s.footDiameter });
                if (s.footLength > 0.0) raw.push_back({ s.footLength, *s.footDiameter });
                const double taper = taperLength(*s.footDiameter, s.axialDiameter, s.footTaperAngle);
                if (taper > 0.0) raw.push_back({ s.footLength + taper, s.axialDiameter });
            } else {
                raw.push_back({ 0.0, s.axialDiameter });
            }

            if (s.topDiameter) {
                const double topStart = length - s.topLength;
                const double taper = taperLength(*s.topDiameter, s.axialDiameter, s.topTaperAngle);
                if (taper > 0.0) raw.push_back({ topStart - taper, s.axialDiameter });
                if (s.topLength > 0.0) raw.push_back({ topStart, *s.topDiameter });
                raw.push_back({ length, *s.topDiameter });
            } else {
                raw.push_back({ length, s.axialDiameter });
            }

            // Zones longer than the pile are clipped, out-of-order stations dropped.
            std::vector<DiameterStation> out;
            for (auto station : raw) {
                station.z = std::clamp(station.z, 0.0, length);
                if (!out.empty() && station.z <= out.back().z) {
                    if (station.z == length && out.back().z == length) out.back() = station;
                    continue;
                }
                out.push_back(station);
            }
            return out;
        }

        std::optional<LoftedSolid> extendedPileSolid(const ExtendedPileSections& sections, double length,
            const GenerationContext& context)
        {
            std::vector<SolidStation> stations;
            for (const auto& station : pileDiameterStations(sections, length)) {
                auto profile = buildProfile(CircleParams{ station.diameter / 2.0 }, context.options.circleSegments);
                if (!profile) return std::nullopt;
                stations.push_back({ station.z, std::move(*profile) });
            }
            return buildLoftedSolid(std::move(stations), length);
        }

    } // namespace

    ElementOutcome generatePile(const PileElement& element, const GenerationContext& context) {
        const ElementFamily family = ElementFamily::Pile;
        auto head = resolveNode(element.top, context);
        if (!head) {
            return skipped(element.id, family, { SkipReason::MissingNodes,
                fmt::format("unresolved {}", describeNode(element.top)) });
        }
        std::optional<glm::dvec3> foot;
        if (element.bottom) {
            foot = resolveNode(*element.bottom, context);
            if (!foot) {
                return skipped(element.id, family, { SkipReason::MissingNodes,
                    fmt::format("unresolved {}", describeNode(*element.bottom)) });
            }
        }

        Failure failure;
        const SectionRecord* section = findSection(element.sectionId, context, failure);
        if (!section) {
            return skipped(element.id, family, std::move(failure));
        }

        const auto dims = normalizeDimensions(section->attributes);
        std::optional<ExtendedPileSections> extended;
        if (dims) extended = extendedPileSections(*dims);

        SectionGeometry geometry;
        if (!extended && !resolveSectionGeometry(*section, context, geometry, failure)) {
            return skipped(element.id, family, std::move(failure));
        }

        glm::dvec3 top = *head + glm::dvec3(element.offset, 0.0);
        if (element.levelTop) top.z = *element.levelTop;
        glm::dvec3 bottom;
        if (foot) {
            bottom = *foot + glm::dvec3(element.offset, 0.0);
        } else {
            std::optional<double> length = element.lengthAll;
            if (!length && dims) length = dims->pileLength;
            if (!length) length = section->attributes.number("length_all");
            if (!length) {
                double diameter = 0.0;
                if (extended) diameter = extended->axialDiameter;
                else if (dims && dims->diameter) diameter = *dims->diameter;
                else if (geometry.profile) diameter = profileBounds(*geometry.profile).size().x;
                length = diameter * context.options.pileLengthFactor;
                context.logger.info(kComponent, "{}: no pile length, estimated {} mm", element.id, *length);
            }
            bottom = top - glm::dvec3(0.0, 0.0, *length);
        }
        if (!allFinite({ top, bottom })) {
            return skipped(element.id, family, { SkipReason::DegenerateGeometry, "non-finite pile coordinates" });
        }

        const double roll = glm::radians(applyReferenceDirection(element.rotation, referenceDirectionOf(*section)));
        auto placement = computeVerticalPlacement(bottom, top, glm::dvec2(0.0), glm::dvec2(0.0), roll);
        if (!placement) {
            return skipped(element.id, family, { SkipReason::InvalidLength, "pile head and foot coincide" });
        }

        ElementOutcome outcome;
        if (extended) {
            auto lofted = extendedPileSolid(*extended, placement->length, context);
            if (!lofted) {
                return skipped(element.id, family, { SkipReason::InsufficientSections,
                    fmt::format("extended pile section '{}' cannot be lofted", section->id) });
            }
            SolidMetadata metadata;
            metadata.profileSource = ProfileSource::Calculator;
            metadata.family = SectionFamily::Circle;
            metadata.sectionId = section->id;
            metadata.rawSection = section->attributes;
            metadata.pileType = dims->pileType;
            if (!emitSolid(outcome, element.id, family, SolidRole::Main, std::move(*lofted), *placement,
                    std::move(metadata), failure)) {
                return skipped(element.id, family, std::move(failure));
            }
            return outcome;
        }

        SolidShape shape;
        if (geometry.multiSection) {
            auto lofted = buildLoftedSolid(*geometry.multiSection, placement->length, context.options);
            if (!lofted) {
                return skipped(element.id, family, { SkipReason::InsufficientSections,
                    fmt::format("section '{}' variants cannot be lofted", section->id) });
            }
            shape = std::move(*lofted);
        } else {
            shape = std::move(*geometry.profile);
        }
        if (!emitSolid(outcome, element.id, family, SolidRole::Main, std::move(shape), *placement,
                makeMetadata(*section, geometry), failure)) {
            return skipped(element.id, family, std::move(failure));
        }
        return outcome;
    }

} // namespace StbGeom::Engine::Generators
