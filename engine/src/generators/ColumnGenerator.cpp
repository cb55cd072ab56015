#include "GeneratorCommon.h"

#include <fmt/core.h>
#include <glm/gtc/constants.hpp>

namespace StbGeom::Engine::Generators {

    namespace {

        constexpr const char* kComponent = "ColumnGenerator";

        // Encasing concrete of SRC/CFT sections, rectangular or circular.
        void appendConcrete(ElementOutcome& outcome, const ColumnElement& element, const SectionRecord& section,
            const Placement& placement, const GenerationContext& context)
        {
            auto dims = normalizeDimensions(*section.concrete);
            if (!dims) {
                context.logger.warn(kComponent, "{}: concrete of section '{}' has no dimensions, skipped",
                    element.id, section.id);
                return;
            }
            const SectionFamily family = classifySection(SectionTypeHints{}, &*dims);
            auto profile = buildProfile(mapProfileParameters(&*dims, family), context.options.circleSegments);
            if (!profile) {
                context.logger.warn(kComponent, "{}: concrete outline of section '{}' is degenerate",
                    element.id, section.id);
                return;
            }

            SolidMetadata metadata;
            metadata.profileSource = ProfileSource::Calculator;
            metadata.family = family;
            metadata.sectionId = section.id;
            metadata.rawSection = *section.concrete;

            Failure failure;
            if (!emitSolid(outcome, element.id, element.family, SolidRole::Concrete, std::move(*profile),
                    placement, std::move(metadata), failure)) {
                context.logger.warn(kComponent, "{}: concrete solid dropped: {}", element.id, failure.detail);
            }
        }

        // Plate of B_X x B_Y x t under the bottom node, turned with the column.
        void appendBasePlate(ElementOutcome& outcome, const ColumnElement& element, const SectionRecord& section,
            const glm::dvec3& bottom, double rollAngle, const GenerationContext& context)
        {
            const AttributeBag& plate = *section.basePlate;
            const auto width = plate.firstNumber({ "B_X", "width_X", "B" });
            const auto depth = plate.firstNumber({ "B_Y", "width_Y", "D" });
            const auto thickness = plate.firstNumber({ "t", "thickness" });
            if (!width || !depth || !thickness || *width <= 0.0 || *depth <= 0.0 || *thickness <= 0.0) {
                context.logger.warn(kComponent, "{}: base plate of section '{}' needs positive B_X, B_Y and t",
                    element.id, section.id);
                return;
            }
            const glm::dvec3 offset(plate.number("offset_X").value_or(0.0), plate.number("offset_Y").value_or(0.0), 0.0);
            const glm::dvec3 top = bottom + offset;
            const glm::dvec3 under = top - glm::dvec3(0.0, 0.0, *thickness);

            auto placement = computeVerticalPlacement(under, top, glm::dvec2(0.0), glm::dvec2(0.0), rollAngle);
            if (!placement) {
                context.logger.warn(kComponent, "{}: base plate placement failed", element.id);
                return;
            }

            SolidMetadata metadata;
            metadata.profileSource = ProfileSource::Calculator;
            metadata.family = SectionFamily::Rectangle;
            metadata.sectionId = section.id;
            metadata.rawSection = plate;

            Failure failure;
            if (!emitSolid(outcome, element.id, element.family, SolidRole::BasePlate,
                    rectangleProfile(*width, *depth), *placement, std::move(metadata), failure)) {
                context.logger.warn(kComponent, "{}: base plate dropped: {}", element.id, failure.detail);
            }
        }

    } // namespace

    ElementOutcome generateColumn(const ColumnElement& element, const GenerationContext& context) {
        const auto bottom = resolveNode(element.bottom, context);
        const auto top = resolveNode(element.top, context);
        if (!bottom || !top) {
            return skipped(element.id, element.family, { SkipReason::MissingNodes,
                fmt::format("unresolved {}", !bottom ? describeNode(element.bottom) : describeNode(element.top)) });
        }
        if (!allFinite({ *bottom, *top })) {
            return skipped(element.id, element.family, { SkipReason::DegenerateGeometry, "non-finite node coordinates" });
        }

        Failure failure;
        const SectionRecord* section = findSection(element.sectionId, context, failure);
        if (!section) {
            return skipped(element.id, element.family, std::move(failure));
        }

        SectionGeometry geometry;
        if (!resolveSectionGeometry(*section, context, geometry, failure)) {
            return skipped(element.id, element.family, std::move(failure));
        }

        const double rollDeg = applyReferenceDirection(element.rotation, referenceDirectionOf(*section));
        const double roll = glm::radians(rollDeg);
        auto placement = computeVerticalPlacement(*bottom, *top, element.offsetBottom, element.offsetTop, roll);
        if (!placement) {
            return skipped(element.id, element.family, { SkipReason::InvalidLength,
                "bottom and top coincide after offsets" });
        }

        SolidShape shape;
        if (geometry.multiSection) {
            auto lofted = buildLoftedSolid(*geometry.multiSection, placement->length, context.options);
            if (!lofted) {
                return skipped(element.id, element.family, { SkipReason::InsufficientSections,
                    fmt::format("section '{}' variants cannot be lofted", section->id) });
            }
            shape = std::move(*lofted);
        } else {
            shape = std::move(*geometry.profile);
        }

        ElementOutcome outcome;
        if (!emitSolid(outcome, element.id, element.family, SolidRole::Main, std::move(shape), *placement,
                makeMetadata(*section, geometry), failure)) {
            return skipped(element.id, element.family, std::move(failure));
        }
        if (section->concrete) {
            appendConcrete(outcome, element, *section, *placement, context);
        }
        if (section->basePlate) {
            appendBasePlate(outcome, element, *section, *bottom + glm::dvec3(element.offsetBottom, 0.0), roll, context);
        }
        return outcome;
    }

} // namespace StbGeom::Engine::Generators
