#include "GeneratorCommon.h"

#include <fmt/core.h>

namespace StbGeom::Engine::Generators {

    namespace {

        // Common shape of beams, girders, strip footings and braces.
        struct HorizontalMember {
            const std::string& id;
            ElementFamily family;
            const NodeRef& start;
            const NodeRef& end;
            const std::string& sectionId;
            glm::dvec3 offsetStart;
            glm::dvec3 offsetEnd;
            double rotation;
            BeamPlacementMode mode;
            SegmentLengths haunch;
            SegmentLengths joint;
        };

        ElementOutcome generateHorizontal(const HorizontalMember& member, const GenerationContext& context) {
            const auto start = resolveNode(member.start, context);
            const auto end = resolveNode(member.end, context);
            if (!start || !end) {
                return skipped(member.id, member.family, { SkipReason::MissingNodes,
                    fmt::format("unresolved {}", !start ? describeNode(member.start) : describeNode(member.end)) });
            }
            if (!allFinite({ *start, *end, member.offsetStart, member.offsetEnd })) {
                return skipped(member.id, member.family, { SkipReason::DegenerateGeometry, "non-finite node coordinates" });
            }

            Failure failure;
            const SectionRecord* section = findSection(member.sectionId, context, failure);
            if (!section) {
                return skipped(member.id, member.family, std::move(failure));
            }

            SectionGeometry geometry;
            if (!resolveSectionGeometry(*section, context, geometry, failure)) {
                return skipped(member.id, member.family, std::move(failure));
            }

            HorizontalPlacementInput input;
            input.start = *start;
            input.end = *end;
            input.startOffset = member.offsetStart;
            input.endOffset = member.offsetEnd;
            input.rollAngle = glm::radians(applyReferenceDirection(member.rotation, referenceDirectionOf(*section)));
            input.mode = member.mode;
            input.sectionHeight = geometry.sectionHeight;

            auto placement = computeHorizontalPlacement(input);
            if (!placement) {
                return skipped(member.id, member.family, { SkipReason::InvalidLength,
                    "start and end coincide after offsets" });
            }

            SolidShape shape;
            if (geometry.multiSection) {
                MultiSectionSpec spec = std::move(*geometry.multiSection);
                spec.segments = isJointTag(geometry.multiSectionTag) ? member.joint : member.haunch;
                auto lofted = buildLoftedSolid(spec, placement->length, context.options);
                if (!lofted) {
                    return skipped(member.id, member.family, { SkipReason::InsufficientSections,
                        fmt::format("section '{}' variants cannot be lofted", section->id) });
                }
                shape = std::move(*lofted);
            } else {
                shape = std::move(*geometry.profile);
            }

            ElementOutcome outcome;
            if (!emitSolid(outcome, member.id, member.family, SolidRole::Main, std::move(shape), *placement,
                    makeMetadata(*section, geometry), failure)) {
                return skipped(member.id, member.family, std::move(failure));
            }
            return outcome;
        }

    } // namespace

    ElementOutcome generateBeam(const BeamElement& element, const GenerationContext& context) {
        BeamPlacementMode mode = context.options.beamPlacementMode;
        if (element.family == ElementFamily::StripFooting) {
            mode = BeamPlacementMode::TopAligned;
        }
        if (element.placementMode) {
            mode = *element.placementMode;
        }

        SegmentLengths haunch{ element.haunchStart, element.haunchEnd };
        // Joint members without joint lengths reuse the haunch lengths.
        SegmentLengths joint{
            element.jointStart ? element.jointStart : element.haunchStart,
            element.jointEnd ? element.jointEnd : element.haunchEnd };

        HorizontalMember member{ element.id, element.family, element.start, element.end, element.sectionId,
            element.offsetStart, element.offsetEnd, element.rotation, mode, haunch, joint };
        return generateHorizontal(member, context);
    }

    ElementOutcome generateBrace(const BraceElement& element, const GenerationContext& context) {
        HorizontalMember member{ element.id, ElementFamily::Brace, element.start, element.end, element.sectionId,
            element.offsetStart, element.offsetEnd, element.rotation, BeamPlacementMode::Center,
            SegmentLengths{}, SegmentLengths{} };
        return generateHorizontal(member, context);
    }

} // namespace StbGeom::Engine::Generators
