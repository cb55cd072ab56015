#include "GeneratorCommon.h"

#include <fmt/core.h>

namespace StbGeom::Engine::Generators {

    namespace {
        constexpr double kDefaultWidth = 1000.0;
        constexpr double kDefaultDepth = 1500.0;

        double positiveOr(std::optional<double> value, double fallback) {
            return value && *value > 0.0 ? *value : fallback;
        }
    }

    ElementOutcome generateFooting(const FootingElement& element, const GenerationContext& context) {
        const ElementFamily family = ElementFamily::Footing;
        const auto node = resolveNode(element.node, context);
        if (!node) {
            return skipped(element.id, family, { SkipReason::MissingNodes,
                fmt::format("unresolved {}", describeNode(element.node)) });
        }

        Failure failure;
        const SectionRecord* section = findSection(element.sectionId, context, failure);
        if (!section) {
            return skipped(element.id, family, std::move(failure));
        }

        // Footing sections are read directly: width_Y and depth would collide
        // in the generic width/height aliases.
        const AttributeBag& attrs = section->attributes;
        const double widthX = positiveOr(attrs.firstNumber({ "width_X", "outer_width", "width" }), kDefaultWidth);
        const double widthY = positiveOr(attrs.firstNumber({ "width_Y", "outer_depth" }), kDefaultWidth);
        const double depth = positiveOr(attrs.firstNumber({ "depth", "height" }), kDefaultDepth);

        glm::dvec3 bottom = *node + glm::dvec3(element.offset, 0.0);
        bottom.z = element.levelBottom ? *element.levelBottom : node->z - depth;
        const glm::dvec3 top = bottom + glm::dvec3(0.0, 0.0, depth);
        if (!allFinite({ bottom, top })) {
            return skipped(element.id, family, { SkipReason::DegenerateGeometry, "non-finite footing coordinates" });
        }

        auto placement = computeVerticalPlacement(bottom, top, glm::dvec2(0.0), glm::dvec2(0.0),
            glm::radians(element.rotation));
        if (!placement) {
            return skipped(element.id, family, { SkipReason::InvalidLength, "footing has no depth" });
        }

        SolidMetadata metadata;
        metadata.profileSource = attrs.empty() ? ProfileSource::Fallback : ProfileSource::Calculator;
        metadata.family = SectionFamily::Rectangle;
        metadata.sectionId = section->id;
        metadata.rawSection = attrs;

        ElementOutcome outcome;
        if (!emitSolid(outcome, element.id, family, SolidRole::Main, rectangleProfile(widthX, widthY), *placement,
                std::move(metadata), failure)) {
            return skipped(element.id, family, std::move(failure));
        }
        return outcome;
    }

} // namespace StbGeom::Engine::Generators
