#include "GeneratorCommon.h"

#include <fmt/core.h>
#include <algorithm>
#include <cmath>

namespace StbGeom::Engine::Generators {

    namespace {

        constexpr const char* kComponent = "Orchestrator";

        std::optional<std::string> nonEmpty(const std::optional<std::string>& text) {
            if (!text || text->empty()) return std::nullopt;
            return text;
        }

        // Circular members keep their axis on the anchor line.
        double alignmentHeight(SectionFamily family, const Profile& profile) {
            if (family == SectionFamily::Circle || family == SectionFamily::Pipe) {
                return 0.0;
            }
            return profileBounds(profile).size().y;
        }

        // CROSS_H sections name one catalog H shape per arm.
        void addCrossHArms(const SectionRecord& section, const GenerationContext& context, AttributeBag& bag) {
            auto shapeX = nonEmpty(section.attributes.text("crossH_shapeX"));
            if (!shapeX) return;
            auto shapeY = nonEmpty(section.attributes.text("crossH_shapeY"));

            const SteelShapeRecord* armX = context.steelShapes.findSteelShape(*shapeX);
            const SteelShapeRecord* armY = context.steelShapes.findSteelShape(shapeY ? *shapeY : *shapeX);
            if (!armX) {
                context.logger.warn(kComponent, "section '{}': CROSS_H arm shape '{}' not found, using defaults",
                    section.id, *shapeX);
                return;
            }
            if (!armY) armY = armX;

            auto copy = [&bag](const SteelShapeRecord& shape, std::initializer_list<std::string_view> keys, const char* target) {
                if (auto value = shape.dimensions.firstNumber(keys)) {
                    bag.set(target, *value);
                }
            };
            copy(*armX, { "H", "A" }, "overall_depth_X");
            copy(*armX, { "B" }, "overall_width_X");
            copy(*armY, { "H", "A" }, "overall_depth_Y");
            copy(*armY, { "B" }, "overall_width_Y");
            if (!bag.contains("H")) copy(*armX, { "H", "A" }, "H");
            if (!bag.contains("B")) copy(*armX, { "B" }, "B");
            if (!bag.contains("t1")) copy(*armX, { "t1", "tw" }, "t1");
            if (!bag.contains("t2")) copy(*armX, { "t2", "tf" }, "t2");
        }

    } // namespace

    std::optional<glm::dvec3> resolveNode(const NodeRef& ref, const GenerationContext& context) {
        if (const auto* raw = std::get_if<glm::dvec3>(&ref)) {
            return *raw;
        }
        return context.nodes.findNode(std::get<std::string>(ref));
    }

    bool allFinite(std::initializer_list<glm::dvec3> points) {
        return std::all_of(points.begin(), points.end(), [](const glm::dvec3& p) { return isFinite(p); });
    }

    std::string describeNode(const NodeRef& ref) {
        if (const auto* raw = std::get_if<glm::dvec3>(&ref)) {
            return fmt::format("raw ({}, {}, {})", raw->x, raw->y, raw->z);
        }
        return fmt::format("node '{}'", std::get<std::string>(ref));
    }

    const SectionRecord* findSection(const std::string& sectionId, const GenerationContext& context, Failure& failure) {
        if (sectionId.empty()) {
            failure = { SkipReason::MissingSection, "no section reference" };
            return nullptr;
        }
        const SectionRecord* section = context.sections.findSection(sectionId);
        if (!section) {
            failure = { SkipReason::MissingSection, fmt::format("section '{}' not found", sectionId) };
        }
        return section;
    }

    std::optional<Profile> profileForSteelShape(const SteelShapeRecord& shape, const GenerationContext& context,
        SectionFamily* family)
    {
        auto dims = normalizeDimensions(shape.dimensions);
        SectionTypeHints hints;
        hints.steelShapeType = nonEmpty(shape.typeTag);
        const SectionFamily resolved = classifySection(hints, dims ? &*dims : nullptr);
        if (family) *family = resolved;
        return buildProfile(mapProfileParameters(dims ? &*dims : nullptr, resolved), context.options.circleSegments);
    }

    bool resolveSectionGeometry(const SectionRecord& section, const GenerationContext& context,
        SectionGeometry& out, Failure& failure)
    {
        const VariantExpansion expansion = expandSectionVariants(section.variantMarkup);
        const auto& variants = !expansion.variants.empty() ? expansion.variants : expansion.multiSection;

        if (!variants.empty()) {
            MultiSectionSpec spec;
            std::optional<SectionFamily> family;
            double height = 0.0;
            for (const auto& descriptor : variants) {
                const SteelShapeRecord* shape = context.steelShapes.findSteelShape(descriptor.shape);
                if (!shape) {
                    context.logger.warn(kComponent, "section '{}': steel shape '{}' not found for {} variant",
                        section.id, descriptor.shape, axialPositionName(descriptor.position.kind));
                    continue;
                }
                SectionFamily shapeFamily = SectionFamily::Rectangle;
                auto profile = profileForSteelShape(*shape, context, &shapeFamily);
                if (!profile) {
                    context.logger.warn(kComponent, "section '{}': steel shape '{}' gives no valid outline",
                        section.id, descriptor.shape);
                    continue;
                }
                if (family && *family != shapeFamily) {
                    context.logger.warn(kComponent, "section '{}': variant '{}' is {} but the member is {}",
                        section.id, descriptor.shape, sectionFamilyName(shapeFamily), sectionFamilyName(*family));
                    continue;
                }
                family = shapeFamily;
                height = std::max(height, alignmentHeight(shapeFamily, *profile));
                spec.sections.push_back({ descriptor.position, std::move(*profile) });
            }
            if (spec.sections.size() < 2) {
                failure = { SkipReason::InsufficientSections,
                    fmt::format("section '{}' has {} usable of {} variant sections",
                        section.id, spec.sections.size(), variants.size()) };
                return false;
            }
            out.family = *family;
            out.source = ProfileSource::IfcEquivalent;
            out.steelShape = expansion.primaryShape();
            out.multiSection = std::move(spec);
            out.multiSectionTag = variants.front().tag;
            out.sectionHeight = height;
            return true;
        }

        const SteelShapeRecord* steel = nullptr;
        if (expansion.uniform) {
            steel = context.steelShapes.findSteelShape(expansion.uniform->shape);
            if (!steel) {
                context.logger.warn(kComponent, "section '{}': steel shape '{}' not found, using section attributes",
                    section.id, expansion.uniform->shape);
            }
        }
        if (!steel && section.steelShape) {
            steel = &*section.steelShape;
        }

        AttributeBag bag = steel ? steel->dimensions : section.attributes;
        addCrossHArms(section, context, bag);
        out.dims = normalizeDimensions(bag);

        SectionTypeHints hints;
        hints.sectionType = nonEmpty(section.attributes.text("section_type"));
        hints.profileType = nonEmpty(section.attributes.text("profile_type"));
        if (steel) hints.steelShapeType = nonEmpty(steel->typeTag);

        const NormalizedDimensions* dims = out.dims ? &*out.dims : nullptr;
        out.family = classifySection(hints, dims);
        if (!dims || !dims->hasSectionSize()) {
            out.source = ProfileSource::Fallback;
            context.logger.warn(kComponent, "section '{}': no dimensions, using {} defaults",
                section.id, sectionFamilyName(out.family));
        } else {
            out.source = steel ? ProfileSource::IfcEquivalent : ProfileSource::Calculator;
        }
        if (dims) {
            for (const auto& issue : validateDimensions(*dims)) {
                context.logger.warn(kComponent, "section '{}': {} = {} is not a positive dimension",
                    section.id, issue.field, issue.value);
            }
        }
        if (steel) out.steelShape = steel->name;

        out.profile = buildProfile(mapProfileParameters(dims, out.family), context.options.circleSegments);
        if (!out.profile) {
            failure = { SkipReason::DegenerateProfile,
                fmt::format("section '{}': {} parameters do not form a valid outline",
                    section.id, sectionFamilyName(out.family)) };
            return false;
        }
        out.sectionHeight = alignmentHeight(out.family, *out.profile);
        return true;
    }

    SolidMetadata makeMetadata(const SectionRecord& section, const SectionGeometry& geometry) {
        SolidMetadata metadata;
        metadata.profileSource = geometry.source;
        metadata.family = geometry.family;
        metadata.sectionId = section.id;
        metadata.rawSection = section.attributes;
        metadata.steelShape = geometry.steelShape;
        return metadata;
    }

    bool emitSolid(ElementOutcome& outcome, const std::string& elementId, ElementFamily family, SolidRole role,
        SolidShape shape, const Placement& placement, SolidMetadata metadata, Failure& failure)
    {
        if (const auto* profile = std::get_if<Profile>(&shape)) {
            if (!isProfileUsable(*profile)) {
                failure = { SkipReason::DegenerateProfile,
                    fmt::format("{} profile has {} vertices and area {}",
                        solidRoleName(role), profile->outer.size(), netArea(*profile)) };
                return false;
            }
        } else if (std::get<LoftedSolid>(shape).stations.size() < 2) {
            failure = { SkipReason::InsufficientSections, "lofted solid has fewer than two stations" };
            return false;
        }

        if (!std::isfinite(placement.length) || !(placement.length > 0.0)) {
            failure = { SkipReason::InvalidLength, fmt::format("placement length {}", placement.length) };
            return false;
        }
        if (!isPlacementValid(placement)) {
            failure = { SkipReason::DegenerateGeometry, "placement has non-finite components" };
            return false;
        }

        GeneratedSolid solid;
        solid.elementId = elementId;
        solid.family = family;
        solid.role = role;
        solid.shape = std::move(shape);
        solid.placement = placement;
        solid.metadata = std::move(metadata);
        outcome.solids.push_back(std::move(solid));
        return true;
    }

    ElementOutcome skipped(const std::string& elementId, ElementFamily family, Failure failure) {
        ElementOutcome outcome;
        outcome.skipped = SkippedElement{ elementId, family, failure.reason, std::move(failure.detail) };
        return outcome;
    }

} // namespace StbGeom::Engine::Generators
