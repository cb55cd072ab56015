#pragma once

#include "engine/ElementGenerator.h"
#include "engine/DimensionNormalizer.h"
#include "engine/ProfileBuilder.h"
#include "engine/SectionClassifier.h"
#include "engine/TaperedSolid.h"

#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace StbGeom::Engine::Generators {

    struct Failure {
        SkipReason reason = SkipReason::DegenerateGeometry;
        std::string detail;
    };

    // Cross-section(s) resolved for one section record.
    struct SectionGeometry {
        SectionFamily family = SectionFamily::Rectangle;
        ProfileSource source = ProfileSource::Calculator;
        std::optional<NormalizedDimensions> dims;
        std::optional<std::string> steelShape;

        // Exactly one of the two is set.
        std::optional<Profile> profile;
        std::optional<MultiSectionSpec> multiSection;
        // Markup tag of the multi-section variants (haunch vs joint).
        std::string multiSectionTag;

        // Depth used for top alignment of horizontal members.
        double sectionHeight = 0.0;
    };

    std::optional<glm::dvec3> resolveNode(const NodeRef& ref, const GenerationContext& context);

    bool allFinite(std::initializer_list<glm::dvec3> points);

    // "node 'N12'" or "raw (x, y, z)" for log lines.
    std::string describeNode(const NodeRef& ref);

    const SectionRecord* findSection(const std::string& sectionId, const GenerationContext& context, Failure& failure);

    // Variant markup first (NotSame or beam multi-section gives a lofted
    // section), then the uniform steel shape, then the section's own attributes.
    bool resolveSectionGeometry(const SectionRecord& section, const GenerationContext& context,
        SectionGeometry& out, Failure& failure);

    // Profile of a single named steel shape.
    std::optional<Profile> profileForSteelShape(const SteelShapeRecord& shape, const GenerationContext& context,
        SectionFamily* family = nullptr);

    SolidMetadata makeMetadata(const SectionRecord& section, const SectionGeometry& geometry);

    // Validates and appends one solid. false with failure set when the profile
    // or placement does not qualify.
    bool emitSolid(ElementOutcome& outcome, const std::string& elementId, ElementFamily family, SolidRole role,
        SolidShape shape, const Placement& placement, SolidMetadata metadata, Failure& failure);

    ElementOutcome skipped(const std::string& elementId, ElementFamily family, Failure failure);

    // Per-family generators.
    ElementOutcome generateColumn(const ColumnElement& element, const GenerationContext& context);
    ElementOutcome generateBeam(const BeamElement& element, const GenerationContext& context);
    ElementOutcome generateBrace(const BraceElement& element, const GenerationContext& context);
    ElementOutcome generatePile(const PileElement& element, const GenerationContext& context);
    ElementOutcome generateFooting(const FootingElement& element, const GenerationContext& context);
    ElementOutcome generateSlab(const SlabElement& element, const GenerationContext& context);
    ElementOutcome generateWall(const WallElement& element, const GenerationContext& context);

} // namespace StbGeom::Engine::Generators
