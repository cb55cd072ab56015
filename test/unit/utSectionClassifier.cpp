#include "UnitTestCommon.h"

#include <engine/SectionClassifier.h>

using namespace StbGeom::Engine;

class utSectionClassifier : public ::testing::Test {
protected:
    static NormalizedDimensions dims(AttributeBag bag) {
        auto normalized = normalizeDimensions(bag);
        EXPECT_TRUE(normalized.has_value());
        return normalized.value_or(NormalizedDimensions{});
    }

    static SectionTypeHints sectionType(std::string type) {
        SectionTypeHints hints;
        hints.sectionType = std::move(type);
        return hints;
    }
};

TEST_F(utSectionClassifier, aliasesAreCaseInsensitive) {
    EXPECT_EQ(SectionFamily::H, *resolveFamilyAlias("wide_flange"));
    EXPECT_EQ(SectionFamily::Box, *resolveFamilyAlias(" rhs "));
    EXPECT_EQ(SectionFamily::Pipe, *resolveFamilyAlias("Tube"));
    EXPECT_EQ(SectionFamily::C, *resolveFamilyAlias("LipC"));
    EXPECT_EQ(SectionFamily::Rectangle, *resolveFamilyAlias("fb"));
    EXPECT_EQ(SectionFamily::Circle, *resolveFamilyAlias("ROUND-BAR"));
    EXPECT_EQ(SectionFamily::CrossH, *resolveFamilyAlias("+"));
    EXPECT_EQ(SectionFamily::L, *resolveFamilyAlias("angle"));
    EXPECT_EQ(SectionFamily::T, *resolveFamilyAlias("TEE"));
}

TEST_F(utSectionClassifier, catalogNamesResolveByPrefix) {
    EXPECT_EQ(SectionFamily::H, *resolveFamilyAlias("H-400x200x8x13"));
    EXPECT_EQ(SectionFamily::Box, *resolveFamilyAlias("BCR295-400x400x22"));
    EXPECT_EQ(SectionFamily::Pipe, *resolveFamilyAlias("P-165.2x5"));
    EXPECT_EQ(SectionFamily::CrossH, *resolveFamilyAlias("CROSS-H-400x200"));
    EXPECT_EQ(SectionFamily::L, *resolveFamilyAlias("L-65x65x6"));
    EXPECT_EQ(SectionFamily::C, *resolveFamilyAlias("C100x50"));
}

TEST_F(utSectionClassifier, unknownAndEmptyNeverResolve) {
    EXPECT_FALSE(resolveFamilyAlias(""));
    EXPECT_FALSE(resolveFamilyAlias("   "));
    EXPECT_FALSE(resolveFamilyAlias("unknown"));
    EXPECT_FALSE(resolveFamilyAlias("HOLLOWCORE"));
}

TEST_F(utSectionClassifier, hintsWinOverDimensions) {
    const auto pipeLike = dims({ { "D", 200.0 }, { "t", 8.0 } });
    EXPECT_EQ(SectionFamily::H, classifySection(sectionType("H"), &pipeLike));

    SectionTypeHints hints;
    hints.sectionType = std::string("UNKNOWN");
    hints.profileType = std::string("BOX");
    hints.steelShapeType = std::string("PIPE");
    EXPECT_EQ(SectionFamily::Box, classifySection(hints, &pipeLike));

    hints.profileType = std::string("");
    EXPECT_EQ(SectionFamily::Pipe, classifySection(hints, &pipeLike));
}

TEST_F(utSectionClassifier, inferenceFromDimensions) {
    EXPECT_EQ(SectionFamily::Pipe, inferFamilyFromDimensions(dims({ { "D", 200.0 }, { "t", 8.0 } })));
    EXPECT_EQ(SectionFamily::Box, inferFamilyFromDimensions(
        dims({ { "width", 300.0 }, { "outer_height", 300.0 }, { "wall_thickness", 12.0 } })));
    EXPECT_EQ(SectionFamily::Box, inferFamilyFromDimensions(dims({ { "B", 300.0 }, { "H", 300.0 }, { "t", 12.0 } })));
    EXPECT_EQ(SectionFamily::H, inferFamilyFromDimensions(
        dims({ { "A", 400.0 }, { "B", 200.0 }, { "t1", 8.0 }, { "t2", 13.0 } })));
    EXPECT_EQ(SectionFamily::C, inferFamilyFromDimensions(
        dims({ { "overall_depth", 300.0 }, { "flange_width", 90.0 }, { "t1", 9.0 }, { "t2", 13.0 } })));
    // Width, height and a wall thickness read as a box before the angle rule.
    EXPECT_EQ(SectionFamily::Box, inferFamilyFromDimensions(dims({ { "width", 65.0 }, { "depth", 65.0 }, { "t", 6.0 } })));
    EXPECT_EQ(SectionFamily::Box, inferFamilyFromDimensions(
        dims({ { "width", 250.0 }, { "height", 250.0 }, { "wall_thickness", 9.0 } })));
    EXPECT_EQ(SectionFamily::Circle, inferFamilyFromDimensions(dims({ { "D", 500.0 } })));
    EXPECT_EQ(SectionFamily::Rectangle, inferFamilyFromDimensions(dims({ { "B", 500.0 }, { "H", 800.0 } })));
}

TEST_F(utSectionClassifier, alwaysReturnsAFamily) {
    EXPECT_EQ(SectionFamily::Rectangle, classifySection(SectionTypeHints{}, nullptr));
    EXPECT_EQ(SectionFamily::Rectangle, inferFamilyFromDimensions(NormalizedDimensions{}));
    EXPECT_EQ(SectionFamily::Rectangle, classifySection(sectionType("SOMETHING-ELSE"), nullptr));
}

TEST_F(utSectionClassifier, familyNames) {
    EXPECT_STREQ("CROSS_H", sectionFamilyName(SectionFamily::CrossH));
    EXPECT_STREQ("PIPE", sectionFamilyName(SectionFamily::Pipe));
}

TEST_F(utSectionClassifier, referenceDirectionRule) {
    EXPECT_DOUBLE_EQ(30.0, applyReferenceDirection(30.0, std::nullopt));
    EXPECT_DOUBLE_EQ(30.0, applyReferenceDirection(30.0, true));
    EXPECT_DOUBLE_EQ(120.0, applyReferenceDirection(30.0, false));
    EXPECT_DOUBLE_EQ(30.0, applyReferenceDirection(300.0, false));
    EXPECT_DOUBLE_EQ(0.0, applyReferenceDirection(270.0, false));
    EXPECT_DOUBLE_EQ(0.0, applyReferenceDirection(-90.0, false));
}
