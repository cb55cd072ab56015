#include "UnitTestCommon.h"

#include <engine/VariantExpander.h>

using namespace StbGeom::Engine;

class utVariantExpander : public ::testing::Test {
protected:
    static MarkupNode node(std::string tag, AttributeBag attributes, std::vector<MarkupNode> children = {}) {
        MarkupNode n;
        n.tag = std::move(tag);
        n.attributes = std::move(attributes);
        n.children = std::move(children);
        return n;
    }
};

TEST_F(utVariantExpander, sameWinsOverNotSame) {
    const std::vector<MarkupNode> markup = {
        node("StbSecSteelFigureColumn_S", {}, {
            node("StbSecSteelColumn_S_NotSame", { { "shape", std::string("BOX-400") }, { "pos", std::string("BOTTOM") } }),
            node("StbSecSteelColumn_S_NotSame", { { "shape", std::string("BOX-350") }, { "pos", std::string("TOP") } }),
            node("StbSecSteelColumn_S_Same", { { "shape", std::string("BOX-300") }, { "strength_main", std::string("SN490B") } }),
        }) };
    const VariantExpansion expansion = expandSectionVariants(markup);
    ASSERT_TRUE(expansion.uniform);
    EXPECT_EQ(VariantCategory::Same, expansion.uniform->category);
    EXPECT_EQ("BOX-300", expansion.uniform->shape);
    EXPECT_EQ("SN490B", *expansion.uniform->strengthMain);
    EXPECT_TRUE(expansion.variants.empty());
    EXPECT_EQ("BOX-300", expansion.primaryShape());
}

TEST_F(utVariantExpander, notSameKeepsDocumentOrderAndDefaultsToTop) {
    const std::vector<MarkupNode> markup = {
        node("StbSecSteelColumn_S_NotSame", { { "shape", std::string("BOX-400") }, { "pos", std::string("bottom") } }),
        node("StbSecSteelColumn_S_NotSame", { { "shape", std::string("BOX-350") }, { "strength", std::string("SN400") } }),
        node("StbSecSteelColumn_S_NotSame", { { "pos", std::string("CENTER") } }),
    };
    const VariantExpansion expansion = expandSectionVariants(markup);
    ASSERT_EQ(2u, expansion.variants.size());
    EXPECT_EQ(AxialPosition::Kind::Bottom, expansion.variants[0].position.kind);
    EXPECT_EQ(AxialPosition::Kind::Top, expansion.variants[1].position.kind);
    EXPECT_EQ("SN400", *expansion.variants[1].strengthMain);
    EXPECT_FALSE(expansion.uniform);
}

TEST_F(utVariantExpander, beamMultiSectionDefaultsToCenter) {
    const std::vector<MarkupNode> markup = {
        node("StbSecSteelBeam_S_Haunch", { { "shape", std::string("H-600x200") }, { "pos", std::string("START") } }),
        node("StbSecSteelBeam_S_Haunch", { { "shape", std::string("H-400x200") } }),
        node("StbSecSteelBeam_S_Haunch", { { "shape", std::string("H-600x200") }, { "pos", std::string("END") } }),
    };
    const VariantExpansion expansion = expandSectionVariants(markup);
    ASSERT_EQ(3u, expansion.multiSection.size());
    EXPECT_EQ(AxialPosition::Kind::Start, expansion.multiSection[0].position.kind);
    EXPECT_EQ(AxialPosition::Kind::Center, expansion.multiSection[1].position.kind);
    EXPECT_EQ(AxialPosition::Kind::End, expansion.multiSection[2].position.kind);
    EXPECT_FALSE(isJointTag(expansion.multiSection[0].tag));
}

TEST_F(utVariantExpander, taperNamesBothEnds) {
    const std::vector<MarkupNode> markup = {
        node("StbSecSteelBeam_S_Taper", { { "start_shape", std::string("H-600x200") }, { "end_shape", std::string("H-400x200") } }),
    };
    const VariantExpansion expansion = expandSectionVariants(markup);
    ASSERT_EQ(2u, expansion.multiSection.size());
    EXPECT_EQ("H-600x200", expansion.multiSection[0].shape);
    EXPECT_EQ(AxialPosition::Kind::Start, expansion.multiSection[0].position.kind);
    EXPECT_EQ("H-400x200", expansion.multiSection[1].shape);
    EXPECT_EQ(AxialPosition::Kind::End, expansion.multiSection[1].position.kind);
}

TEST_F(utVariantExpander, beamNotSameNamesBothEnds) {
    const std::vector<MarkupNode> markup = {
        node("StbSecSteelFigureBeam_S", {}, {
            node("StbSecSteelBeamNotSame", { { "shape", std::string("H-600x200") }, { "pos", std::string("START") } }),
            node("StbSecSteelBeamNotSame", { { "shape", std::string("H-400x200") }, { "pos", std::string("END") } }),
        }) };
    const VariantExpansion expansion = expandSectionVariants(markup);
    ASSERT_EQ(2u, expansion.variants.size());
    EXPECT_EQ(VariantCategory::NotSame, expansion.variants[0].category);
    EXPECT_EQ(AxialPosition::Kind::Start, expansion.variants[0].position.kind);
    EXPECT_EQ("H-400x200", expansion.variants[1].shape);
    EXPECT_EQ(AxialPosition::Kind::End, expansion.variants[1].position.kind);
    EXPECT_TRUE(isNotSameTag("StbSecSteelBeamNotSame"));
}

TEST_F(utVariantExpander, repeatedShapesCollapse) {
    std::vector<MarkupNode> markup = {
        node("StbSecSteelBeam_S_Joint", { { "shape", std::string("H-600x200") }, { "pos", std::string("START") } }),
        node("StbSecSteelBeam_S_Joint", { { "shape", std::string("H-600x200") }, { "pos", std::string("CENTER") } }),
        node("StbSecSteelBeam_S_Joint", { { "shape", std::string("H-400x200") }, { "pos", std::string("END") } }),
    };
    VariantExpansion expansion = expandSectionVariants(markup);
    ASSERT_EQ(2u, expansion.multiSection.size());
    EXPECT_EQ("H-600x200", expansion.multiSection[0].shape);
    EXPECT_EQ(AxialPosition::Kind::Start, expansion.multiSection[0].position.kind);
    EXPECT_EQ("H-400x200", expansion.multiSection[1].shape);
    EXPECT_EQ(AxialPosition::Kind::End, expansion.multiSection[1].position.kind);

    // One shape throughout is a uniform member.
    markup[2].attributes.set("shape", std::string("H-600x200"));
    expansion = expandSectionVariants(markup);
    EXPECT_TRUE(expansion.multiSection.empty());
    ASSERT_TRUE(expansion.uniform);
    EXPECT_EQ("H-600x200", expansion.uniform->shape);
}

TEST_F(utVariantExpander, fiveTypesKeepInnerPositions) {
    const std::vector<MarkupNode> markup = {
        node("StbSecSteelBeam_S_FiveTypes", { { "shape", std::string("H-700") }, { "pos", std::string("START") } }),
        node("StbSecSteelBeam_S_FiveTypes", { { "shape", std::string("H-600") }, { "pos", std::string("HAUNCH_S") } }),
        node("StbSecSteelBeam_S_FiveTypes", { { "shape", std::string("H-500") }, { "pos", std::string("CENTER") } }),
        node("StbSecSteelBeam_S_FiveTypes", { { "shape", std::string("H-600") }, { "pos", std::string("HAUNCH_E") } }),
        node("StbSecSteelBeam_S_FiveTypes", { { "shape", std::string("H-700") }, { "pos", std::string("END") } }),
    };
    const VariantExpansion expansion = expandSectionVariants(markup);
    ASSERT_EQ(5u, expansion.multiSection.size());
    EXPECT_EQ(AxialPosition::Kind::HaunchStart, expansion.multiSection[1].position.kind);
    EXPECT_EQ(AxialPosition::Kind::Center, expansion.multiSection[2].position.kind);
    EXPECT_EQ(AxialPosition::Kind::HaunchEnd, expansion.multiSection[3].position.kind);
}

TEST_F(utVariantExpander, shapeWrappersFollowTheirOrder) {
    const std::vector<MarkupNode> markup = {
        node("StbSecSteelFigureBeam_S", {}, {
            node("StbSecSteelBeam_S_Shape", { { "order", std::string("3") } }, {
                node("StbSecSteelBeamStraight", { { "shape", std::string("H-600x200") } }) }),
            node("StbSecSteelBeam_S_Shape", { { "order", std::string("1") } }, {
                node("StbSecSteelBeamStraight", { { "shape", std::string("H-600x200") } }) }),
            node("StbSecSteelBeam_S_Shape", { { "order", std::string("2") } }, {
                node("StbSecSteelBeamStraight", { { "shape", std::string("H-400x200") }, { "strength_main", std::string("SN490B") } }) }),
        }) };
    const VariantExpansion expansion = expandSectionVariants(markup);
    EXPECT_FALSE(expansion.uniform);
    ASSERT_EQ(3u, expansion.multiSection.size());
    EXPECT_EQ("H-600x200", expansion.multiSection[0].shape);
    EXPECT_EQ(AxialPosition::Kind::Start, expansion.multiSection[0].position.kind);
    EXPECT_EQ("H-400x200", expansion.multiSection[1].shape);
    EXPECT_EQ(AxialPosition::Kind::Center, expansion.multiSection[1].position.kind);
    EXPECT_EQ("SN490B", *expansion.multiSection[1].strengthMain);
    EXPECT_EQ(AxialPosition::Kind::End, expansion.multiSection[2].position.kind);
    EXPECT_EQ("H-600x200", expansion.primaryShape());
}

TEST_F(utVariantExpander, wrappedTaperSitsBetweenItsNeighbours) {
    const std::vector<MarkupNode> markup = {
        node("StbSecSteelBeam_S_Shape", { { "order", std::string("2") } }, {
            node("StbSecSteelBeamStraight", { { "shape", std::string("H-400x200") } }) }),
        node("StbSecSteelBeam_S_Shape", { { "order", std::string("1") } }, {
            node("StbSecSteelBeamTaper", { { "start_shape", std::string("H-600x200") }, { "end_shape", std::string("H-500x200") } }) }),
    };
    const VariantExpansion expansion = expandSectionVariants(markup);
    ASSERT_EQ(3u, expansion.multiSection.size());
    EXPECT_EQ("H-600x200", expansion.multiSection[0].shape);
    EXPECT_EQ("H-500x200", expansion.multiSection[1].shape);
    EXPECT_EQ("H-400x200", expansion.multiSection[2].shape);
}

TEST_F(utVariantExpander, singleWrapperIsUniform) {
    const std::vector<MarkupNode> markup = {
        node("StbSecSteelColumn_S_Shape", {}, {
            node("StbSecSteelColumnStraight", { { "shape", std::string("BOX-400") } }) }),
    };
    const VariantExpansion expansion = expandSectionVariants(markup);
    ASSERT_TRUE(expansion.uniform);
    EXPECT_EQ("BOX-400", expansion.uniform->shape);
    EXPECT_TRUE(expansion.multiSection.empty());
}

TEST_F(utVariantExpander, fallbackAcceptsStartShape) {
    const std::vector<MarkupNode> markup = {
        node("StbSecSteelFigureBeam_S", {}, {
            node("Unrecognized", { { "start_shape", std::string("H-600x200") }, { "end_shape", std::string("H-400x200") } }) }),
    };
    const VariantExpansion expansion = expandSectionVariants(markup);
    ASSERT_TRUE(expansion.uniform);
    EXPECT_EQ(VariantCategory::Fallback, expansion.uniform->category);
    EXPECT_EQ("H-600x200", expansion.uniform->shape);
    EXPECT_EQ("H-400x200", *expansion.uniform->endShape);
}

TEST_F(utVariantExpander, fallbackTakesFirstShapeDepthFirst) {
    const std::vector<MarkupNode> markup = {
        node("StbSecSteelFigureBrace_S", {}, {
            node("Unrecognized", { { "shape", std::string("L-65x65x6") } }) }),
        node("Other", { { "shape", std::string("L-90x90x7") } }),
    };
    const VariantExpansion expansion = expandSectionVariants(markup);
    ASSERT_TRUE(expansion.uniform);
    EXPECT_EQ(VariantCategory::Fallback, expansion.uniform->category);
    EXPECT_EQ("L-65x65x6", expansion.uniform->shape);
}

TEST_F(utVariantExpander, emptyMarkup) {
    const VariantExpansion expansion = expandSectionVariants({});
    EXPECT_TRUE(expansion.empty());
    EXPECT_EQ("", expansion.primaryShape());
}

TEST_F(utVariantExpander, tagTables) {
    EXPECT_TRUE(isSameTag("StbSecSteelBeam_S_Straight"));
    EXPECT_TRUE(isNotSameTag("StbSecSteelColumnNotSame"));
    EXPECT_TRUE(isMultiSectionTag("StbSecSteelBeamFiveTypes"));
    EXPECT_TRUE(isJointTag("StbSecSteelBeam_S_Joint"));
    EXPECT_FALSE(isSameTag("StbSecSteelColumn_S_NotSame"));
}

TEST_F(utVariantExpander, axialPositions) {
    EXPECT_EQ(AxialPosition::named(AxialPosition::Kind::HaunchStart), *parseAxialPosition("haunch_s"));
    EXPECT_EQ(AxialPosition::named(AxialPosition::Kind::Top), *parseAxialPosition("TOP"));
    EXPECT_EQ(AxialPosition::at(1250.5), *parseAxialPosition("1250.5"));
    EXPECT_FALSE(parseAxialPosition("MIDDLE"));
    EXPECT_FALSE(parseAxialPosition(""));
    EXPECT_STREQ("HAUNCH_E", axialPositionName(AxialPosition::Kind::HaunchEnd));
}
