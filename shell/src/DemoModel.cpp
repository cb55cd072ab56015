#include "DemoModel.h"

#include <string>
#include <utility>

namespace StbGeom {

using namespace Engine;

namespace {

void AddSteelShapes(MapSteelShapeProvider& shapes) {
    shapes.add({ "BCR295-400x400x22", "BCR", { { "A", 400.0 }, { "B", 400.0 }, { "t", 22.0 } } });
    shapes.add({ "H-600x200x11x17", "H", { { "A", 600.0 }, { "B", 200.0 }, { "t1", 11.0 }, { "t2", 17.0 }, { "r", 13.0 } } });
    shapes.add({ "H-400x200x8x13", "H", { { "A", 400.0 }, { "B", 200.0 }, { "t1", 8.0 }, { "t2", 13.0 }, { "r", 13.0 } } });
    shapes.add({ "P-165.2x5", "PIPE", { { "D", 165.2 }, { "t", 5.0 } } });
}

MarkupNode Shape(std::string tag, std::string shape, std::string pos = {}) {
    MarkupNode node;
    node.tag = std::move(tag);
    node.attributes.set("shape", std::move(shape));
    if (!pos.empty()) node.attributes.set("pos", std::move(pos));
    return node;
}

void AddSections(MapSectionProvider& sections) {
    SectionRecord column;
    column.id = "SC1";
    column.variantMarkup.push_back(Shape("StbSecSteelColumn_S_Same", "BCR295-400x400x22"));
    column.basePlate = AttributeBag{ { "B_X", 600.0 }, { "B_Y", 600.0 }, { "t", 40.0 } };
    sections.add(std::move(column));

    SectionRecord girder;
    girder.id = "SG1";
    girder.variantMarkup.push_back(Shape("StbSecSteelBeam_S_Haunch", "H-600x200x11x17", "START"));
    girder.variantMarkup.push_back(Shape("StbSecSteelBeam_S_Haunch", "H-400x200x8x13", "CENTER"));
    girder.variantMarkup.push_back(Shape("StbSecSteelBeam_S_Haunch", "H-600x200x11x17", "END"));
    sections.add(std::move(girder));

    SectionRecord brace;
    brace.id = "SB1";
    brace.variantMarkup.push_back(Shape("StbSecSteelBrace_S_Same", "P-165.2x5"));
    sections.add(std::move(brace));

    SectionRecord pile;
    pile.id = "SP1";
    pile.attributes = AttributeBag{
        { "D_axial", 1000.0 }, { "D_extended_foot", 1500.0 },
        { "length_extended_foot", 1500.0 }, { "angle_extended_foot_taper", 12.0 },
        { "length_pile", 15000.0 } };
    sections.add(std::move(pile));

    SectionRecord footing;
    footing.id = "SF1";
    footing.attributes = AttributeBag{ { "width_X", 2400.0 }, { "width_Y", 2400.0 }, { "depth", 900.0 } };
    sections.add(std::move(footing));

    SectionRecord slab;
    slab.id = "SS1";
    slab.attributes = AttributeBag{ { "depth", 150.0 } };
    sections.add(std::move(slab));

    SectionRecord wall;
    wall.id = "SW1";
    wall.attributes = AttributeBag{ { "t", 200.0 } };
    sections.add(std::move(wall));
}

} // namespace

DemoModel BuildDemoModel() {
    DemoModel model;
    model.nodes.add("N1", { 0.0, 0.0, 0.0 });
    model.nodes.add("N2", { 6000.0, 0.0, 0.0 });
    model.nodes.add("N3", { 0.0, 0.0, 3500.0 });
    model.nodes.add("N4", { 6000.0, 0.0, 3500.0 });
    model.nodes.add("N5", { 0.0, 6000.0, 3500.0 });
    model.nodes.add("N6", { 6000.0, 6000.0, 3500.0 });
    AddSteelShapes(model.steelShapes);
    AddSections(model.sections);

    auto& elements = model.elements;
    elements.push_back(ColumnElement{ "C1", ElementFamily::Column, std::string("N1"), std::string("N3"), "SC1" });
    elements.push_back(ColumnElement{ "C2", ElementFamily::Column, std::string("N2"), std::string("N4"), "SC1" });

    BeamElement girder;
    girder.id = "G1";
    girder.family = ElementFamily::Girder;
    girder.start = std::string("N3");
    girder.end = std::string("N4");
    girder.sectionId = "SG1";
    girder.haunchStart = 900.0;
    girder.haunchEnd = 900.0;
    elements.push_back(girder);

    BraceElement brace;
    brace.id = "V1";
    brace.start = std::string("N1");
    brace.end = std::string("N4");
    brace.sectionId = "SB1";
    elements.push_back(brace);

    for (const char* node : { "N1", "N2" }) {
        PileElement pile;
        pile.id = std::string("P-") + node;
        pile.top = std::string(node);
        pile.sectionId = "SP1";
        pile.levelTop = -900.0;
        elements.push_back(pile);

        FootingElement footing;
        footing.id = std::string("F-") + node;
        footing.node = std::string(node);
        footing.sectionId = "SF1";
        footing.levelBottom = -900.0;
        elements.push_back(footing);
    }

    SlabElement slab;
    slab.id = "S1";
    slab.nodes = { std::string("N3"), std::string("N4"), std::string("N6"), std::string("N5") };
    slab.sectionId = "SS1";
    elements.push_back(slab);

    WallElement wall;
    wall.id = "W1";
    wall.nodes = { std::string("N1"), std::string("N2"), std::string("N4"), std::string("N3") };
    wall.sectionId = "SW1";
    wall.openings.push_back({ 2000.0, 800.0, 1800.0, 1500.0 });
    elements.push_back(wall);

    // Refers to a section the model does not define.
    BeamElement orphan;
    orphan.id = "B9";
    orphan.start = std::string("N5");
    orphan.end = std::string("N6");
    orphan.sectionId = "SG9";
    elements.push_back(orphan);

    return model;
}

} // namespace StbGeom
