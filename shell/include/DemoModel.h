#pragma once

#include <engine/Elements.h>
#include <engine/Providers.h>

#include <vector>

namespace StbGeom {

// A one-bay steel frame on piled footings with a slab, a wall and one element
// that refers to a missing section.
struct DemoModel {
    Engine::MapNodeProvider nodes;
    Engine::MapSectionProvider sections;
    Engine::MapSteelShapeProvider steelShapes;
    std::vector<Engine::ElementRecord> elements;
};

DemoModel BuildDemoModel();

} // namespace StbGeom
