#include "engine/Providers.h"

namespace StbGeom::Engine {

    void MapNodeProvider::add(std::string id, const glm::dvec3& position) {
        nodes_[std::move(id)] = position;
    }

    std::optional<glm::dvec3> MapNodeProvider::findNode(const std::string& id) const {
        auto it = nodes_.find(id);
        if (it == nodes_.end()) return std::nullopt;
        return it->second;
    }

    void MapSectionProvider::add(SectionRecord section) {
        std::string id = section.id;
        sections_[std::move(id)] = std::move(section);
    }

    const SectionRecord* MapSectionProvider::findSection(const std::string& id) const {
        auto it = sections_.find(id);
        return it == sections_.end() ? nullptr : &it->second;
    }

    void MapSteelShapeProvider::add(SteelShapeRecord shape) {
        std::string name = shape.name;
        shapes_[std::move(name)] = std::move(shape);
    }

    const SteelShapeRecord* MapSteelShapeProvider::findSteelShape(const std::string& name) const {
        auto it = shapes_.find(name);
        return it == shapes_.end() ? nullptr : &it->second;
    }

} // namespace StbGeom::Engine
