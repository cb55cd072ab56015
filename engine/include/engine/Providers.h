#ifndef STBGEOM_PROVIDERS_H
#define STBGEOM_PROVIDERS_H

#include "engine/engine_export.h"
#include "engine/SectionRecord.h"

#include <glm/glm.hpp>
#include <map>
#include <optional>
#include <string>

namespace StbGeom::Engine {

    // Lookups into the parsed model. All of them report "not found" instead of
    // throwing and are only read during a batch.
    class INodeProvider {
    public:
        virtual ~INodeProvider() = default;
        virtual std::optional<glm::dvec3> findNode(const std::string& id) const = 0;
    };

    class ISectionProvider {
    public:
        virtual ~ISectionProvider() = default;
        virtual const SectionRecord* findSection(const std::string& id) const = 0;
    };

    class ISteelShapeProvider {
    public:
        virtual ~ISteelShapeProvider() = default;
        virtual const SteelShapeRecord* findSteelShape(const std::string& name) const = 0;
    };

    class STBGEOM_ENGINE_API MapNodeProvider : public INodeProvider {
    public:
        void add(std::string id, const glm::dvec3& position);
        std::optional<glm::dvec3> findNode(const std::string& id) const override;
        size_t size() const { return nodes_.size(); }

    private:
        std::map<std::string, glm::dvec3> nodes_;
    };

    class STBGEOM_ENGINE_API MapSectionProvider : public ISectionProvider {
    public:
        void add(SectionRecord section);
        const SectionRecord* findSection(const std::string& id) const override;
        size_t size() const { return sections_.size(); }

    private:
        std::map<std::string, SectionRecord> sections_;
    };

    class STBGEOM_ENGINE_API MapSteelShapeProvider : public ISteelShapeProvider {
    public:
        void add(SteelShapeRecord shape);
        const SteelShapeRecord* findSteelShape(const std::string& name) const override;
        size_t size() const { return shapes_.size(); }

    private:
        std::map<std::string, SteelShapeRecord> shapes_;
    };

} // namespace StbGeom::Engine

#endif // STBGEOM_PROVIDERS_H
