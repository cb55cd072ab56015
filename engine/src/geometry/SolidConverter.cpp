#include "engine/geometry/SolidConverter.h"

#include <TopoDS_Shape.hxx>

namespace StbGeom::Engine {

    CadKernel::SectionLoops toSectionLoops(const Profile& profile) {
        CadKernel::SectionLoops loops;
        loops.outer = profile.outer;
        loops.holes = profile.holes;
        loops.extraOutlines = profile.auxiliaryOutlines;
        return loops;
    }

    std::unique_ptr<BRepGeometry> convertSolid(const GeneratedSolid& solid, ILogger& logger) {
        CadKernel::OCCT_ShapeUniquePtr local;
        if (const auto* profile = std::get_if<Profile>(&solid.shape)) {
            local = CadKernel::ExtrudeSection(toSectionLoops(*profile), solid.placement.length);
        } else {
            const LoftedSolid& lofted = std::get<LoftedSolid>(solid.shape);
            std::vector<CadKernel::LoftSection> sections;
            sections.reserve(lofted.stations.size());
            for (const auto& station : lofted.stations) {
                sections.push_back({ station.z, toSectionLoops(station.profile) });
            }
            local = CadKernel::LoftSections(sections, lofted.length);
        }
        if (!local) {
            logger.error("SolidConverter", "{} '{}' ({}): kernel could not build the solid",
                elementFamilyName(solid.family), solid.elementId, solidRoleName(solid.role));
            return nullptr;
        }

        auto placed = CadKernel::PlaceShape(*local, solid.placement.rotation, solid.placement.center);
        if (!placed) {
            logger.error("SolidConverter", "{} '{}': placement transform failed",
                elementFamilyName(solid.family), solid.elementId);
            return nullptr;
        }
        return std::make_unique<BRepGeometry>(std::move(placed));
    }

} // namespace StbGeom::Engine
