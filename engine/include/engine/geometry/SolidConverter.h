#pragma once

#include "engine/GeneratedSolid.h"
#include "engine/Logger.h"
#include "engine/geometry/BRepGeometry.h"

#include <memory>

namespace StbGeom::Engine {

    CadKernel::SectionLoops toSectionLoops(const Profile& profile);

    // Extrudes or lofts the solid in its local frame and moves it into place.
    // nullptr (with an error logged) when the kernel rejects the shape.
    std::unique_ptr<BRepGeometry> convertSolid(const GeneratedSolid& solid, ILogger& logger);

} // namespace StbGeom::Engine
