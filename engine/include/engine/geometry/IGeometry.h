#pragma once

#include <cad_kernel/MeshBuffers.h>
#include <memory>

namespace StbGeom::Engine {

    // Renderable form of one generated solid.
    class IGeometry {
    public:
        virtual ~IGeometry() = default;

        // detailLevel scales the mesh density, 1.0 is the kernel default.
        virtual CadKernel::MeshBuffers getRenderMesh(double detailLevel = 1.0) const = 0;
    };

} // namespace StbGeom::Engine
