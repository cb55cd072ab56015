#pragma once

#include "engine/geometry/IGeometry.h"
#include <cad_kernel/cad_kernel.h> // For OCCT_ShapeUniquePtr

class TopoDS_Shape;


namespace StbGeom::Engine {

    // OpenCASCADE B-Rep solid in world coordinates.
    class BRepGeometry : public IGeometry {
    public:
        // Takes ownership of the shape.
        explicit BRepGeometry(CadKernel::OCCT_ShapeUniquePtr shape);
        ~BRepGeometry() override;

        BRepGeometry(const BRepGeometry&) = delete;
        BRepGeometry& operator=(const BRepGeometry&) = delete;
        BRepGeometry(BRepGeometry&&) = default;
        BRepGeometry& operator=(BRepGeometry&&) = default;

        CadKernel::MeshBuffers getRenderMesh(double detailLevel = 1.0) const override;

        const TopoDS_Shape* getShape() const;
        double volume() const;

    private:
        CadKernel::OCCT_ShapeUniquePtr shape_;
    };

} // namespace StbGeom::Engine
