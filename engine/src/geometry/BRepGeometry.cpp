#include "engine/geometry/BRepGeometry.h"
#include <TopoDS_Shape.hxx>

namespace StbGeom::Engine {

    BRepGeometry::BRepGeometry(CadKernel::OCCT_ShapeUniquePtr shape) : shape_(std::move(shape)) {}

    BRepGeometry::~BRepGeometry() = default;

    CadKernel::MeshBuffers BRepGeometry::getRenderMesh(double detailLevel) const {
        if (!shape_ || shape_->IsNull()) {
            return {};
        }
        if (detailLevel > 0.0 && detailLevel != 1.0) {
            // Finer meshes for detail > 1; the kernel picks the base deflection.
            return CadKernel::TriangulateShape(*shape_, -1.0, 0.35 / detailLevel);
        }
        return CadKernel::TriangulateShape(*shape_);
    }

    const TopoDS_Shape* BRepGeometry::getShape() const {
        return shape_.get();
    }

    double BRepGeometry::volume() const {
        return shape_ ? CadKernel::ShapeVolume(*shape_) : 0.0;
    }

} // namespace StbGeom::Engine
