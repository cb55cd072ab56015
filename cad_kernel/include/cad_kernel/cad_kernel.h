#ifndef STBGEOM_CAD_KERNEL_H
#define STBGEOM_CAD_KERNEL_H

#include <memory>
#include <vector>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include "cad_kernel/cad_kernel_export.h"
#include "cad_kernel/MeshBuffers.h"

class TopoDS_Shape;

namespace StbGeom::CadKernel {

    // --- Shape ownership ---
    struct STBGEOM_CAD_API ShapeDeleter {
        void operator()(TopoDS_Shape* s) const;
    };
    using OCCT_ShapeUniquePtr = std::unique_ptr<TopoDS_Shape, ShapeDeleter>;

    // --- Section input ---
    using Polygon2D = std::vector<glm::dvec2>;

    // Loops of one planar cross-section. Winding is normalized on use: outer
    // loops counter-clockwise, holes clockwise.
    struct SectionLoops {
        Polygon2D outer;
        std::vector<Polygon2D> holes;
        // Separate outlines kept as their own solids inside a compound.
        std::vector<Polygon2D> extraOutlines;
    };

    // Cross-section at axial distance z from the start end.
    struct LoftSection {
        double z = 0.0;
        SectionLoops loops;
    };

    // --- Kernel ---
    STBGEOM_CAD_API void initialize();

    // Planar face at height z. nullptr for fewer than three points or a
    // failed OCCT build.
    STBGEOM_CAD_API OCCT_ShapeUniquePtr MakeSectionFace(const SectionLoops& loops, double z = 0.0);

    // Prism along +Z centered on the origin, from -length/2 to +length/2.
    STBGEOM_CAD_API OCCT_ShapeUniquePtr ExtrudeSection(const SectionLoops& loops, double length);

    // Ruled loft through the sections, z measured from the start end; the
    // result is shifted so the axis is centered on the origin like ExtrudeSection.
    // Holes are lofted separately and cut out.
    STBGEOM_CAD_API OCCT_ShapeUniquePtr LoftSections(const std::vector<LoftSection>& sections, double length);

    // Rotates about the origin, then translates.
    STBGEOM_CAD_API OCCT_ShapeUniquePtr PlaceShape(const TopoDS_Shape& shape,
        const glm::dquat& rotation, const glm::dvec3& translation);

    // Solid volume, 0 for null shapes.
    STBGEOM_CAD_API double ShapeVolume(const TopoDS_Shape& shape);

    // --- Triangulation ---
    STBGEOM_CAD_API MeshBuffers TriangulateShape(const TopoDS_Shape& shape,
        double linDefl = -1.0,  // Linear deflection. If <= 0, will be calculated automatically.
        double angDefl = 0.35,  // Angular deflection in radians (approx. 20 degrees).
        double clampDefl = -1.0); // Optional clamp for auto-calculated linDefl, e.g., 0.05

} // namespace StbGeom::CadKernel

#endif // STBGEOM_CAD_KERNEL_H
