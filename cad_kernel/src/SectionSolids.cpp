#include "cad_kernel/cad_kernel.h"

#include <Standard_Macro.hxx>
#include <Standard_ErrorHandler.hxx>
#include <Standard_Failure.hxx>
#include <Message.hxx>
#include <gp_Pnt.hxx>
#include <gp_Vec.hxx>
#include <TopoDS_Shape.hxx>
#include <TopoDS_Face.hxx>
#include <TopoDS_Wire.hxx>
#include <TopoDS_Compound.hxx>
#include <BRep_Builder.hxx>
#include <BRepBuilderAPI_MakePolygon.hxx>
#include <BRepBuilderAPI_MakeFace.hxx>
#include <BRepPrimAPI_MakePrism.hxx>
#include <BRepOffsetAPI_ThruSections.hxx>
#include <BRepAlgoAPI_Cut.hxx>

#include <algorithm>
#include <optional>

namespace StbGeom::CadKernel {

    namespace {

        double signedArea(const Polygon2D& loop) {
            double area = 0.0;
            for (size_t i = 0, n = loop.size(); i < n; ++i) {
                const glm::dvec2& a = loop[i];
                const glm::dvec2& b = loop[(i + 1) % n];
                area += a.x * b.y - b.x * a.y;
            }
            return area / 2.0;
        }

        Polygon2D withWinding(Polygon2D loop, bool counterClockwise) {
            if ((signedArea(loop) > 0.0) != counterClockwise) {
                std::reverse(loop.begin(), loop.end());
            }
            return loop;
        }

        std::optional<TopoDS_Wire> makeWire(const Polygon2D& loop, double z) {
            if (loop.size() < 3) {
                return std::nullopt;
            }
            BRepBuilderAPI_MakePolygon polygon;
            for (const auto& p : loop) {
                polygon.Add(gp_Pnt(p.x, p.y, z));
            }
            polygon.Close();
            if (!polygon.IsDone()) {
                return std::nullopt;
            }
            return polygon.Wire();
        }

        // Face of one outer loop with its holes.
        std::optional<TopoDS_Face> makeFace(const Polygon2D& outer, const std::vector<Polygon2D>& holes, double z) {
            auto outerWire = makeWire(withWinding(outer, true), z);
            if (!outerWire) {
                return std::nullopt;
            }
            BRepBuilderAPI_MakeFace faceMaker(*outerWire, Standard_True);
            if (!faceMaker.IsDone()) {
                return std::nullopt;
            }
            for (const auto& hole : holes) {
                auto holeWire = makeWire(withWinding(hole, false), z);
                if (!holeWire) {
                    Message::SendWarning() << "CAD Kernel: Hole with fewer than 3 points ignored.";
                    continue;
                }
                faceMaker.Add(*holeWire);
            }
            return faceMaker.Face();
        }

        TopoDS_Shape asCompound(const std::vector<TopoDS_Shape>& parts) {
            if (parts.size() == 1) {
                return parts.front();
            }
            BRep_Builder builder;
            TopoDS_Compound compound;
            builder.MakeCompound(compound);
            for (const auto& part : parts) {
                builder.Add(compound, part);
            }
            return compound;
        }

        // Ruled solid through one loop per station.
        std::optional<TopoDS_Shape> loftLoops(const std::vector<LoftSection>& sections,
            const Polygon2D& (*select)(const LoftSection&, size_t), size_t index, double zShift)
        {
            BRepOffsetAPI_ThruSections loft(Standard_True, Standard_True);
            for (const auto& section : sections) {
                auto wire = makeWire(withWinding(select(section, index), true), section.z + zShift);
                if (!wire) {
                    return std::nullopt;
                }
                loft.AddWire(*wire);
            }
            loft.Build();
            if (!loft.IsDone() || loft.Shape().IsNull()) {
                return std::nullopt;
            }
            return loft.Shape();
        }

        const Polygon2D& outerOf(const LoftSection& section, size_t) { return section.loops.outer; }
        const Polygon2D& holeOf(const LoftSection& section, size_t i) { return section.loops.holes[i]; }
        const Polygon2D& extraOf(const LoftSection& section, size_t i) { return section.loops.extraOutlines[i]; }

    } // namespace

    OCCT_ShapeUniquePtr MakeSectionFace(const SectionLoops& loops, double z) {
        Standard_ErrorHandler aErrorHandler;
        try {
            OCC_CATCH_SIGNALS
            std::vector<TopoDS_Shape> faces;
            auto face = makeFace(loops.outer, loops.holes, z);
            if (!face) {
                Message::SendFail() << "CAD Kernel: Section outline does not form a face.";
                return nullptr;
            }
            faces.push_back(*face);
            for (const auto& outline : loops.extraOutlines) {
                if (auto extra = makeFace(outline, {}, z)) {
                    faces.push_back(*extra);
                }
            }
            return OCCT_ShapeUniquePtr(new TopoDS_Shape(asCompound(faces)));
        }
        catch (Standard_Failure& e) {
            Message::SendFail() << "CAD Kernel: OCCT exception while building section face: " << e.GetMessageString();
            return nullptr;
        }
    }

    OCCT_ShapeUniquePtr ExtrudeSection(const SectionLoops& loops, double length) {
        if (!(length > 0.0)) {
            return nullptr;
        }
        Standard_ErrorHandler aErrorHandler;
        try {
            OCC_CATCH_SIGNALS
            std::vector<TopoDS_Shape> solids;
            const gp_Vec extrusion(0.0, 0.0, length);

            auto face = makeFace(loops.outer, loops.holes, -length / 2.0);
            if (!face) {
                Message::SendFail() << "CAD Kernel: Section outline does not form a face.";
                return nullptr;
            }
            BRepPrimAPI_MakePrism prism(*face, extrusion);
            if (!prism.IsDone()) {
                Message::SendFail() << "CAD Kernel: BRepPrimAPI_MakePrism failed.";
                return nullptr;
            }
            solids.push_back(prism.Shape());

            for (const auto& outline : loops.extraOutlines) {
                auto extra = makeFace(outline, {}, -length / 2.0);
                if (!extra) {
                    Message::SendWarning() << "CAD Kernel: Extra outline skipped, no face.";
                    continue;
                }
                BRepPrimAPI_MakePrism extraPrism(*extra, extrusion);
                if (extraPrism.IsDone()) {
                    solids.push_back(extraPrism.Shape());
                }
            }
            return OCCT_ShapeUniquePtr(new TopoDS_Shape(asCompound(solids)));
        }
        catch (Standard_Failure& e) {
            Message::SendFail() << "CAD Kernel: OCCT exception during extrusion: " << e.GetMessageString();
            return nullptr;
        }
    }

    OCCT_ShapeUniquePtr LoftSections(const std::vector<LoftSection>& sections, double length) {
        if (sections.size() < 2 || !(length > 0.0)) {
            return nullptr;
        }
        const size_t holeCount = sections.front().loops.holes.size();
        const size_t extraCount = sections.front().loops.extraOutlines.size();
        for (const auto& section : sections) {
            if (section.loops.holes.size() != holeCount || section.loops.extraOutlines.size() != extraCount) {
                Message::SendFail() << "CAD Kernel: Loft sections differ in loop structure.";
                return nullptr;
            }
        }

        const double zShift = -length / 2.0;
        Standard_ErrorHandler aErrorHandler;
        try {
            OCC_CATCH_SIGNALS
            auto body = loftLoops(sections, outerOf, 0, zShift);
            if (!body) {
                Message::SendFail() << "CAD Kernel: BRepOffsetAPI_ThruSections failed for the outer loops.";
                return nullptr;
            }
            TopoDS_Shape solid = *body;
            for (size_t i = 0; i < holeCount; ++i) {
                auto core = loftLoops(sections, holeOf, i, zShift);
                if (!core) {
                    Message::SendWarning() << "CAD Kernel: Hole " << static_cast<int>(i) << " could not be lofted, kept solid.";
                    continue;
                }
                BRepAlgoAPI_Cut cut(solid, *core);
                if (!cut.IsDone()) {
                    Message::SendFail() << "CAD Kernel: BRepAlgoAPI_Cut failed.";
                    return nullptr;
                }
                solid = cut.Shape();
            }

            std::vector<TopoDS_Shape> parts{ solid };
            for (size_t i = 0; i < extraCount; ++i) {
                if (auto extra = loftLoops(sections, extraOf, i, zShift)) {
                    parts.push_back(*extra);
                }
            }
            return OCCT_ShapeUniquePtr(new TopoDS_Shape(asCompound(parts)));
        }
        catch (Standard_Failure& e) {
            Message::SendFail() << "CAD Kernel: OCCT exception during loft: " << e.GetMessageString();
            return nullptr;
        }
    }

} // namespace StbGeom::CadKernel
