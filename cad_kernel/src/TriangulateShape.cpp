#include "cad_kernel/MeshBuffers.h"
#include "cad_kernel/cad_kernel.h"

#include <Standard_ErrorHandler.hxx>
#include <Standard_Failure.hxx>
#include <BRepMesh_IncrementalMesh.hxx>
#include <BRep_Tool.hxx>
#include <BRepTools.hxx>
#include <BRepBndLib.hxx>
#include <Bnd_Box.hxx>
#include <Poly_Triangulation.hxx>
#include <TopExp_Explorer.hxx>
#include <TopoDS.hxx>
#include <TopoDS_Face.hxx>
#include <TopLoc_Location.hxx>
#include <TopAbs.hxx>
#include <gp_Pnt.hxx>
#include <gp_Dir.hxx>
#include <gp_Trsf.hxx>
#include <Message.hxx>

#include <algorithm>
#include <cmath>

namespace StbGeom::CadKernel {

    namespace {

        // Deflection from the bounding box diagonal so long members and
        // small plates mesh at comparable density.
        double autoDeflection(const TopoDS_Shape& shape, double clampDefl) {
            Bnd_Box bb;
            BRepBndLib::Add(shape, bb, false);
            if (bb.IsVoid()) {
                return 0.1;
            }
            const double diagonal = bb.SquareExtent() > 1e-16 ? std::sqrt(bb.SquareExtent()) : 1.0;
            double deflection = diagonal * 0.002;
            if (clampDefl > 0.0) {
                deflection = std::min(deflection, clampDefl);
            }
            return std::max(deflection, 1e-6);
        }

        // Appends the triangulation of one meshed face in world coordinates.
        // Reversed faces flip their normals and triangle winding.
        void appendFace(const TopoDS_Face& face, MeshBuffers& out) {
            TopLoc_Location location;
            Handle(Poly_Triangulation) triangulation = BRep_Tool::Triangulation(face, location);
            if (triangulation.IsNull() || triangulation->NbNodes() == 0 || triangulation->NbTriangles() == 0) {
                return;
            }
            if (!triangulation->HasNormals()) {
                triangulation->ComputeNormals();
            }

            const gp_Trsf& trsf = location.Transformation();
            const bool flip = face.Orientation() == TopAbs_REVERSED;
            const Standard_Integer nodes = triangulation->NbNodes();
            const unsigned int first = static_cast<unsigned int>(out.vertexCount());

            out.vertices.reserve(out.vertices.size() + 3 * static_cast<size_t>(nodes));
            out.normals.reserve(out.normals.size() + 3 * static_cast<size_t>(nodes));
            for (Standard_Integer node = 1; node <= nodes; ++node) {
                const gp_Pnt p = triangulation->Node(node).Transformed(trsf);
                gp_Dir n = triangulation->Normal(node).Transformed(trsf);
                if (flip) n.Reverse();
                out.vertices.insert(out.vertices.end(),
                    { static_cast<float>(p.X()), static_cast<float>(p.Y()), static_cast<float>(p.Z()) });
                out.normals.insert(out.normals.end(),
                    { static_cast<float>(n.X()), static_cast<float>(n.Y()), static_cast<float>(n.Z()) });
            }

            for (Standard_Integer t = 1; t <= triangulation->NbTriangles(); ++t) {
                Standard_Integer a = 0, b = 0, c = 0;
                triangulation->Triangle(t).Get(a, b, c);
                if (a < 1 || b < 1 || c < 1 || a > nodes || b > nodes || c > nodes) {
                    continue;
                }
                if (flip) std::swap(b, c);
                out.indices.push_back(first + static_cast<unsigned int>(a - 1));
                out.indices.push_back(first + static_cast<unsigned int>(b - 1));
                out.indices.push_back(first + static_cast<unsigned int>(c - 1));
            }
        }

    } // namespace

    MeshBuffers TriangulateShape(const TopoDS_Shape& shape, double linDefl, double angDefl, double clampDefl) {
        MeshBuffers out;
        if (shape.IsNull()) {
            return out;
        }

        Standard_ErrorHandler aErrorHandler;
        try {
            OCC_CATCH_SIGNALS
            if (linDefl <= 0.0) {
                linDefl = autoDeflection(shape, clampDefl);
            }
            BRepTools::Clean(shape);
            BRepMesh_IncrementalMesh mesher(shape, linDefl, Standard_False, angDefl, Standard_True);
            if (!mesher.IsDone()) {
                Message::SendFail() << "CAD Kernel: meshing did not finish (deflection " << linDefl << ").";
                return out;
            }
            for (TopExp_Explorer faces(shape, TopAbs_FACE); faces.More(); faces.Next()) {
                appendFace(TopoDS::Face(faces.Current()), out);
            }
        }
        catch (Standard_Failure& e) {
            Message::SendFail() << "CAD Kernel: OCCT exception while meshing: " << e.GetMessageString();
            out.clear();
        }
        return out;
    }

} // namespace StbGeom::CadKernel
