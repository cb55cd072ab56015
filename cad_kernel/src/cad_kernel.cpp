#include "cad_kernel/cad_kernel.h"
#include <Standard_Macro.hxx>
#include <Standard_ErrorHandler.hxx>
#include <Standard_Version.hxx>
#include <Standard_Failure.hxx>
#include <Message.hxx>
#include <Message_PrinterOStream.hxx>
#include <Message_Messenger.hxx>
#include <gp_Quaternion.hxx>
#include <gp_Trsf.hxx>
#include <gp_Vec.hxx>
#include <TopoDS_Shape.hxx>
#include <BRepBuilderAPI_Transform.hxx>
#include <BRepGProp.hxx>
#include <GProp_GProps.hxx>

namespace StbGeom::CadKernel {

    void ShapeDeleter::operator()(TopoDS_Shape* shape) const {
        delete shape;
    }

    void initialize() {
        Message::SendInfo() << "CAD Kernel: Initializing OpenCascade Technology (OCCT) v"
            << OCC_VERSION_STRING_EXT << "...";
        try {
            Handle(Message_Messenger) aMessenger = Message::DefaultMessenger();
            if (aMessenger->Printers().IsEmpty()) {
                Handle(Message_Printer) aPrinter = new Message_PrinterOStream;
                aMessenger->AddPrinter(aPrinter);
                Message::SendInfo() << "CAD Kernel: Default Messenger and OStream Printer Initialized.";
            }
        }
        catch (Standard_Failure& e) {
            Message::SendFail() << "CAD Kernel: OCCT Standard_Failure during initialization: " << e.GetMessageString();
        }
    }

    OCCT_ShapeUniquePtr PlaceShape(const TopoDS_Shape& shape, const glm::dquat& rotation, const glm::dvec3& translation) {
        if (shape.IsNull()) {
            return nullptr;
        }
        Standard_ErrorHandler aErrorHandler;
        try {
            OCC_CATCH_SIGNALS
            gp_Trsf trsf;
            trsf.SetRotation(gp_Quaternion(rotation.x, rotation.y, rotation.z, rotation.w));
            trsf.SetTranslationPart(gp_Vec(translation.x, translation.y, translation.z));

            BRepBuilderAPI_Transform transformer(shape, trsf, Standard_True);
            transformer.Build();
            if (!transformer.IsDone()) {
                Message::SendFail() << "CAD Kernel: BRepBuilderAPI_Transform failed.";
                return nullptr;
            }
            return OCCT_ShapeUniquePtr(new TopoDS_Shape(transformer.Shape()));
        }
        catch (Standard_Failure& e) {
            Message::SendFail() << "CAD Kernel: OCCT exception while placing shape: " << e.GetMessageString();
            return nullptr;
        }
    }

    double ShapeVolume(const TopoDS_Shape& shape) {
        if (shape.IsNull()) {
            return 0.0;
        }
        Standard_ErrorHandler aErrorHandler;
        try {
            OCC_CATCH_SIGNALS
            GProp_GProps props;
            BRepGProp::VolumeProperties(shape, props);
            return props.Mass();
        }
        catch (Standard_Failure& e) {
            Message::SendFail() << "CAD Kernel: OCCT exception while measuring volume: " << e.GetMessageString();
            return 0.0;
        }
    }

} // namespace StbGeom::CadKernel
