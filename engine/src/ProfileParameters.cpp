#include "engine/ProfileParameters.h"

#include <cmath>
#include <initializer_list>

namespace StbGeom::Engine {

    namespace {

        // First positive candidate, otherwise the fallback.
        double pick(std::initializer_list<std::optional<double>> candidates, double fallback) {
            for (const auto& candidate : candidates) {
                if (candidate && std::isfinite(*candidate) && *candidate > 0.0) {
                    return *candidate;
                }
            }
            return fallback;
        }

        RectangleParams mapRectangle(const NormalizedDimensions& d) {
            RectangleParams p;
            p.width = pick({ d.width }, p.width);
            p.height = pick({ d.height }, p.height);
            return p;
        }

        CircleParams mapCircle(const NormalizedDimensions& d) {
            CircleParams p;
            std::optional<double> halfDiameter;
            if (d.diameter) halfDiameter = *d.diameter / 2.0;
            p.radius = pick({ d.radius, halfDiameter }, p.radius);
            return p;
        }

        HParams mapH(const NormalizedDimensions& d) {
            HParams p;
            p.overallDepth = pick({ d.overallDepth, d.height }, p.overallDepth);
            p.overallWidth = pick({ d.overallWidth, d.width }, p.overallWidth);
            p.webThickness = pick({ d.webThickness() }, p.webThickness);
            p.flangeThickness = pick({ d.flangeThickness() }, p.flangeThickness);
            p.filletRadius = pick({ d.secondaryValue("fillet_radius"), d.secondaryValue("r") }, p.filletRadius);
            return p;
        }

        BoxParams mapBox(const NormalizedDimensions& d) {
            BoxParams p;
            p.width = pick({ d.width }, p.width);
            p.height = pick({ d.height, d.secondaryValue("outer_height") }, p.height);
            p.wallThickness = pick({ d.secondaryValue("wall_thickness"), d.thickness }, p.wallThickness);
            return p;
        }

        PipeParams mapPipe(const NormalizedDimensions& d) {
            PipeParams p;
            p.outerDiameter = pick({ d.diameter, d.height }, p.outerDiameter);
            p.wallThickness = pick({ d.thickness, d.secondaryValue("wall_thickness") }, p.wallThickness);
            return p;
        }

        ChannelParams mapChannel(const NormalizedDimensions& d) {
            ChannelParams p;
            p.overallDepth = pick({ d.overallDepth, d.height }, p.overallDepth);
            p.flangeWidth = pick({ d.secondaryValue("flange_width"), d.width }, p.flangeWidth);
            p.webThickness = pick({ d.webThickness() }, p.webThickness);
            p.flangeThickness = pick({ d.flangeThickness() }, p.flangeThickness);
            return p;
        }

        AngleParams mapAngle(const NormalizedDimensions& d) {
            AngleParams p;
            p.depth = pick({ d.overallDepth, d.depth, d.height }, p.depth);
            p.width = pick({ d.secondaryValue("flange_width"), d.width }, p.width);
            p.thickness = pick({ d.secondaryValue("web_thickness"), d.thickness, d.secondaryValue("t1") }, p.thickness);
            return p;
        }

        TeeParams mapTee(const NormalizedDimensions& d) {
            TeeParams p;
            p.overallDepth = pick({ d.overallDepth, d.height }, p.overallDepth);
            p.flangeWidth = pick({ d.secondaryValue("flange_width"), d.width }, p.flangeWidth);
            p.webThickness = pick({ d.webThickness() }, p.webThickness);
            p.flangeThickness = pick({ d.flangeThickness() }, p.flangeThickness);
            return p;
        }

        CrossHParams mapCrossH(const NormalizedDimensions& d) {
            CrossHParams p;
            p.overallDepthX = pick({ d.secondaryValue("overall_depth_X"), d.overallDepth }, p.overallDepthX);
            p.overallWidthX = pick({ d.secondaryValue("overall_width_X"), d.overallWidth }, p.overallWidthX);
            // The Y arm repeats the X arm unless it is given separately.
            p.overallDepthY = pick({ d.secondaryValue("overall_depth_Y") }, p.overallDepthX);
            p.overallWidthY = pick({ d.secondaryValue("overall_width_Y") }, p.overallWidthX);
            p.webThickness = pick({ d.webThickness() }, p.webThickness);
            p.flangeThickness = pick({ d.flangeThickness() }, p.flangeThickness);
            return p;
        }

    } // namespace

    SectionFamily familyOf(const ProfileParams& params) {
        // Alternatives are declared in SectionFamily order.
        return static_cast<SectionFamily>(params.index());
    }

    ProfileParams defaultParameters(SectionFamily family) {
        switch (family) {
            case SectionFamily::Rectangle: return RectangleParams{};
            case SectionFamily::Circle: return CircleParams{};
            case SectionFamily::H: return HParams{};
            case SectionFamily::Box: return BoxParams{};
            case SectionFamily::Pipe: return PipeParams{};
            case SectionFamily::C: return ChannelParams{};
            case SectionFamily::L: return AngleParams{};
            case SectionFamily::T: return TeeParams{};
            case SectionFamily::CrossH: return CrossHParams{};
        }
        return RectangleParams{};
    }

    ProfileParams mapProfileParameters(const NormalizedDimensions* dims, SectionFamily family) {
        if (!dims) {
            return defaultParameters(family);
        }
        switch (family) {
            case SectionFamily::Rectangle: return mapRectangle(*dims);
            case SectionFamily::Circle: return mapCircle(*dims);
            case SectionFamily::H: return mapH(*dims);
            case SectionFamily::Box: return mapBox(*dims);
            case SectionFamily::Pipe: return mapPipe(*dims);
            case SectionFamily::C: return mapChannel(*dims);
            case SectionFamily::L: return mapAngle(*dims);
            case SectionFamily::T: return mapTee(*dims);
            case SectionFamily::CrossH: return mapCrossH(*dims);
        }
        return mapRectangle(*dims);
    }

} // namespace StbGeom::Engine
