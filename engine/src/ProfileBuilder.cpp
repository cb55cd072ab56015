#include "engine/ProfileBuilder.h"

#include <glm/gtc/constants.hpp>
#include <algorithm>
#include <cmath>

namespace StbGeom::Engine {

    namespace {

        bool positive(double v) {
            return std::isfinite(v) && v > 0.0;
        }

        void reverseWinding(Loop& loop) {
            std::reverse(loop.begin(), loop.end());
        }

        void centerOnCentroid(Loop& loop) {
            translateLoop(loop, -areaCentroid(loop));
        }

        // I outline, counter-clockwise from the bottom-left flange corner.
        std::optional<Loop> hLoop(double depth, double width, double web, double flange) {
            if (!positive(depth) || !positive(width) || !positive(web) || !positive(flange)) return std::nullopt;
            if (web >= width || 2.0 * flange >= depth) return std::nullopt;
            const double hd = depth / 2.0;
            const double hw = width / 2.0;
            const double hweb = web / 2.0;
            const double inner = hd - flange;
            return Loop{
                { -hw, -hd }, { hw, -hd }, { hw, -inner }, { hweb, -inner },
                { hweb, inner }, { hw, inner }, { hw, hd }, { -hw, hd },
                { -hw, inner }, { -hweb, inner }, { -hweb, -inner }, { -hw, -inner }
            };
        }

        std::optional<Profile> build(const RectangleParams& p, int) {
            if (!positive(p.width) || !positive(p.height)) return std::nullopt;
            return rectangleProfile(p.width, p.height);
        }

        std::optional<Profile> build(const CircleParams& p, int segments) {
            if (!positive(p.radius) || segments < 3) return std::nullopt;
            Profile profile;
            profile.outer = circleLoop(p.radius, segments);
            return profile;
        }

        std::optional<Profile> build(const HParams& p, int) {
            auto loop = hLoop(p.overallDepth, p.overallWidth, p.webThickness, p.flangeThickness);
            if (!loop) return std::nullopt;
            Profile profile;
            profile.outer = std::move(*loop);
            return profile;
        }

        std::optional<Profile> build(const BoxParams& p, int) {
            if (!positive(p.width) || !positive(p.height) || !positive(p.wallThickness)) return std::nullopt;
            const double innerW = p.width - 2.0 * p.wallThickness;
            const double innerH = p.height - 2.0 * p.wallThickness;
            if (innerW <= 0.0 || innerH <= 0.0) return std::nullopt;
            Profile profile = rectangleProfile(p.width, p.height);
            Loop hole = rectangleProfile(innerW, innerH).outer;
            reverseWinding(hole);
            profile.holes.push_back(std::move(hole));
            return profile;
        }

        std::optional<Profile> build(const PipeParams& p, int segments) {
            if (!positive(p.outerDiameter) || !positive(p.wallThickness) || segments < 3) return std::nullopt;
            const double r = p.outerDiameter / 2.0;
            const double inner = r - p.wallThickness;
            if (inner <= 0.0) return std::nullopt;
            Profile profile;
            profile.outer = circleLoop(r, segments);
            Loop hole = circleLoop(inner, segments);
            reverseWinding(hole);
            profile.holes.push_back(std::move(hole));
            return profile;
        }

        std::optional<Profile> build(const ChannelParams& p, int) {
            if (!positive(p.overallDepth) || !positive(p.flangeWidth) ||
                !positive(p.webThickness) || !positive(p.flangeThickness)) return std::nullopt;
            if (p.webThickness >= p.flangeWidth || 2.0 * p.flangeThickness >= p.overallDepth) return std::nullopt;
            const double hd = p.overallDepth / 2.0;
            const double hw = p.flangeWidth / 2.0;
            const double webX = -hw + p.webThickness;
            const double inner = hd - p.flangeThickness;
            Profile profile;
            profile.outer = {
                { -hw, -hd }, { hw, -hd }, { hw, -inner }, { webX, -inner },
                { webX, inner }, { hw, inner }, { hw, hd }, { -hw, hd }
            };
            centerOnCentroid(profile.outer);
            return profile;
        }

        std::optional<Profile> build(const AngleParams& p, int) {
            if (!positive(p.depth) || !positive(p.width) || !positive(p.thickness)) return std::nullopt;
            if (p.thickness >= p.depth || p.thickness >= p.width) return std::nullopt;
            const double t = p.thickness;
            Profile profile;
            profile.outer = {
                { 0.0, 0.0 }, { p.width, 0.0 }, { p.width, t },
                { t, t }, { t, p.depth }, { 0.0, p.depth }
            };
            centerOnCentroid(profile.outer);
            return profile;
        }

        std::optional<Profile> build(const TeeParams& p, int) {
            if (!positive(p.overallDepth) || !positive(p.flangeWidth) ||
                !positive(p.webThickness) || !positive(p.flangeThickness)) return std::nullopt;
            if (p.webThickness >= p.flangeWidth || p.flangeThickness >= p.overallDepth) return std::nullopt;
            const double hw = p.flangeWidth / 2.0;
            const double hweb = p.webThickness / 2.0;
            const double stem = p.overallDepth - p.flangeThickness;
            Profile profile;
            profile.outer = {
                { -hweb, 0.0 }, { hweb, 0.0 }, { hweb, stem }, { hw, stem },
                { hw, p.overallDepth }, { -hw, p.overallDepth }, { -hw, stem }, { -hweb, stem }
            };
            centerOnCentroid(profile.outer);
            return profile;
        }

        std::optional<Profile> build(const CrossHParams& p, int) {
            auto armX = hLoop(p.overallDepthX, p.overallWidthX, p.webThickness, p.flangeThickness);
            auto armY = hLoop(p.overallDepthY, p.overallWidthY, p.webThickness, p.flangeThickness);
            if (!armX || !armY) return std::nullopt;
            for (auto& v : *armY) {
                v = glm::dvec2(-v.y, v.x);
            }
            Profile profile;
            profile.outer = std::move(*armX);
            profile.auxiliaryOutlines.push_back(std::move(*armY));
            return profile;
        }

    } // namespace

    Profile rectangleProfile(double width, double height) {
        const double hw = width / 2.0;
        const double hh = height / 2.0;
        Profile profile;
        profile.outer = { { -hw, -hh }, { hw, -hh }, { hw, hh }, { -hw, hh } };
        return profile;
    }

    Loop circleLoop(double radius, int segments) {
        Loop loop;
        loop.reserve(static_cast<size_t>(segments));
        const double step = glm::two_pi<double>() / segments;
        for (int i = 0; i < segments; ++i) {
            const double angle = step * i;
            loop.emplace_back(radius * std::cos(angle), radius * std::sin(angle));
        }
        return loop;
    }

    std::optional<Profile> buildProfile(const ProfileParams& params, int circleSegments) {
        auto profile = std::visit([circleSegments](const auto& p) { return build(p, circleSegments); }, params);
        if (profile && !isProfileUsable(*profile)) {
            return std::nullopt;
        }
        return profile;
    }

} // namespace StbGeom::Engine
