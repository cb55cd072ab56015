#include "engine/Placement.h"

#include <glm/gtc/constants.hpp>
#include <cmath>

namespace StbGeom::Engine {

    namespace {
        constexpr double kParallelDot = 0.999999;
        constexpr double kVerticalDot = 0.99;
        constexpr double kMinLength = 1e-9;

        glm::dquat withRoll(const glm::dquat& base, double rollAngle) {
            if (rollAngle == 0.0) return base;
            return glm::normalize(base * glm::angleAxis(rollAngle, glm::dvec3(0.0, 0.0, 1.0)));
        }
    }

    bool isFinite(const glm::dvec3& v) {
        return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
    }

    bool isPlacementValid(const Placement& placement) {
        return isFinite(placement.center) && isFinite(placement.direction) &&
            std::isfinite(placement.length) && placement.length > kMinLength &&
            std::isfinite(placement.rotation.w) && std::isfinite(placement.rotation.x) &&
            std::isfinite(placement.rotation.y) && std::isfinite(placement.rotation.z);
    }

    glm::dquat rotationBetween(const glm::dvec3& from, const glm::dvec3& to) {
        const glm::dvec3 a = glm::normalize(from);
        const glm::dvec3 b = glm::normalize(to);
        const double d = glm::dot(a, b);
        if (d > kParallelDot) {
            return glm::dquat(1.0, 0.0, 0.0, 0.0);
        }
        if (d < -kParallelDot) {
            glm::dvec3 axis = glm::cross(glm::dvec3(1.0, 0.0, 0.0), a);
            if (glm::length(axis) < 1e-6) {
                axis = glm::cross(glm::dvec3(0.0, 1.0, 0.0), a);
            }
            return glm::angleAxis(glm::pi<double>(), glm::normalize(axis));
        }
        const glm::dvec3 c = glm::cross(a, b);
        return glm::normalize(glm::dquat(1.0 + d, c.x, c.y, c.z));
    }

    LocalBasis memberBasis(const glm::dvec3& direction) {
        LocalBasis basis;
        basis.zAxis = glm::normalize(direction);
        const glm::dvec3 up(0.0, 0.0, 1.0);

        if (std::abs(glm::dot(basis.zAxis, up)) > kVerticalDot) {
            basis.yAxis = glm::normalize(glm::cross(basis.zAxis, glm::dvec3(1.0, 0.0, 0.0)));
            basis.xAxis = glm::normalize(glm::cross(basis.yAxis, basis.zAxis));
            return basis;
        }
        basis.xAxis = glm::normalize(glm::cross(up, basis.zAxis));
        basis.yAxis = glm::normalize(glm::cross(basis.zAxis, basis.xAxis));
        return basis;
    }

    glm::dquat rotationFromBasis(const LocalBasis& basis) {
        const glm::dmat3 m(basis.xAxis, basis.yAxis, basis.zAxis);
        return glm::normalize(glm::quat_cast(m));
    }

    std::optional<Placement> computeVerticalPlacement(
        const glm::dvec3& bottom, const glm::dvec3& top,
        const glm::dvec2& bottomOffset, const glm::dvec2& topOffset,
        double rollAngle)
    {
        const glm::dvec3 b = bottom + glm::dvec3(bottomOffset, 0.0);
        const glm::dvec3 t = top + glm::dvec3(topOffset, 0.0);
        if (!isFinite(b) || !isFinite(t) || !std::isfinite(rollAngle)) {
            return std::nullopt;
        }
        const double length = glm::distance(b, t);
        if (!(length > kMinLength)) {
            return std::nullopt;
        }

        Placement placement;
        placement.center = (b + t) * 0.5;
        placement.length = length;
        placement.direction = (t - b) / length;
        placement.rollAngle = rollAngle;
        placement.rotation = withRoll(rotationBetween(glm::dvec3(0.0, 0.0, 1.0), placement.direction), rollAngle);
        return placement;
    }

    std::optional<Placement> computeHorizontalPlacement(const HorizontalPlacementInput& input) {
        if (!isFinite(input.start) || !isFinite(input.end) ||
            !isFinite(input.startOffset) || !isFinite(input.endOffset) || !std::isfinite(input.rollAngle)) {
            return std::nullopt;
        }

        glm::dvec3 start = input.start + input.startOffset;
        glm::dvec3 end = input.end + input.endOffset;

        const glm::dvec3 raw = input.end - input.start;
        if (input.mode == BeamPlacementMode::TopAligned && input.sectionHeight > 0.0 &&
            glm::length(raw) > kMinLength) {
            const glm::dvec3 shift = memberBasis(raw).yAxis * (-input.sectionHeight / 2.0);
            start += shift;
            end += shift;
        }

        const double length = glm::distance(start, end);
        if (!(length > kMinLength)) {
            return std::nullopt;
        }

        Placement placement;
        placement.center = (start + end) * 0.5;
        placement.length = length;
        placement.direction = (end - start) / length;
        placement.rollAngle = input.rollAngle;
        placement.rotation = withRoll(rotationFromBasis(memberBasis(placement.direction)), input.rollAngle);
        return placement;
    }

    std::optional<Placement> placementFromBasis(const glm::dvec3& center, const LocalBasis& basis, double length) {
        if (!isFinite(center) || !std::isfinite(length) || !(length > kMinLength)) {
            return std::nullopt;
        }
        Placement placement;
        placement.center = center;
        placement.length = length;
        placement.direction = glm::normalize(basis.zAxis);
        placement.rotation = rotationFromBasis(basis);
        if (!isPlacementValid(placement)) {
            return std::nullopt;
        }
        return placement;
    }

} // namespace StbGeom::Engine
