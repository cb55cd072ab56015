#include "engine/Profile.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace StbGeom::Engine {

    namespace {

        bool sameLoopSizes(const std::vector<Loop>& a, const std::vector<Loop>& b) {
            if (a.size() != b.size()) return false;
            for (size_t i = 0; i < a.size(); ++i) {
                if (a[i].size() != b[i].size()) return false;
            }
            return true;
        }

        Loop lerpLoop(const Loop& a, const Loop& b, double t) {
            Loop out;
            out.reserve(a.size());
            for (size_t i = 0; i < a.size(); ++i) {
                out.push_back(a[i] + (b[i] - a[i]) * t);
            }
            return out;
        }

        void extend(Bounds2D& bounds, const Loop& loop) {
            for (const auto& p : loop) {
                bounds.min = glm::min(bounds.min, p);
                bounds.max = glm::max(bounds.max, p);
            }
        }

    } // namespace

    size_t Profile::vertexCount() const {
        size_t count = outer.size();
        for (const auto& hole : holes) count += hole.size();
        for (const auto& loop : auxiliaryOutlines) count += loop.size();
        return count;
    }

    bool Profile::hasSameTopology(const Profile& other) const {
        return outer.size() == other.outer.size() &&
            sameLoopSizes(holes, other.holes) &&
            sameLoopSizes(auxiliaryOutlines, other.auxiliaryOutlines);
    }

    double signedArea(const Loop& loop) {
        double twice = 0.0;
        for (size_t i = 0, n = loop.size(); i < n; ++i) {
            const glm::dvec2& a = loop[i];
            const glm::dvec2& b = loop[(i + 1) % n];
            twice += a.x * b.y - b.x * a.y;
        }
        return twice * 0.5;
    }

    glm::dvec2 areaCentroid(const Loop& loop) {
        const double area = signedArea(loop);
        if (loop.empty()) return glm::dvec2(0.0);
        if (std::abs(area) < 1e-12) {
            glm::dvec2 sum(0.0);
            for (const auto& p : loop) sum += p;
            return sum / static_cast<double>(loop.size());
        }
        glm::dvec2 c(0.0);
        for (size_t i = 0, n = loop.size(); i < n; ++i) {
            const glm::dvec2& a = loop[i];
            const glm::dvec2& b = loop[(i + 1) % n];
            const double cross = a.x * b.y - b.x * a.y;
            c += (a + b) * cross;
        }
        return c / (6.0 * area);
    }

    Bounds2D loopBounds(const Loop& loop) {
        Bounds2D bounds;
        if (loop.empty()) return bounds;
        bounds.min = bounds.max = loop.front();
        extend(bounds, loop);
        return bounds;
    }

    Bounds2D profileBounds(const Profile& profile) {
        Bounds2D bounds = loopBounds(profile.outer);
        for (const auto& loop : profile.auxiliaryOutlines) {
            extend(bounds, loop);
        }
        return bounds;
    }

    double netArea(const Profile& profile) {
        double area = std::abs(signedArea(profile.outer));
        for (const auto& hole : profile.holes) {
            area -= std::abs(signedArea(hole));
        }
        return area;
    }

    void translateLoop(Loop& loop, const glm::dvec2& offset) {
        for (auto& p : loop) p += offset;
    }

    std::optional<Profile> interpolateProfiles(const Profile& from, const Profile& to, double t) {
        if (!from.hasSameTopology(to)) {
            return std::nullopt;
        }
        Profile out;
        out.outer = lerpLoop(from.outer, to.outer, t);
        for (size_t i = 0; i < from.holes.size(); ++i) {
            out.holes.push_back(lerpLoop(from.holes[i], to.holes[i], t));
        }
        for (size_t i = 0; i < from.auxiliaryOutlines.size(); ++i) {
            out.auxiliaryOutlines.push_back(lerpLoop(from.auxiliaryOutlines[i], to.auxiliaryOutlines[i], t));
        }
        return out;
    }

    bool isProfileUsable(const Profile& profile) {
        if (profile.outer.size() < 3) return false;
        for (const auto& p : profile.outer) {
            if (!std::isfinite(p.x) || !std::isfinite(p.y)) return false;
        }
        return std::abs(signedArea(profile.outer)) > std::numeric_limits<double>::epsilon() &&
            netArea(profile) > 0.0;
    }

} // namespace StbGeom::Engine
