#include "engine/TaperedSolid.h"

#include <algorithm>
#include <cmath>

namespace StbGeom::Engine {

    namespace {

        constexpr double kSameStation = 1e-9;

        using Kind = AxialPosition::Kind;

        struct NamedSections {
            const Profile* start = nullptr;
            const Profile* center = nullptr;
            const Profile* end = nullptr;
            bool onlyEndsAndCenter = true;
        };

        NamedSections classify(const MultiSectionSpec& spec) {
            NamedSections named;
            for (const auto& section : spec.sections) {
                switch (section.position.kind) {
                    case Kind::Start:
                    case Kind::Bottom:
                        if (named.start) named.onlyEndsAndCenter = false;
                        named.start = &section.profile;
                        break;
                    case Kind::Center:
                        if (named.center) named.onlyEndsAndCenter = false;
                        named.center = &section.profile;
                        break;
                    case Kind::End:
                    case Kind::Top:
                        if (named.end) named.onlyEndsAndCenter = false;
                        named.end = &section.profile;
                        break;
                    default:
                        named.onlyEndsAndCenter = false;
                        break;
                }
            }
            return named;
        }

        // 0 when no usable length was given.
        double zoneLength(const std::optional<double>& given, double length, double eps) {
            if (given && std::isfinite(*given) && *given > eps && *given < length) {
                return *given;
            }
            return 0.0;
        }

        // Drops the earlier of two stations at the same distance.
        std::vector<SolidStation> mergeCoincident(std::vector<SolidStation> stations) {
            std::vector<SolidStation> out;
            for (auto& station : stations) {
                if (!out.empty() && std::abs(station.z - out.back().z) < kSameStation) {
                    out.back() = std::move(station);
                    continue;
                }
                out.push_back(std::move(station));
            }
            return out;
        }

        double positionDistance(const AxialPosition& position, double length, double hs, double he) {
            switch (position.kind) {
                case Kind::Start:
                case Kind::Bottom: return 0.0;
                case Kind::HaunchStart: return hs;
                case Kind::Center: return length / 2.0;
                case Kind::HaunchEnd: return length - he;
                case Kind::End:
                case Kind::Top: return length;
                case Kind::Numeric: return std::clamp(position.value, 0.0, length);
            }
            return length / 2.0;
        }

    } // namespace

    std::vector<SolidStation> resolveStations(const MultiSectionSpec& spec, double length, const GeometryOptions& options) {
        std::vector<SolidStation> stations;
        if (spec.sections.size() < 2 || !(length > 0.0)) {
            return stations;
        }

        const double eps = std::min(options.jointEpsilon, length / 10.0);
        double hs = zoneLength(spec.segments.start, length, eps);
        double he = zoneLength(spec.segments.end, length, eps);
        if (hs + he > length - eps) {
            hs = he = 0.0;
        }

        const NamedSections named = classify(spec);
        auto add = [&stations](double z, const Profile* profile) {
            stations.push_back({ z, *profile });
        };

        if (named.onlyEndsAndCenter && named.start && named.center && named.end && (hs > 0.0 || he > 0.0)) {
            add(0.0, named.start);
            if (hs > 0.0) {
                add(hs - eps, named.start);
                add(hs, named.center);
            } else {
                add((length - he) / 2.0, named.center);
            }
            if (he > 0.0) {
                add(length - he, named.center);
                add(length - he + eps, named.end);
            }
            add(length, named.end);
        } else if (named.onlyEndsAndCenter && named.start && named.center && !named.end) {
            const double transition = hs > 0.0 ? hs : length * options.defaultTransitionRatio;
            add(0.0, named.start);
            add(transition - eps, named.start);
            add(transition, named.center);
            add(length, named.center);
        } else if (named.onlyEndsAndCenter && !named.start && named.center && named.end) {
            const double transition = he > 0.0 ? length - he : length * (1.0 - options.defaultTransitionRatio);
            add(0.0, named.center);
            add(transition, named.center);
            add(transition + eps, named.end);
            add(length, named.end);
        } else {
            const double haunchStart = hs > 0.0 ? hs : length * options.defaultTransitionRatio;
            const double haunchEnd = he > 0.0 ? he : length * options.defaultTransitionRatio;
            for (const auto& section : spec.sections) {
                stations.push_back({ positionDistance(section.position, length, haunchStart, haunchEnd), section.profile });
            }
            std::stable_sort(stations.begin(), stations.end(),
                [](const SolidStation& a, const SolidStation& b) { return a.z < b.z; });
            if (stations.back().z - stations.front().z < kSameStation) {
                // Every section sits at the same place, nothing to loft between.
                stations.clear();
                return stations;
            }
            if (stations.front().z > 0.0) {
                stations.insert(stations.begin(), SolidStation{ 0.0, stations.front().profile });
            }
            if (stations.back().z < length) {
                stations.push_back({ length, stations.back().profile });
            }
        }

        stations = mergeCoincident(std::move(stations));
        if (stations.size() < 2) {
            stations.clear();
        }
        return stations;
    }

    std::optional<LoftedSolid> buildLoftedSolid(const MultiSectionSpec& spec, double length, const GeometryOptions& options) {
        if (spec.sections.size() < 2) {
            return std::nullopt;
        }
        return buildLoftedSolid(resolveStations(spec, length, options), length);
    }

    std::optional<LoftedSolid> buildLoftedSolid(std::vector<SolidStation> stations, double length) {
        if (stations.size() < 2 || !std::isfinite(length) || !(length > 0.0)) {
            return std::nullopt;
        }
        const Profile& reference = stations.front().profile;
        for (const auto& station : stations) {
            if (!station.profile.hasSameTopology(reference) || !isProfileUsable(station.profile)) {
                return std::nullopt;
            }
        }
        for (size_t i = 1; i < stations.size(); ++i) {
            if (!(stations[i].z > stations[i - 1].z)) {
                return std::nullopt;
            }
        }
        LoftedSolid solid;
        solid.stations = std::move(stations);
        solid.length = length;
        return solid;
    }

    std::optional<Profile> LoftedSolid::sectionAt(double z) const {
        if (stations.empty()) return std::nullopt;
        z = std::clamp(z, stations.front().z, stations.back().z);
        for (size_t i = 1; i < stations.size(); ++i) {
            const SolidStation& a = stations[i - 1];
            const SolidStation& b = stations[i];
            if (z <= b.z) {
                const double span = b.z - a.z;
                const double t = span > 0.0 ? (z - a.z) / span : 0.0;
                return interpolateProfiles(a.profile, b.profile, t);
            }
        }
        return stations.back().profile;
    }

} // namespace StbGeom::Engine
