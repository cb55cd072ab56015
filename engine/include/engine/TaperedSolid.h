#ifndef STBGEOM_TAPERED_SOLID_H
#define STBGEOM_TAPERED_SOLID_H

#include "engine/engine_export.h"
#include "engine/AxialPosition.h"
#include "engine/GeometryOptions.h"
#include "engine/Profile.h"

#include <optional>
#include <vector>

namespace StbGeom::Engine {

    // Explicit lengths of the end zones of a haunch or joint member, in mm.
    // Each end zone holds its section uniformly and meets the centre section
    // in an abrupt change of GeometryOptions::jointEpsilon.
    struct SegmentLengths {
        std::optional<double> start;
        std::optional<double> end;
    };

    struct PositionedProfile {
        AxialPosition position;
        Profile profile;
    };

    struct MultiSectionSpec {
        std::vector<PositionedProfile> sections;
        SegmentLengths segments;
    };

    // A cross-section at distance z from the start (bottom) end.
    struct SolidStation {
        double z = 0.0;
        Profile profile;
    };

    // Ruled solid through ordered stations spanning [0, length]. Consecutive
    // stations are joined by vertex-wise linear interpolation.
    struct LoftedSolid {
        std::vector<SolidStation> stations;
        double length = 0.0;

        // Interpolated cross-section, z is clamped to [0, length].
        std::optional<Profile> sectionAt(double z) const;
    };

    // Maps named positions onto distances and orders the stations. Returns an
    // empty list when fewer than two distinct positions remain.
    STBGEOM_ENGINE_API std::vector<SolidStation> resolveStations(
        const MultiSectionSpec& spec, double length, const GeometryOptions& options);

    // nullopt for fewer than two sections, mismatched vertex counts or a
    // non-positive length.
    STBGEOM_ENGINE_API std::optional<LoftedSolid> buildLoftedSolid(
        const MultiSectionSpec& spec, double length, const GeometryOptions& options);

    // Loft through explicit stations (extended piles).
    STBGEOM_ENGINE_API std::optional<LoftedSolid> buildLoftedSolid(std::vector<SolidStation> stations, double length);

} // namespace StbGeom::Engine

#endif // STBGEOM_TAPERED_SOLID_H
