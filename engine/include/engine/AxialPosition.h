#pragma once

#include "engine/engine_export.h"

#include <optional>
#include <string_view>

namespace StbGeom::Engine {

    // Where along a member a cross-section applies.
    struct AxialPosition {
        enum class Kind {
            Start,
            Bottom,
            HaunchStart,
            Center,
            HaunchEnd,
            End,
            Top,
            Numeric // distance from the start/bottom end, in mm
        };

        Kind kind = Kind::Center;
        double value = 0.0;

        static AxialPosition named(Kind kind) { return AxialPosition{ kind, 0.0 }; }
        static AxialPosition at(double distance) { return AxialPosition{ Kind::Numeric, distance }; }

        bool operator==(const AxialPosition& other) const {
            return kind == other.kind && (kind != Kind::Numeric || value == other.value);
        }
        bool operator!=(const AxialPosition& other) const { return !(*this == other); }
    };

    // BOTTOM, TOP, CENTER, START, END, HAUNCH_S, HAUNCH_E or a number.
    STBGEOM_ENGINE_API std::optional<AxialPosition> parseAxialPosition(std::string_view text);
    STBGEOM_ENGINE_API const char* axialPositionName(AxialPosition::Kind kind);

} // namespace StbGeom::Engine
