#include "engine/GeneratedSolid.h"

namespace StbGeom::Engine {

    const char* profileSourceName(ProfileSource source) {
        switch (source) {
            case ProfileSource::Calculator: return "calculator";
            case ProfileSource::IfcEquivalent: return "ifc-equivalent";
            case ProfileSource::Fallback: return "fallback";
        }
        return "unknown";
    }

    const char* solidRoleName(SolidRole role) {
        switch (role) {
            case SolidRole::Main: return "main";
            case SolidRole::BasePlate: return "base-plate";
            case SolidRole::Concrete: return "concrete";
        }
        return "unknown";
    }

    const char* skipReasonName(SkipReason reason) {
        switch (reason) {
            case SkipReason::MissingNodes: return "missing-nodes";
            case SkipReason::MissingSection: return "missing-section";
            case SkipReason::InvalidLength: return "invalid-length";
            case SkipReason::DegenerateProfile: return "degenerate-profile";
            case SkipReason::DegenerateGeometry: return "degenerate-geometry";
            case SkipReason::InsufficientSections: return "insufficient-sections";
        }
        return "unknown";
    }

} // namespace StbGeom::Engine
