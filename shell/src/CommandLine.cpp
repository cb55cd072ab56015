#include "CommandLine.h"

#include <fmt/core.h>

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>

namespace StbGeom {

namespace {

bool ParsePositiveInt(const char* text, long maxValue, long& out) {
    char* end = nullptr;
    errno = 0;
    const long value = std::strtol(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || value <= 0 || value > maxValue) {
        return false;
    }
    out = value;
    return true;
}

bool ParseDouble(const char* text, double& out) {
    char* end = nullptr;
    const double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || !std::isfinite(value)) {
        return false;
    }
    out = value;
    return true;
}

} // namespace

std::optional<ShellOptions> ParseCommandLine(int argc, char* argv[], std::string& error) {
    ShellOptions options;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        const bool hasValue = i + 1 < argc;

        if (strcmp(arg, "--help") == 0 || strcmp(arg, "-h") == 0) {
            options.showHelp = true;
        } else if (strcmp(arg, "--quiet") == 0) {
            options.quiet = true;
        } else if (strcmp(arg, "--segments") == 0) {
            long segments = 0;
            if (!hasValue || !ParsePositiveInt(argv[++i], 4096, segments) || segments < 3) {
                error = "--segments expects an integer between 3 and 4096";
                return std::nullopt;
            }
            options.geometry.circleSegments = static_cast<int>(segments);
        } else if (strcmp(arg, "--workers") == 0) {
            long workers = 0;
            if (!hasValue || !ParsePositiveInt(argv[++i], 256, workers)) {
                error = "--workers expects an integer between 1 and 256";
                return std::nullopt;
            }
            options.geometry.workerCount = static_cast<size_t>(workers);
        } else if (strcmp(arg, "--beam-mode") == 0) {
            if (!hasValue) {
                error = "--beam-mode expects center or top";
                return std::nullopt;
            }
            const char* mode = argv[++i];
            if (strcmp(mode, "center") == 0) {
                options.geometry.beamPlacementMode = Engine::BeamPlacementMode::Center;
            } else if (strcmp(mode, "top") == 0) {
                options.geometry.beamPlacementMode = Engine::BeamPlacementMode::TopAligned;
            } else {
                error = fmt::format("unknown beam mode '{}', expected center or top", mode);
                return std::nullopt;
            }
        } else if (strcmp(arg, "--deflection") == 0) {
            if (!hasValue || !ParseDouble(argv[++i], options.deflection)) {
                error = "--deflection expects a number";
                return std::nullopt;
            }
        } else {
            error = fmt::format("unknown option '{}'", arg);
            return std::nullopt;
        }
    }
    return options;
}

std::string UsageText(const char* program) {
    return fmt::format(
        "Usage: {} [options]\n"
        "  --segments N        polygon segments for circular sections (default 32)\n"
        "  --beam-mode MODE    center | top, placement of beams and girders (default top)\n"
        "  --workers N         threads used for the element batch (default 1)\n"
        "  --deflection D      linear mesh deflection in mm, <= 0 for automatic\n"
        "  --quiet             only print warnings, errors and the summary\n",
        program);
}

} // namespace StbGeom
