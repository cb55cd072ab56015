#pragma once

#include <engine/GeometryOptions.h>

#include <optional>
#include <string>

namespace StbGeom {

struct ShellOptions {
    Engine::GeometryOptions geometry;
    // <= 0 lets the kernel pick the linear deflection from the shape size.
    double deflection = -1.0;
    bool quiet = false;
    bool showHelp = false;
};

// nullopt on an unknown flag or a bad value, with the problem in error.
std::optional<ShellOptions> ParseCommandLine(int argc, char* argv[], std::string& error);

std::string UsageText(const char* program);

} // namespace StbGeom
