// --- Includes ---
#include <engine/ElementGenerator.h>
#include <engine/GenerationContext.h>
#include <engine/Logger.h>
#include <engine/geometry/SolidConverter.h>
#include <cad_kernel/cad_kernel.h>

#include "CommandLine.h"
#include "DemoModel.h"

#include <fmt/core.h>

#include <atomic>
#include <iostream>
#include <map>
#include <string>

#ifndef STBGEOM_VERSION_STRING
#define STBGEOM_VERSION_STRING "0.1.0"
#endif

namespace {

    struct FamilyTotals {
        size_t solids = 0;
        size_t triangles = 0;
        double volume = 0.0;
    };

    void PrintSkipped(const StbGeom::Engine::BatchResult& result) {
        for (const auto& skip : result.skipped) {
            fmt::print("  skipped {:<8} {:<14} {:<22} {}\n", skip.elementId,
                StbGeom::Engine::elementFamilyName(skip.family),
                StbGeom::Engine::skipReasonName(skip.reason), skip.detail);
        }
    }

} // namespace

int main(int argc, char* argv[]) {
    std::string error;
    auto options = StbGeom::ParseCommandLine(argc, argv, error);
    if (!options) {
        std::cerr << "Shell Error: " << error << "\n" << StbGeom::UsageText(argv[0]);
        return 2;
    }
    if (options->showHelp) {
        std::cout << StbGeom::UsageText(argv[0]);
        return 0;
    }

    StbGeom::Engine::StreamLogger logger(options->quiet ? StbGeom::Engine::LogLevel::Warning
                                                        : StbGeom::Engine::LogLevel::Info);
    logger.info("Shell", "StbGeom {} starting, {} worker(s), {} circle segments",
        STBGEOM_VERSION_STRING, options->geometry.workerCount, options->geometry.circleSegments);
    StbGeom::CadKernel::initialize();

    // --- Batch ---
    const StbGeom::DemoModel model = StbGeom::BuildDemoModel();
    StbGeom::Engine::GenerationContext context{
        model.nodes, model.sections, model.steelShapes, logger, options->geometry };
    std::atomic<bool> cancel{ false };
    const StbGeom::Engine::BatchResult result = StbGeom::Engine::generateBatch(model.elements, context, &cancel);

    // --- Conversion ---
    std::map<std::string, FamilyTotals> totals;
    size_t failedConversions = 0;
    for (const auto& solid : result.solids) {
        auto geometry = StbGeom::Engine::convertSolid(solid, logger);
        if (!geometry) {
            ++failedConversions;
            continue;
        }
        StbGeom::CadKernel::MeshBuffers mesh = options->deflection > 0.0
            ? StbGeom::CadKernel::TriangulateShape(*geometry->getShape(), options->deflection)
            : geometry->getRenderMesh();

        FamilyTotals& family = totals[StbGeom::Engine::elementFamilyName(solid.family)];
        ++family.solids;
        family.triangles += mesh.triangleCount();
        family.volume += geometry->volume();
        logger.info("Shell", "{} {} ({}, {}): length {:.1f} mm, {} triangles",
            solid.elementId, StbGeom::Engine::solidRoleName(solid.role),
            StbGeom::Engine::sectionFamilyName(solid.metadata.family),
            StbGeom::Engine::profileSourceName(solid.metadata.profileSource),
            solid.length(), mesh.triangleCount());
    }

    // --- Summary ---
    fmt::print("\n{} elements, {} solids, {} skipped, {} conversion failures\n",
        result.processed, result.solids.size(), result.skipped.size(), failedConversions);
    for (const auto& [name, family] : totals) {
        fmt::print("  {:<14} {:>3} solids {:>8} triangles {:>10.3f} m3\n",
            name, family.solids, family.triangles, family.volume / 1e9);
    }
    PrintSkipped(result);
    return failedConversions == 0 ? 0 : 1;
}
