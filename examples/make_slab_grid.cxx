#include "SlabGridExport.hxx"
#include "SlabGridGenerator.hxx"
#include "SlabGridError.hxx"

#include <spdlog/spdlog.h>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

// Rectangle loop in the z = level plane, counter-clockwise
static std::vector<Point3> rectLoop(double x0, double y0, double x1, double y1, double level) {
    return {{x0,y0,level}, {x1,y0,level}, {x1,y1,level}, {x0,y1,level}};
}

// L-shaped slab (mm) with a stair opening; columns as control points
static PlanarRegion sampleSlab(double level) {
    std::vector<Point3> outer{{0,0,level}, {12000,0,level}, {12000,5000,level},
                              {7000,5000,level}, {7000,9000,level}, {0,9000,level}};
    return PlanarRegion::fromWorldLoops({outer, rectLoop(2500, 5500, 4700, 7800, level)}, 1e-6);
}

static std::vector<Point3> sampleColumns(double level) {
    return {
        {0, 0, level}, {6000, 0, level}, {12000, 0, level},
        {3300, 2450, level},            // between stations
        {12000, 5000, level}, {7000, 5000, level},
        {0, 9000, level}, {7000, 9000, level},
        {3600, 6600, level},            // inside the opening: discarded
        {9500, 2500, level + 150.0}     // slightly above the slab
    };
}

int main(int argc, char** argv) {
    bool diagonals = false;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-d") == 0) diagonals = true;
        else if (std::strcmp(argv[i], "-v") == 0) spdlog::set_level(spdlog::level::debug);
        else args.emplace_back(argv[i]);
    }
    if (args.size() > 2) {
        std::fprintf(stderr, "Usage: %s [-d] [-v] [spacing_mm] [out.msh]\n", argv[0]);
        return 2;
    }
    std::optional<double> spacing;
    if (!args.empty()) {
        spacing = std::atof(args[0].c_str());
    }
    const std::string mshPath = (args.size() >= 2) ? args[1] : "slab_grid.msh";

    const double level = 3200.0;
    SlabGridResult result;
    PlanarRegion region;
    try {
        region = sampleSlab(level);
        result = generateSlabGrid(region, sampleColumns(level), UnitSystem::Metric, spacing, diagonals);
    } catch (const SlabGridError& e) {
        spdlog::error("grid generation failed ({}): {}", toString(e.kind()), e.what());
        return 1;
    }

    std::size_t accepted = 0;
    for (const auto& cp : result.controlPoints) {
        if (cp.accepted) ++accepted;
    }
    spdlog::info("spacing {} mm, {} x {} stations", result.spacing,
                 result.uStations.size(), result.vStations.size());
    spdlog::info("{} of {} control points kept, {} connectors", accepted,
                 result.controlPoints.size(), result.connectorCount);
    spdlog::info("{} quads, {} vertices, {} orthogonal and {} diagonal lines",
                 result.mesh.nfaces, result.mesh.nv,
                 result.orthogonalLines.size(), result.diagonalLines.size());

    std::string err;
    if (!SlabGridExport::writeMsh(region, result, mshPath, &err)) {
        std::fprintf(stderr, "Failed to write %s: %s\n", mshPath.c_str(), err.c_str());
        return 1;
    }
    std::printf("Wrote mesh: %s\n", mshPath.c_str());
    return 0;
}
