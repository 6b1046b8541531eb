#ifndef STRUTGRID_SLAB_GRID_GENERATOR_HXX
#define STRUTGRID_SLAB_GRID_GENERATOR_HXX

#include "ControlPointIntegrator.hxx"
#include "PlanarRegion.hxx"
#include "QuadMesh.hxx"
#include "SlabGridOptions.hxx"
#include "Vec3.hxx"

#include <cstddef>
#include <optional>
#include <vector>

struct SlabGridResult {
    QuadMesh mesh;
    std::vector<TieLine> orthogonalLines;   // station lines, then control point connectors
    std::vector<TieLine> diagonalLines;     // empty unless requested
    std::vector<double> uStations;
    std::vector<double> vStations;
    std::vector<ControlPointRecord> controlPoints;
    double spacing = 0.0;
    std::size_t connectorCount = 0;         // trailing entries of orthogonalLines
};

// Strut-and-tie grid over a trimmed planar slab region.
//
//   stations  regular subdivision per axis, refined at control points
//   lines     one clipped tie line per station, optional cell diagonals
//   mesh      one quad per inside cell, control points as first vertices
//
// Throws SlabGridError on invalid input; per-element problems (points off the
// region, lines fully outside) are left out of the result instead.
class SlabGridGenerator {
public:
    explicit SlabGridGenerator(const SlabGridOptions& options = SlabGridOptions()) : options_(options) {}

    SlabGridResult generate(const PlanarRegion& region,
                            const std::vector<Point3>& controlPoints,
                            UnitSystem units = UnitSystem::Metric,
                            std::optional<double> spacingOverride = std::nullopt,
                            bool addDiagonals = false,
                            double tol = 1e-3) const;

    // Override when given, else the unit system default
    double resolveSpacing(UnitSystem units, std::optional<double> spacingOverride) const;

    const SlabGridOptions& options() const { return options_; }

private:
    SlabGridOptions options_;
};

// Convenience: generate with default options
SlabGridResult generateSlabGrid(const PlanarRegion& region,
                                const std::vector<Point3>& controlPoints,
                                UnitSystem units = UnitSystem::Metric,
                                std::optional<double> spacingOverride = std::nullopt,
                                bool addDiagonals = false,
                                double tol = 1e-3);

#endif // STRUTGRID_SLAB_GRID_GENERATOR_HXX
