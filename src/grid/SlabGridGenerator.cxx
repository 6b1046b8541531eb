#include "SlabGridGenerator.hxx"

#include "GridMeshBuilder.hxx"
#include "LineClipper.hxx"
#include "PointClassifier.hxx"
#include "SlabGridError.hxx"
#include "StationBuilder.hxx"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace {

void appendClipped(const LineClipper& clipper, const PlanarRegion& region,
                   const TieLine& line, std::vector<TieLine>& out) {
    for (const TieLine& piece : clipper.clip(line, region)) out.push_back(piece);
}

const char* unitName(UnitSystem units) {
    return units == UnitSystem::Imperial ? "imperial" : "metric";
}

} // namespace

double SlabGridGenerator::resolveSpacing(UnitSystem units, std::optional<double> spacingOverride) const {
    const double spacing = spacingOverride
        ? *spacingOverride
        : (units == UnitSystem::Imperial ? options_.imperialSpacing : options_.metricSpacing);
    if (!std::isfinite(spacing) || !(spacing > 0.0)) {
        throw SlabGridError(SlabGridErrorKind::InvalidArgument,
                            "Grid spacing must be positive and finite, got " + std::to_string(spacing));
    }
    return spacing;
}

SlabGridResult SlabGridGenerator::generate(const PlanarRegion& region,
                                           const std::vector<Point3>& controlPoints,
                                           UnitSystem units,
                                           std::optional<double> spacingOverride,
                                           bool addDiagonals,
                                           double tol) const {
    // Validate inputs
    if (!std::isfinite(tol) || !(tol > 0.0)) {
        throw SlabGridError(SlabGridErrorKind::InvalidArgument, "Tolerance must be positive and finite");
    }
    if (region.empty()) {
        throw SlabGridError(SlabGridErrorKind::InvalidArgument, "Region is empty");
    }
    if (controlPoints.empty()) {
        throw SlabGridError(SlabGridErrorKind::InvalidArgument, "No control points given");
    }
    const double spacing = resolveSpacing(units, spacingOverride);

    std::string why;
    if (!region.isValid(tol, &why)) {
        throw SlabGridError(SlabGridErrorKind::PreconditionViolation, "Region is not a single planar face: " + why);
    }
    Interval uDom, vDom;
    if (!region.domain(uDom, vDom)) {
        throw SlabGridError(SlabGridErrorKind::PreconditionViolation, "Region parameter domain is not available");
    }
    spdlog::debug("slab grid: spacing {} ({}), domain u [{}, {}] v [{}, {}], {} hole(s)",
                  spacing, spacingOverride ? "override" : unitName(units),
                  uDom.t0, uDom.t1, vDom.t0, vDom.t1, region.holeCount());

    const PointClassifier classifier(tol, options_.searchFactor, options_.acceptFactor);
    const LineClipper clipper(classifier, options_.clipStrategy, options_.sampledMinSamples,
                              options_.sampledPitchFactor, options_.sampledMaxSamples);

    SlabGridResult result;
    result.spacing = spacing;

    // Control points
    const ControlPointIntegrator integrator(tol, spacing, options_);
    result.controlPoints = integrator.validate(region, controlPoints);
    std::vector<double> uPivots, vPivots;
    if (options_.insertPivots) ControlPointIntegrator::collectPivots(result.controlPoints, uPivots, vPivots);
    const auto accepted = std::count_if(result.controlPoints.begin(), result.controlPoints.end(),
                                        [](const ControlPointRecord& r) { return r.accepted; });
    spdlog::debug("slab grid: {} of {} control point(s) accepted", accepted, controlPoints.size());

    // Stations
    const StationBuilder stations(tol, options_.maxSpans, options_.snapFraction, options_.snapPivots);
    const double snap = stations.snapTolerance(uDom, vDom, spacing);
    result.uStations = stations.build(uDom, spacing, uPivots, snap);
    result.vStations = stations.build(vDom, spacing, vPivots, snap);
    spdlog::debug("slab grid: {} u station(s), {} v station(s)", result.uStations.size(), result.vStations.size());

    // Orthogonal lines
    for (double u : result.uStations) {
        appendClipped(clipper, region, {region.pointAt(u, vDom.t0), region.pointAt(u, vDom.t1)},
                      result.orthogonalLines);
    }
    for (double v : result.vStations) {
        appendClipped(clipper, region, {region.pointAt(uDom.t0, v), region.pointAt(uDom.t1, v)},
                      result.orthogonalLines);
    }

    const StationGrid grid = StationGrid::evaluate(region, result.uStations, result.vStations, classifier);

    if (options_.connectControlPoints) {
        const auto connectors = integrator.connect(region, result.controlPoints, grid, clipper);
        result.connectorCount = connectors.size();
        result.orthogonalLines.insert(result.orthogonalLines.end(), connectors.begin(), connectors.end());
    }

    // Mesh
    const GridMeshBuilder meshBuilder(classifier, options_.vertexMergeFactor * tol);
    result.mesh = meshBuilder.build(region, grid, result.controlPoints);
    if (result.mesh.nfaces == 0) {
        throw SlabGridError(SlabGridErrorKind::GeometryConstructionFailure,
                            "No grid cell lies inside the region; try a smaller spacing");
    }

    // Diagonals
    if (addDiagonals) {
        for (std::size_t i = 0; i + 1 < grid.u.size(); ++i) {
            for (std::size_t j = 0; j + 1 < grid.v.size(); ++j) {
                if (!meshBuilder.cellInside(region, grid, i, j)) continue;
                const Point3& p00 = grid.points[grid.index(i, j)];
                const Point3& p10 = grid.points[grid.index(i + 1, j)];
                const Point3& p11 = grid.points[grid.index(i + 1, j + 1)];
                const Point3& p01 = grid.points[grid.index(i, j + 1)];
                appendClipped(clipper, region, {p00, p11}, result.diagonalLines);
                appendClipped(clipper, region, {p10, p01}, result.diagonalLines);
            }
        }
    }

    spdlog::debug("slab grid: {} orthogonal line(s) ({} connector(s)), {} diagonal line(s), {} face(s)",
                  result.orthogonalLines.size(), result.connectorCount, result.diagonalLines.size(),
                  result.mesh.nfaces);
    return result;
}

SlabGridResult generateSlabGrid(const PlanarRegion& region,
                                const std::vector<Point3>& controlPoints,
                                UnitSystem units,
                                std::optional<double> spacingOverride,
                                bool addDiagonals,
                                double tol) {
    return SlabGridGenerator().generate(region, controlPoints, units, spacingOverride, addDiagonals, tol);
}
