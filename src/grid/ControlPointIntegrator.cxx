#include "ControlPointIntegrator.hxx"

#include "PointClassifier.hxx"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

bool ControlPointIntegrator::validateOne(const PlanarRegion& region, ControlPointRecord& rec) const {
    if (!Vec3::isFinite(rec.input)) return false;

    double u = 0.0, v = 0.0;
    if (!region.closestParameter(rec.input, u, v)) return false;

    const Point3 surfacePt = region.pointAt(u, v);
    const Point3 projected = region.projectToPlane(rec.input);
    const bool useProjection = Vec3::distance(projected, rec.input) < options_.projectionFraction * spacing_;
    rec.point = useProjection ? projected : surfacePt;

    // parameters of the chosen point (differs from (u, v) only outside the domain)
    if (!region.closestParameter(rec.point, rec.u, rec.v)) return false;

    const PointClassifier loose(options_.looseToleranceFactor * tol_, options_.searchFactor, options_.acceptFactor);
    return loose.isInsideOrOn(region, rec.point);
}

std::vector<ControlPointRecord> ControlPointIntegrator::validate(const PlanarRegion& region,
                                                                 const std::vector<Point3>& points) const {
    std::vector<ControlPointRecord> records;
    records.reserve(points.size());
    for (const Point3& p : points) {
        ControlPointRecord rec;
        rec.input = p;
        rec.point = p;
        rec.accepted = validateOne(region, rec);
        if (!rec.accepted) {
            spdlog::debug("control point ({:.6g}, {:.6g}, {:.6g}) is off the region, ignored", p[0], p[1], p[2]);
        }
        records.push_back(rec);
    }
    return records;
}

void ControlPointIntegrator::collectPivots(const std::vector<ControlPointRecord>& records,
                                           std::vector<double>& uPivots,
                                           std::vector<double>& vPivots) {
    uPivots.clear();
    vPivots.clear();
    for (const auto& rec : records) {
        if (!rec.accepted) continue;
        uPivots.push_back(rec.u);
        vPivots.push_back(rec.v);
    }
}

std::vector<TieLine> ControlPointIntegrator::connect(const PlanarRegion& region,
                                                     const std::vector<ControlPointRecord>& records,
                                                     const StationGrid& grid,
                                                     const LineClipper& clipper) const {
    const double radius = options_.connectionRadiusFraction * spacing_;
    const double selfDistance = options_.nodeSeparationFactor * tol_;
    const std::size_t maxConnectors = static_cast<std::size_t>(std::max(0, options_.maxConnectors));

    std::vector<TieLine> connectors;
    for (const auto& rec : records) {
        if (!rec.accepted) continue;

        // (distance, node) sorted by distance then node index
        std::vector<std::pair<double, std::size_t>> nearby;
        for (std::size_t k = 0; k < grid.size(); ++k) {
            if (!grid.inside[k]) continue;
            const double d = Vec3::distance(rec.point, grid.points[k]);
            if (d > radius || d <= selfDistance) continue;
            nearby.emplace_back(d, k);
        }
        std::sort(nearby.begin(), nearby.end());
        if (nearby.size() > maxConnectors) nearby.resize(maxConnectors);

        for (const auto& cand : nearby) {
            const TieLine full{rec.point, grid.points[cand.second]};
            const double minLength = options_.minCoverageFraction * full.length();
            for (const TieLine& piece : clipper.clip(full, region)) {
                if (piece.length() >= minLength) {
                    connectors.push_back(piece);
                    break;
                }
            }
        }
    }
    return connectors;
}
