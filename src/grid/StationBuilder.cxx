#include "StationBuilder.hxx"

#include "SlabGridError.hxx"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>

int StationBuilder::spanCount(double length, double spacing) const {
    const double raw = std::round(length / spacing);
    if (!(raw >= 1.0)) return 1;
    if (raw >= static_cast<double>(maxSpans_)) return std::max(1, maxSpans_);
    return static_cast<int>(raw);
}

double StationBuilder::snapTolerance(const Interval& domain, double spacing) const {
    if (!snapPivots_) return tol_;
    const double d = domain.length() / spanCount(domain.length(), spacing);
    return std::max(tol_, snapFraction_ * d);
}

double StationBuilder::snapTolerance(const Interval& u, const Interval& v, double spacing) const {
    if (!snapPivots_) return tol_;
    return std::min(snapTolerance(u, spacing), snapTolerance(v, spacing));
}

std::vector<double> StationBuilder::build(const Interval& domain, double spacing,
                                          const std::vector<double>& pivots) const {
    return build(domain, spacing, pivots, domain.isValid() ? snapTolerance(domain, spacing) : tol_);
}

std::vector<double> StationBuilder::build(const Interval& domain, double spacing,
                                          const std::vector<double>& pivots, double snap) const {
    if (!domain.isValid()) {
        throw SlabGridError(SlabGridErrorKind::InvalidArgument, "Station domain is empty or not finite");
    }
    if (!std::isfinite(spacing) || !(spacing > 0.0)) {
        throw SlabGridError(SlabGridErrorKind::InvalidArgument, "Grid spacing must be positive and finite");
    }

    const double L = domain.length();
    const int n = spanCount(L, spacing);
    const double d = L / n;

    std::vector<double> stations;
    stations.reserve(static_cast<std::size_t>(n) + 1 + pivots.size());
    for (int i = 0; i < n; ++i) stations.push_back(domain.t0 + i * d);
    stations.push_back(domain.t1);

    for (double p : pivots) {
        if (!std::isfinite(p) || p < domain.t0 - tol_ || p > domain.t1 + tol_) continue;
        p = domain.clamp(p);

        auto it = std::lower_bound(stations.begin(), stations.end(), p);
        double nearest = std::numeric_limits<double>::infinity();
        if (it != stations.end()) nearest = *it - p;
        if (it != stations.begin()) nearest = std::min(nearest, p - *std::prev(it));
        if (nearest <= snap) continue;

        stations.insert(it, p);
    }
    return stations;
}

std::size_t StationGrid::insideCount() const {
    return static_cast<std::size_t>(std::count(inside.begin(), inside.end(), 1));
}

StationGrid StationGrid::evaluate(const PlanarRegion& region,
                                  const std::vector<double>& u,
                                  const std::vector<double>& v,
                                  const PointClassifier& classifier) {
    StationGrid grid;
    grid.u = u;
    grid.v = v;
    grid.points.reserve(u.size() * v.size());
    grid.inside.reserve(u.size() * v.size());
    for (double ui : u) {
        for (double vj : v) {
            const Point3 p = region.pointAt(ui, vj);
            grid.points.push_back(p);
            grid.inside.push_back(classifier.isInsideOrOn(region, p) ? 1 : 0);
        }
    }
    return grid;
}
