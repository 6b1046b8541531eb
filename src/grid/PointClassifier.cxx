#include "PointClassifier.hxx"

#include <spdlog/spdlog.h>

#include <exception>

const char* toString(PointLocation loc) {
    switch (loc) {
    case PointLocation::Inside: return "Inside";
    case PointLocation::OnBoundary: return "OnBoundary";
    case PointLocation::Outside: return "Outside";
    }
    return "Outside";
}

PointLocation PointClassifier::classify(const PlanarRegion& region, const Point3& p) const {
    try {
        if (region.isPointInside(p, tol_, true)) return PointLocation::Inside;
        const BoundaryHit hit = region.closestBoundaryPoint(p, searchFactor_ * tol_);
        if (hit.found && hit.distance <= acceptFactor_ * tol_) return PointLocation::OnBoundary;
        return PointLocation::Outside;
    } catch (const std::exception& e) {
        // fail closed
        spdlog::debug("classify ({:.6g}, {:.6g}, {:.6g}): query failed, treating as outside: {}",
                      p[0], p[1], p[2], e.what());
        return PointLocation::Outside;
    }
}
