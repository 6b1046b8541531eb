#include "RegionBuilder.hxx"

#include <cmath>
#include <algorithm>

Polygon2 RegionBuilder::sampleLoop(const std::vector<Nurbs>& curves, const Loop& L) const {
    Polygon2 pts;
    for (const auto& oc : L) {
        const auto& c = curves[oc.index];
        Polygon2 seg = c.isLinear() ? c.controlPoints() : c.sample(std::max(2, samplesPerCurve_));
        if (oc.reversed) std::reverse(seg.begin(), seg.end());
        // Drop the end point: it is the start of the next curve (or of the loop)
        seg.pop_back();
        pts.insert(pts.end(), seg.begin(), seg.end());
    }
    return pts;
}

double RegionBuilder::signedArea(const Polygon2& poly) {
    double a = 0.0;
    for (std::size_t k = 0; k < poly.size(); ++k) {
        const auto& A = poly[k];
        const auto& B = poly[(k + 1) % poly.size()];
        a += A[0] * B[1] - B[0] * A[1];
    }
    return 0.5 * a;
}

bool RegionBuilder::onSegmentTol(const Nurbs::Point& a, const Nurbs::Point& b, const Nurbs::Point& p, double tol) {
    const double vx = b[0] - a[0];
    const double vy = b[1] - a[1];
    const double wx = p[0] - a[0];
    const double wy = p[1] - a[1];
    const double c2 = vx * vx + vy * vy;
    if (c2 == 0.0) return wx * wx + wy * wy <= tol * tol;
    const double len = std::sqrt(c2);
    // projection must fall within [-tol, len + tol] along the segment
    const double along = (vx * wx + vy * wy) / len;
    if (along < -tol || along > len + tol) return false;
    return std::fabs(vx * wy - vy * wx) <= tol * len;
}

bool RegionBuilder::pointInPolygon(const Polygon2& poly, const Nurbs::Point& p, double tol) {
    if (poly.size() < 3) return false;
    // Ray casting with tolerance on edges
    int crossings = 0;
    for (std::size_t i = 0; i < poly.size(); ++i) {
        const auto& a = poly[i];
        const auto& b = poly[(i + 1) % poly.size()];
        if (onSegmentTol(a, b, p, tol)) return true; // on-edge counts as inside
        const bool condY = ((a[1] <= p[1]) && (b[1] > p[1])) || ((a[1] > p[1]) && (b[1] <= p[1]));
        if (condY) {
            const double xInt = a[0] + (p[1] - a[1]) * (b[0] - a[0]) / (b[1] - a[1]);
            if (xInt > p[0]) crossings++;
        }
    }
    return (crossings % 2) == 1;
}

std::vector<Region> RegionBuilder::buildRegions(const std::vector<Nurbs>& curves, const std::vector<Loop>& loops) const {
    struct LoopGeom {
        const Loop* loop;
        Polygon2 poly;
        Nurbs::Point repr;
        double area;
        Nurbs::Point lo, hi;
    };
    std::vector<LoopGeom> geoms;
    geoms.reserve(loops.size());
    for (const auto& L : loops) {
        auto poly = sampleLoop(curves, L);
        if (poly.size() < 3) continue;
        LoopGeom g{&L, poly, poly.front(), std::fabs(signedArea(poly)), poly.front(), poly.front()};
        for (const auto& p : poly) {
            g.lo[0] = std::min(g.lo[0], p[0]); g.lo[1] = std::min(g.lo[1], p[1]);
            g.hi[0] = std::max(g.hi[0], p[0]); g.hi[1] = std::max(g.hi[1], p[1]);
        }
        // Representative point: midpoint of the first edge (lies on the loop itself)
        g.repr = Nurbs::Point{0.5 * (poly[0][0] + poly[1][0]), 0.5 * (poly[0][1] + poly[1][1])};
        geoms.push_back(std::move(g));
    }

    const std::size_t m = geoms.size();
    auto boxContains = [&](const LoopGeom& A, const LoopGeom& B) {
        return A.lo[0] - tol_ <= B.lo[0] && A.lo[1] - tol_ <= B.lo[1] &&
               A.hi[0] + tol_ >= B.hi[0] && A.hi[1] + tol_ >= B.hi[1];
    };

    // parent = smallest strictly larger loop containing this one
    std::vector<int> parent(m, -1);
    for (std::size_t j = 0; j < m; ++j) {
        for (std::size_t i = 0; i < m; ++i) {
            if (i == j || !(geoms[i].area > geoms[j].area)) continue;
            if (!boxContains(geoms[i], geoms[j])) continue;
            if (!pointInPolygon(geoms[i].poly, geoms[j].repr, tol_)) continue;
            if (parent[j] == -1 || geoms[i].area < geoms[static_cast<std::size_t>(parent[j])].area) {
                parent[j] = static_cast<int>(i);
            }
        }
    }

    // Even nesting depth => outer loop, odd => hole of its parent
    std::vector<int> depth(m, 0);
    for (std::size_t i = 0; i < m; ++i) {
        for (int p = parent[i]; p != -1; p = parent[static_cast<std::size_t>(p)]) depth[i]++;
    }

    std::vector<std::size_t> outers;
    for (std::size_t i = 0; i < m; ++i) if (depth[i] % 2 == 0) outers.push_back(i);
    std::sort(outers.begin(), outers.end(), [&](std::size_t a, std::size_t b) {
        return geoms[a].area > geoms[b].area;
    });

    std::vector<Region> regions;
    regions.reserve(outers.size());
    for (std::size_t i : outers) {
        Region R;
        R.outer = *geoms[i].loop;
        for (std::size_t j = 0; j < m; ++j) {
            if (parent[j] == static_cast<int>(i) && depth[j] % 2 == 1) R.inners.push_back(*geoms[j].loop);
        }
        regions.push_back(std::move(R));
    }
    return regions;
}
