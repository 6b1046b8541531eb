#include "PlanarRegion.hxx"
#include "LoopBuilder.hxx"
#include "SlabGridError.hxx"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {
constexpr int kRefineIterations = 60;

inline double dist2(const Nurbs::Point& a, const Nurbs::Point& b) {
    const double dx = a[0] - b[0];
    const double dy = a[1] - b[1];
    return dx * dx + dy * dy;
}

inline double chordLength(const Nurbs::Point& a, const Nurbs::Point& b) {
    return std::sqrt(dist2(a, b));
}

// Closest point to q on segment a-b
Nurbs::Point closestOnSegment(const Nurbs::Point& a, const Nurbs::Point& b, const Nurbs::Point& q) {
    const double vx = b[0] - a[0];
    const double vy = b[1] - a[1];
    const double c2 = vx * vx + vy * vy;
    if (c2 == 0.0) return a;
    double t = ((q[0] - a[0]) * vx + (q[1] - a[1]) * vy) / c2;
    t = std::max(0.0, std::min(1.0, t));
    return Nurbs::Point{a[0] + t * vx, a[1] + t * vy};
}

// Golden-section search of |C(u) - q| over [lo, hi]; returns the best squared
// distance and writes the corresponding curve point.
double refineClosest(const Nurbs& c, double lo, double hi, const Nurbs::Point& q, Nurbs::Point& best) {
    if (lo > hi) std::swap(lo, hi);
    const double g = 0.5 * (std::sqrt(5.0) - 1.0);
    double x1 = hi - g * (hi - lo);
    double x2 = lo + g * (hi - lo);
    double f1 = dist2(c.evaluate(x1), q);
    double f2 = dist2(c.evaluate(x2), q);
    for (int it = 0; it < kRefineIterations; ++it) {
        if (f1 < f2) {
            hi = x2; x2 = x1; f2 = f1;
            x1 = hi - g * (hi - lo);
            f1 = dist2(c.evaluate(x1), q);
        } else {
            lo = x1; x1 = x2; f1 = f2;
            x2 = lo + g * (hi - lo);
            f2 = dist2(c.evaluate(x2), q);
        }
    }
    best = c.evaluate(0.5 * (lo + hi));
    return dist2(best, q);
}

// Root of f(u) = s(C(u)) on [u0, u1] by bisection, given f(u0) and f(u1) differ in sign
template <class SignedFn>
double bisectCurve(const Nurbs& c, double u0, double u1, SignedFn f) {
    double lo = u0, hi = u1;
    const bool loNeg = f(c.evaluate(lo)) <= 0.0;
    for (int it = 0; it < kRefineIterations; ++it) {
        const double mid = 0.5 * (lo + hi);
        if ((f(c.evaluate(mid)) <= 0.0) == loNeg) lo = mid; else hi = mid;
    }
    return 0.5 * (lo + hi);
}

[[noreturn]] void failPrecondition(const std::string& what) {
    throw SlabGridError(SlabGridErrorKind::PreconditionViolation, what);
}
} // anonymous namespace

PlanarRegion::PlanarRegion(const Plane& plane,
                           std::vector<Nurbs> curves,
                           Region topology,
                           int samplesPerCurve)
    : plane_(plane),
      curves_(std::move(curves)),
      topology_(std::move(topology)),
      samplesPerCurve_(std::max(2, samplesPerCurve)) {
    buildEdges();
}

void PlanarRegion::buildEdges() {
    edges_.clear();
    uDom_ = Interval{};
    vDom_ = Interval{};
    if (topology_.outer.empty()) return;

    std::vector<const Loop*> loops{&topology_.outer};
    for (const auto& H : topology_.inners) loops.push_back(&H);

    bool first = true;
    Nurbs::Point lo{}, hi{};
    for (const Loop* L : loops) {
        std::vector<BoundaryEdge> ring;
        for (const auto& oc : *L) {
            if (oc.index >= curves_.size()) failPrecondition("Region loop references a missing boundary curve");
            const Nurbs& c = curves_[oc.index];
            std::string why;
            if (!c.isValid(&why)) failPrecondition("Invalid boundary curve: " + why);

            const auto box = c.controlBox();
            if (first) { lo = box.lo; hi = box.hi; first = false; }
            lo[0] = std::min(lo[0], box.lo[0]); lo[1] = std::min(lo[1], box.lo[1]);
            hi[0] = std::max(hi[0], box.hi[0]); hi[1] = std::max(hi[1], box.hi[1]);

            if (c.isLinear()) {
                auto P = c.controlPoints();
                if (oc.reversed) std::reverse(P.begin(), P.end());
                for (std::size_t k = 0; k + 1 < P.size(); ++k) {
                    if (dist2(P[k], P[k + 1]) == 0.0) continue;
                    ring.push_back(BoundaryEdge{oc.index, 0.0, 0.0, P[k], P[k + 1], true});
                }
                continue;
            }
            const double ua = oc.reversed ? c.uMax() : c.uMin();
            const double ub = oc.reversed ? c.uMin() : c.uMax();
            const int n = samplesPerCurve_;
            double uPrev = ua;
            Nurbs::Point pPrev = c.evaluate(ua);
            for (int s = 1; s < n; ++s) {
                const double u = (s == n - 1) ? ub : ua + (ub - ua) * static_cast<double>(s) / (n - 1);
                const Nurbs::Point p = c.evaluate(u);
                ring.push_back(BoundaryEdge{oc.index, uPrev, u, pPrev, p, false});
                uPrev = u;
                pPrev = p;
            }
        }
        edges_.push_back(std::move(ring));
    }
    uDom_ = Interval{lo[0], hi[0]};
    vDom_ = Interval{lo[1], hi[1]};
}

PlanarRegion PlanarRegion::fromCurves(const Plane& plane,
                                      const std::vector<Nurbs>& curves,
                                      double tol,
                                      int samplesPerCurve) {
    if (curves.empty()) {
        throw SlabGridError(SlabGridErrorKind::InvalidArgument, "Region has no boundary curves");
    }
    for (std::size_t i = 0; i < curves.size(); ++i) {
        std::string why;
        if (!curves[i].isValid(&why)) {
            std::ostringstream oss;
            oss << "Boundary curve " << i << " is invalid: " << why;
            failPrecondition(oss.str());
        }
    }

    LoopBuilder lb(tol);
    std::vector<std::size_t> leftovers;
    const auto loops = lb.buildClosedLoops(curves, &leftovers);
    if (!leftovers.empty()) {
        std::ostringstream oss;
        oss << leftovers.size() << " boundary curve(s) do not close into a loop";
        failPrecondition(oss.str());
    }

    RegionBuilder rb(tol, samplesPerCurve);
    auto regions = rb.buildRegions(curves, loops);
    if (regions.size() != 1) {
        std::ostringstream oss;
        oss << "Boundary must reduce to exactly one face, found " << regions.size();
        failPrecondition(oss.str());
    }
    if (regions.front().inners.size() + 1 != loops.size()) {
        failPrecondition("Boundary loops are nested deeper than one level of holes");
    }

    PlanarRegion region(plane, curves, std::move(regions.front()), samplesPerCurve);
    std::string why;
    if (!region.isValid(tol, &why)) failPrecondition(why);
    return region;
}

PlanarRegion PlanarRegion::fromWorldLoops(const std::vector<std::vector<Point3>>& loops, double tol) {
    if (loops.empty()) {
        throw SlabGridError(SlabGridErrorKind::InvalidArgument, "Region has no boundary loops");
    }

    std::vector<std::vector<Point3>> rings;
    rings.reserve(loops.size());
    for (const auto& L : loops) {
        std::vector<Point3> ring(L);
        // Closing vertex repeated at the end is optional
        while (ring.size() > 1 && Vec3::distance(ring.front(), ring.back()) <= tol) ring.pop_back();
        if (ring.size() < 3) failPrecondition("Boundary loop needs at least 3 distinct vertices");
        for (const auto& p : ring) {
            if (!Vec3::isFinite(p)) failPrecondition("Boundary loop has a non-finite vertex");
        }
        rings.push_back(std::move(ring));
    }

    // Newell normal of the loop with the largest projected area
    Point3 normal{};
    std::size_t ref = 0;
    double bestMag = 0.0;
    for (std::size_t r = 0; r < rings.size(); ++r) {
        Point3 nr{};
        const auto& ring = rings[r];
        for (std::size_t i = 0; i < ring.size(); ++i) {
            const auto& c = ring[i];
            const auto& d = ring[(i + 1) % ring.size()];
            nr[0] += (c[1] - d[1]) * (c[2] + d[2]);
            nr[1] += (c[2] - d[2]) * (c[0] + d[0]);
            nr[2] += (c[0] - d[0]) * (c[1] + d[1]);
        }
        const double mag = Vec3::norm(nr);
        if (mag > bestMag) { bestMag = mag; normal = nr; ref = r; }
    }
    if (!Vec3::normalized(normal, normal)) failPrecondition("Boundary loops enclose no area");

    Plane plane;
    plane.origin = rings[ref].front();
    bool haveAxis = false;
    for (std::size_t i = 1; i < rings[ref].size() && !haveAxis; ++i) {
        Point3 e = Vec3::sub(rings[ref][i], plane.origin);
        e = Vec3::sub(e, Vec3::scale(normal, Vec3::dot(e, normal)));
        if (Vec3::norm(e) > tol) haveAxis = Vec3::normalized(e, plane.xAxis);
    }
    if (!haveAxis) failPrecondition("Boundary loops are degenerate");
    plane.yAxis = Vec3::cross(normal, plane.xAxis);

    double worst = 0.0;
    for (const auto& ring : rings) {
        for (const auto& p : ring) {
            worst = std::max(worst, std::fabs(Vec3::dot(Vec3::sub(p, plane.origin), normal)));
        }
    }
    if (worst > tol) {
        std::ostringstream oss;
        oss << "Region is not planar within tolerance (deviation " << worst << " > " << tol << ")";
        failPrecondition(oss.str());
    }

    std::vector<Nurbs> curves;
    for (const auto& ring : rings) {
        std::vector<Nurbs::Point> uv;
        uv.reserve(ring.size());
        for (const auto& p : ring) {
            const Point3 w = Vec3::sub(p, plane.origin);
            uv.push_back(Nurbs::Point{Vec3::dot(w, plane.xAxis), Vec3::dot(w, plane.yAxis)});
        }
        for (std::size_t i = 0; i < uv.size(); ++i) {
            const auto& a = uv[i];
            const auto& b = uv[(i + 1) % uv.size()];
            if (chordLength(a, b) <= tol) continue;
            curves.push_back(Nurbs::line(a, b));
        }
    }
    return fromCurves(plane, curves, tol);
}

bool PlanarRegion::isValid(double tol, std::string* reason) const {
    if (empty()) {
        if (reason) *reason = "Region has no outer boundary";
        return false;
    }
    const double frameTol = 1e-9;
    if (std::fabs(Vec3::norm(plane_.xAxis) - 1.0) > frameTol ||
        std::fabs(Vec3::norm(plane_.yAxis) - 1.0) > frameTol ||
        std::fabs(Vec3::dot(plane_.xAxis, plane_.yAxis)) > frameTol ||
        !Vec3::isFinite(plane_.origin)) {
        if (reason) *reason = "Plane frame is not orthonormal";
        return false;
    }
    for (const auto& c : curves_) {
        std::string why;
        if (!c.isValid(&why)) {
            if (reason) *reason = "Invalid boundary curve: " + why;
            return false;
        }
    }
    Interval u, v;
    if (!domain(u, v)) {
        if (reason) *reason = "Region domain is degenerate";
        return false;
    }
    if (!(area() > tol * tol)) {
        if (reason) *reason = "Region encloses no area";
        return false;
    }
    return true;
}

double PlanarRegion::area() const {
    double total = 0.0;
    for (std::size_t l = 0; l < edges_.size(); ++l) {
        double a = 0.0;
        for (const auto& e : edges_[l]) a += e.a[0] * e.b[1] - e.b[0] * e.a[1];
        a = 0.5 * std::fabs(a);
        total += (l == 0) ? a : -a;
    }
    return total;
}

bool PlanarRegion::domain(Interval& u, Interval& v) const {
    if (empty() || !uDom_.isValid() || !vDom_.isValid()) return false;
    u = uDom_;
    v = vDom_;
    return true;
}

Point3 PlanarRegion::pointAt(double u, double v) const {
    return Vec3::add(plane_.origin, Vec3::add(Vec3::scale(plane_.xAxis, u), Vec3::scale(plane_.yAxis, v)));
}

Nurbs::Point PlanarRegion::toPlane(const Point3& p) const {
    const Point3 w = Vec3::sub(p, plane_.origin);
    return Nurbs::Point{Vec3::dot(w, plane_.xAxis), Vec3::dot(w, plane_.yAxis)};
}

Point3 PlanarRegion::projectToPlane(const Point3& p) const {
    const auto q = toPlane(p);
    return pointAt(q[0], q[1]);
}

double PlanarRegion::distanceToPlane(const Point3& p) const {
    return std::fabs(Vec3::dot(Vec3::sub(p, plane_.origin), plane_.normal()));
}

bool PlanarRegion::closestParameter(const Point3& p, double& u, double& v) const {
    Interval ud, vd;
    if (!domain(ud, vd) || !Vec3::isFinite(p)) return false;
    const auto q = toPlane(p);
    u = ud.clamp(q[0]);
    v = vd.clamp(q[1]);
    return true;
}

double PlanarRegion::inPlaneBoundaryDistance(const Nurbs::Point& q, Nurbs::Point* closest) const {
    double best = std::numeric_limits<double>::infinity();
    Nurbs::Point bestPt = q;

    // Pass 1: exact edges and chords
    for (const auto& ring : edges_) {
        for (const auto& e : ring) {
            const auto c = closestOnSegment(e.a, e.b, q);
            const double d2 = dist2(c, q);
            if (d2 < best) { best = d2; bestPt = c; }
        }
    }
    // Pass 2: curved pieces whose chord is close enough that the curve may beat the best
    const double bestChord = std::sqrt(best);
    for (const auto& ring : edges_) {
        for (const auto& e : ring) {
            if (e.exact) continue;
            const double dc = std::sqrt(dist2(closestOnSegment(e.a, e.b, q), q));
            if (dc > bestChord + chordLength(e.a, e.b)) continue;
            Nurbs::Point c;
            const double d2 = refineClosest(curves_[e.curve], e.u0, e.u1, q, c);
            if (d2 < best) { best = d2; bestPt = c; }
        }
    }
    if (closest) *closest = bestPt;
    return std::sqrt(best);
}

bool PlanarRegion::crossesRay(const BoundaryEdge& e, const Nurbs::Point& q) const {
    const auto& a = e.a;
    const auto& b = e.b;
    const bool condY = ((a[1] <= q[1]) && (b[1] > q[1])) || ((a[1] > q[1]) && (b[1] <= q[1]));
    if (!condY) return false;
    double xInt = a[0] + (q[1] - a[1]) * (b[0] - a[0]) / (b[1] - a[1]);
    if (!e.exact && std::fabs(xInt - q[0]) <= chordLength(a, b)) {
        // chord is not good enough this close to q: locate the crossing on the curve
        const Nurbs& c = curves_[e.curve];
        const double u = bisectCurve(c, e.u0, e.u1, [&](const Nurbs::Point& P) { return P[1] - q[1]; });
        xInt = c.evaluate(u)[0];
    }
    return xInt > q[0];
}

bool PlanarRegion::isPointInside(const Point3& p, double tol, bool strictlyIn) const {
    if (empty() || !Vec3::isFinite(p)) return false;
    if (distanceToPlane(p) > tol) return false;
    const auto q = toPlane(p);
    if (inPlaneBoundaryDistance(q, nullptr) <= tol) return !strictlyIn;

    // Even-odd over all loops: inside the outer and outside every hole
    int crossings = 0;
    for (const auto& ring : edges_) {
        for (const auto& e : ring) {
            if (crossesRay(e, q)) ++crossings;
        }
    }
    return (crossings % 2) == 1;
}

BoundaryHit PlanarRegion::closestBoundaryPoint(const Point3& p, double maxDistance) const {
    BoundaryHit hit;
    if (empty() || !Vec3::isFinite(p)) return hit;
    Nurbs::Point c;
    const double din = inPlaneBoundaryDistance(toPlane(p), &c);
    const double dp = distanceToPlane(p);
    const double d = std::sqrt(din * din + dp * dp);
    if (!(d <= maxDistance)) return hit;
    hit.point = pointAt(c[0], c[1]);
    hit.distance = d;
    hit.found = true;
    return hit;
}

std::vector<double> PlanarRegion::intersectLine(const Point3& a, const Point3& b, double tol) const {
    std::vector<double> ts;
    if (empty()) return ts;
    const auto A = toPlane(a);
    const auto B = toPlane(b);
    const double dx = B[0] - A[0];
    const double dy = B[1] - A[1];
    const double len2 = dx * dx + dy * dy;
    const double len = std::sqrt(len2);
    if (!(len > tol)) return ts;

    const double tTol = tol / len;
    auto push = [&](double t) {
        if (t >= -tTol && t <= 1.0 + tTol) ts.push_back(std::max(0.0, std::min(1.0, t)));
    };
    auto lineParam = [&](const Nurbs::Point& P) {
        return ((P[0] - A[0]) * dx + (P[1] - A[1]) * dy) / len2;
    };
    // signed distance of P from the infinite line through A, B
    auto side = [&](const Nurbs::Point& P) {
        return (dx * (P[1] - A[1]) - dy * (P[0] - A[0])) / len;
    };

    for (const auto& ring : edges_) {
        for (const auto& e : ring) {
            if (e.exact) {
                const double ex = e.b[0] - e.a[0];
                const double ey = e.b[1] - e.a[1];
                const double elen = std::sqrt(ex * ex + ey * ey);
                const double wx = e.a[0] - A[0];
                const double wy = e.a[1] - A[1];
                const double denom = dx * ey - dy * ex;
                if (std::fabs(denom) <= 1e-12 * len * elen) {
                    // parallel: only collinear pieces touch the line
                    if (std::fabs(side(e.a)) <= tol) {
                        push(lineParam(e.a));
                        push(lineParam(e.b));
                    }
                    continue;
                }
                const double t = (wx * ey - wy * ex) / denom;
                const double s = (wx * dy - wy * dx) / denom;
                const double sTol = tol / elen;
                if (s >= -sTol && s <= 1.0 + sTol) push(t);
                continue;
            }
            const double fa = side(e.a);
            const double fb = side(e.b);
            if (fa == 0.0) {
                push(lineParam(e.a));
                continue;
            }
            if ((fa < 0.0) == (fb < 0.0) || fb == 0.0) continue;
            const Nurbs& c = curves_[e.curve];
            const double u = bisectCurve(c, e.u0, e.u1, side);
            push(lineParam(c.evaluate(u)));
        }
    }
    std::sort(ts.begin(), ts.end());
    return ts;
}
