#ifndef STRUTGRID_PLANAR_REGION_HXX
#define STRUTGRID_PLANAR_REGION_HXX

#include "Nurbs.hxx"
#include "RegionBuilder.hxx" // for Region, Polygon2
#include "Vec3.hxx"

#include <cstddef>
#include <limits>
#include <string>
#include <vector>

// Orthonormal frame of a plane; (u, v) coordinates run along xAxis / yAxis.
struct Plane {
    Point3 origin{0.0, 0.0, 0.0};
    Point3 xAxis{1.0, 0.0, 0.0};
    Point3 yAxis{0.0, 1.0, 0.0};

    Point3 normal() const { return Vec3::cross(xAxis, yAxis); }
};

// Result of a closest-point-on-boundary query
struct BoundaryHit {
    Point3 point{};
    double distance = std::numeric_limits<double>::infinity();
    bool found = false;
};

// PlanarRegion: a trimmed planar face. The carrier plane is parameterized by
// (u, v) in its frame; trimming loops are NURBS curves in (u, v). The region is
// the outer loop minus the holes. All queries are const and allocation-local, so
// a region can be shared read-only.
class PlanarRegion {
public:
    // One boundary piece between two consecutive boundary samples. For linear
    // curves the piece is exact; otherwise [u0, u1] is the curve sub-range the
    // chord a -> b approximates (u1 < u0 when the curve is traversed reversed).
    struct BoundaryEdge {
        std::size_t curve;
        double u0, u1;
        Nurbs::Point a, b;
        bool exact;
    };

    PlanarRegion() = default;
    PlanarRegion(const Plane& plane,
                 std::vector<Nurbs> curves,
                 Region topology,
                 int samplesPerCurve = 32);

    // Stitch curves into loops and group them; throws SlabGridError
    // (PreconditionViolation) unless they form exactly one face.
    static PlanarRegion fromCurves(const Plane& plane,
                                   const std::vector<Nurbs>& curves,
                                   double tol,
                                   int samplesPerCurve = 32);

    // Closed world polylines (outer boundary and holes, any order). Fits the plane
    // and throws SlabGridError (PreconditionViolation) when the loops are not
    // planar within tol or do not reduce to one face.
    static PlanarRegion fromWorldLoops(const std::vector<std::vector<Point3>>& loops, double tol);

    bool empty() const { return topology_.outer.empty(); }
    bool isValid(double tol, std::string* reason = nullptr) const;

    const Plane& plane() const { return plane_; }
    const std::vector<Nurbs>& curves() const { return curves_; }
    const Region& topology() const { return topology_; }
    std::size_t holeCount() const { return topology_.inners.size(); }
    const std::vector<std::vector<BoundaryEdge>>& boundaryEdges() const { return edges_; }

    // Enclosed area (outer minus holes) from the sampled boundary
    double area() const;

    // Parameter intervals; false when the region has no usable domain
    bool domain(Interval& u, Interval& v) const;

    Point3 pointAt(double u, double v) const;
    Nurbs::Point toPlane(const Point3& p) const;
    Point3 projectToPlane(const Point3& p) const;
    double distanceToPlane(const Point3& p) const;

    // Closest (u, v) on the untrimmed carrier, clamped to the domain
    bool closestParameter(const Point3& p, double& u, double& v) const;

    // Containment at tol. strictlyIn excludes points within tol of the boundary.
    // Points farther than tol from the plane are never inside.
    bool isPointInside(const Point3& p, double tol, bool strictlyIn) const;

    // Closest point on the boundary curves, accepted when within maxDistance
    BoundaryHit closestBoundaryPoint(const Point3& p, double maxDistance) const;

    // Parameters t in [0, 1] along a -> b where the segment meets the boundary,
    // ascending. Collinear boundary pieces contribute their end points.
    std::vector<double> intersectLine(const Point3& a, const Point3& b, double tol) const;

private:
    void buildEdges();
    double inPlaneBoundaryDistance(const Nurbs::Point& q, Nurbs::Point* closest) const;
    bool crossesRay(const BoundaryEdge& e, const Nurbs::Point& q) const;

    Plane plane_;
    std::vector<Nurbs> curves_;
    Region topology_;
    int samplesPerCurve_ = 32;

    // edges_[0] is the outer loop, then one entry per hole
    std::vector<std::vector<BoundaryEdge>> edges_;
    Interval uDom_, vDom_;
};

#endif // STRUTGRID_PLANAR_REGION_HXX
