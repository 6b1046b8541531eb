#ifndef STRUTGRID_STATION_BUILDER_HXX
#define STRUTGRID_STATION_BUILDER_HXX

#include "PlanarRegion.hxx"
#include "PointClassifier.hxx"
#include "Vec3.hxx"

#include <cstddef>
#include <vector>

// Station placement along one parametric axis: a regular subdivision of the
// domain plus pivot stations (control point coordinates).
class StationBuilder {
public:
    explicit StationBuilder(double tol, int maxSpans = 200, double snapFraction = 0.4, bool snapPivots = true)
        : tol_(tol), maxSpans_(maxSpans), snapFraction_(snapFraction), snapPivots_(snapPivots) {}

    // Strictly increasing stations covering [domain.t0, domain.t1].
    // Throws SlabGridError (InvalidArgument) for an empty domain or bad spacing.
    std::vector<double> build(const Interval& domain, double spacing, const std::vector<double>& pivots) const;

    // Same with an explicit snap band, so both axes of a grid can share one
    std::vector<double> build(const Interval& domain, double spacing, const std::vector<double>& pivots,
                              double snap) const;

    // round(length / spacing) clamped to [1, maxSpans]
    int spanCount(double length, double spacing) const;

    // A pivot closer than this to an existing station is absorbed by it
    double snapTolerance(const Interval& domain, double spacing) const;

    // Band shared by a u/v grid: snapFraction times the smaller regular span
    double snapTolerance(const Interval& u, const Interval& v, double spacing) const;

private:
    double tol_;
    int maxSpans_;
    double snapFraction_;
    bool snapPivots_;
};

// Station nodes evaluated on the region, classified once and shared by the
// connector and mesh stages. Node (i, j) sits at (u[i], v[j]).
struct StationGrid {
    std::vector<double> u, v;
    std::vector<Point3> points;
    std::vector<char> inside;   // Inside-or-On

    std::size_t index(std::size_t i, std::size_t j) const { return i * v.size() + j; }
    std::size_t size() const { return points.size(); }
    std::size_t insideCount() const;

    static StationGrid evaluate(const PlanarRegion& region,
                                const std::vector<double>& u,
                                const std::vector<double>& v,
                                const PointClassifier& classifier);
};

#endif // STRUTGRID_STATION_BUILDER_HXX
