#ifndef STRUTGRID_REGION_BUILDER_HXX
#define STRUTGRID_REGION_BUILDER_HXX

#include "LoopBuilder.hxx" // for Loop and OrientedCurve
#include "Nurbs.hxx"
#include <vector>

// A trimmed planar area: one outer loop plus zero or more hole loops
struct Region {
    Loop outer;
    std::vector<Loop> inners;
};

using Polygon2 = std::vector<Nurbs::Point>;

class RegionBuilder {
public:
    explicit RegionBuilder(double tol = 1e-8, int samplesPerCurve = 16)
        : tol_(tol), samplesPerCurve_(samplesPerCurve) {}

    // Group loops into regions. A loop becomes a hole of the smallest larger loop
    // containing it; loops without a parent are outers. Holes nested inside holes
    // start their own region.
    std::vector<Region> buildRegions(const std::vector<Nurbs>& curves,
                                     const std::vector<Loop>& loops) const;

    // Polygon approximation of a loop (open ring, last vertex != first).
    // Linear curves contribute their exact control polygon.
    Polygon2 sampleLoop(const std::vector<Nurbs>& curves, const Loop& L) const;

    // Geometric predicates on sampled polygons
    static double signedArea(const Polygon2& poly);
    static bool pointInPolygon(const Polygon2& poly, const Nurbs::Point& p, double tol);
    static bool onSegmentTol(const Nurbs::Point& a, const Nurbs::Point& b, const Nurbs::Point& p, double tol);

private:
    double tol_;
    int samplesPerCurve_;
};

#endif // STRUTGRID_REGION_BUILDER_HXX
