#ifndef STRUTGRID_LOOP_BUILDER_HXX
#define STRUTGRID_LOOP_BUILDER_HXX

#include "Nurbs.hxx"
#include <vector>
#include <cstddef>

// LoopBuilder: stitches unordered trimming curves into closed loops.
// A loop is a sequence of oriented curve indices (index into the curve vector and a
// flag telling whether the curve is traversed backwards) such that the end of each
// curve meets the start of the next within a tolerance and the last end meets the
// first start.
//
// A curve's start point is evaluate(uMin()) and its end point evaluate(uMax());
// reversing swaps them.
struct OrientedCurve {
    std::size_t index; // original curve index
    bool reversed;     // true if traversed uMax -> uMin
};

using Loop = std::vector<OrientedCurve>;

class LoopBuilder {
public:
    static Nurbs::Point startPoint(const Nurbs& c, bool reversed);
    static Nurbs::Point endPoint(const Nurbs& c, bool reversed);

    explicit LoopBuilder(double tol = 1e-8) : tol_(tol) {}

    // Build a maximal set of closed loops, each input curve used at most once.
    // Curves that cannot be stitched are ignored (returned in leftovers if requested).
    std::vector<Loop> buildClosedLoops(const std::vector<Nurbs>& curves,
                                       std::vector<std::size_t>* leftovers = nullptr) const;

private:
    double tol_;
    static bool near(const Nurbs::Point& a, const Nurbs::Point& b, double tol);
};

#endif // STRUTGRID_LOOP_BUILDER_HXX
