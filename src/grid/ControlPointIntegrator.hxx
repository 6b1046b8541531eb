#ifndef STRUTGRID_CONTROL_POINT_INTEGRATOR_HXX
#define STRUTGRID_CONTROL_POINT_INTEGRATOR_HXX

#include "LineClipper.hxx"
#include "PlanarRegion.hxx"
#include "SlabGridOptions.hxx"
#include "StationBuilder.hxx"
#include "Vec3.hxx"

#include <vector>

// Control point after validation against the region
struct ControlPointRecord {
    Point3 input{};     // as supplied
    Point3 point{};     // chosen in-plane location
    double u = 0.0;
    double v = 0.0;
    bool accepted = false;
};

// Projects control points onto the region, decides which survive and ties
// the survivors to nearby grid nodes.
class ControlPointIntegrator {
public:
    ControlPointIntegrator(double tol, double spacing, const SlabGridOptions& options = SlabGridOptions())
        : tol_(tol), spacing_(spacing), options_(options) {}

    // One record per input point, in input order. Off-region points come back
    // with accepted == false; nothing throws.
    std::vector<ControlPointRecord> validate(const PlanarRegion& region, const std::vector<Point3>& points) const;

    // Parameter coordinates of the accepted points, per axis
    static void collectPivots(const std::vector<ControlPointRecord>& records,
                              std::vector<double>& uPivots,
                              std::vector<double>& vPivots);

    // Connector lines from each accepted point to its nearest inside nodes
    std::vector<TieLine> connect(const PlanarRegion& region,
                                 const std::vector<ControlPointRecord>& records,
                                 const StationGrid& grid,
                                 const LineClipper& clipper) const;

private:
    bool validateOne(const PlanarRegion& region, ControlPointRecord& rec) const;

    double tol_;
    double spacing_;
    SlabGridOptions options_;
};

#endif // STRUTGRID_CONTROL_POINT_INTEGRATOR_HXX
