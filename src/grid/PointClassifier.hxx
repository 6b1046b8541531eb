#ifndef STRUTGRID_POINT_CLASSIFIER_HXX
#define STRUTGRID_POINT_CLASSIFIER_HXX

#include "PlanarRegion.hxx"
#include "Vec3.hxx"

enum class PointLocation { Inside, OnBoundary, Outside };

const char* toString(PointLocation loc);

// Single containment policy shared by every grid component.
//   Inside      strict interior containment at tol
//   OnBoundary  closest boundary point (searched to searchFactor * tol) within acceptFactor * tol
//   Outside     everything else, including any failed kernel query
class PointClassifier {
public:
    explicit PointClassifier(double tol, double searchFactor = 5.0, double acceptFactor = 2.0)
        : tol_(tol), searchFactor_(searchFactor), acceptFactor_(acceptFactor) {}

    PointLocation classify(const PlanarRegion& region, const Point3& p) const;

    bool isInsideOrOn(const PlanarRegion& region, const Point3& p) const {
        return classify(region, p) != PointLocation::Outside;
    }

    double tolerance() const { return tol_; }

private:
    double tol_;
    double searchFactor_;
    double acceptFactor_;
};

#endif // STRUTGRID_POINT_CLASSIFIER_HXX
