#include <gtest/gtest.h>
#include "PointClassifier.hxx"
#include <cmath>

static PlanarRegion slabWithHole() {
    std::vector<Point3> outer{{0,0,0}, {10,0,0}, {10,6,0}, {0,6,0}};
    std::vector<Point3> hole{{4,2,0}, {6,2,0}, {6,4,0}, {4,4,0}};
    return PlanarRegion::fromWorldLoops({outer, hole}, 1e-6);
}

TEST(PointClassifier, InsideOutsideAndBoundary) {
    auto R = slabWithHole();
    PointClassifier pc(1e-3);
    EXPECT_EQ(pc.classify(R, {1.0, 1.0, 0.0}), PointLocation::Inside);
    EXPECT_EQ(pc.classify(R, {5.0, 3.0, 0.0}), PointLocation::Outside);   // in the hole
    EXPECT_EQ(pc.classify(R, {11.0, 3.0, 0.0}), PointLocation::Outside);
    EXPECT_EQ(pc.classify(R, {0.0, 3.0, 0.0}), PointLocation::OnBoundary);
    EXPECT_EQ(pc.classify(R, {4.0, 3.0, 0.0}), PointLocation::OnBoundary); // hole edge
    EXPECT_EQ(pc.classify(R, {10.0, 6.0, 0.0}), PointLocation::OnBoundary); // corner
}

TEST(PointClassifier, AcceptanceBandIsTwiceTolerance) {
    auto R = slabWithHole();
    PointClassifier pc(1e-3);
    // 1.5 tol outside the edge: accepted as on the boundary
    EXPECT_EQ(pc.classify(R, {10.0015, 3.0, 0.0}), PointLocation::OnBoundary);
    // 3 tol outside: found by the 5 tol search but beyond the 2 tol acceptance
    EXPECT_EQ(pc.classify(R, {10.003, 3.0, 0.0}), PointLocation::Outside);
    EXPECT_TRUE(pc.isInsideOrOn(R, {10.0015, 3.0, 0.0}));
    EXPECT_FALSE(pc.isInsideOrOn(R, {10.003, 3.0, 0.0}));

    // Wider factors widen the band
    PointClassifier loose(1e-3, 5.0, 4.0);
    EXPECT_EQ(loose.classify(R, {10.003, 3.0, 0.0}), PointLocation::OnBoundary);
}

TEST(PointClassifier, OffPlanePoints) {
    auto R = slabWithHole();
    PointClassifier pc(1e-3);
    // Within tolerance of the plane: still inside
    EXPECT_EQ(pc.classify(R, {1.0, 1.0, 5e-4}), PointLocation::Inside);
    // Well above the slab
    EXPECT_EQ(pc.classify(R, {1.0, 1.0, 1.0}), PointLocation::Outside);
    // Above an edge by 1.5 tol: on the boundary through the combined distance
    EXPECT_EQ(pc.classify(R, {0.0, 3.0, 1.5e-3}), PointLocation::OnBoundary);
}

TEST(PointClassifier, FailsClosed) {
    PointClassifier pc(1e-3);
    // Region without boundary and non-finite input never classify inside
    EXPECT_EQ(pc.classify(PlanarRegion(), {0.0, 0.0, 0.0}), PointLocation::Outside);
    auto R = slabWithHole();
    EXPECT_EQ(pc.classify(R, {NAN, 1.0, 0.0}), PointLocation::Outside);

    EXPECT_STREQ(toString(pc.classify(R, {NAN, 1.0, 0.0})), "Outside");
}
