#include <gtest/gtest.h>
#include "ControlPointIntegrator.hxx"
#include <cmath>

static PlanarRegion plate() {
    std::vector<Point3> outer{{0,0,0}, {10,0,0}, {10,6,0}, {0,6,0}};
    return PlanarRegion::fromWorldLoops({outer}, 1e-6);
}

static PlanarRegion plateWithHole() {
    std::vector<Point3> outer{{0,0,0}, {10,0,0}, {10,6,0}, {0,6,0}};
    std::vector<Point3> hole{{4,2,0}, {6,2,0}, {6,4,0}, {4,4,0}};
    return PlanarRegion::fromWorldLoops({outer, hole}, 1e-6);
}

TEST(ControlPointIntegrator, ProjectsNearbyPointsOntoThePlane) {
    auto R = plate();
    ControlPointIntegrator cpi(1e-3, 2.0);   // projection used below 0.4 off the plane
    auto recs = cpi.validate(R, {{3.0, 2.0, 0.3}});
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_TRUE(recs[0].accepted);
    EXPECT_NEAR(recs[0].point[0], 3.0, 1e-12);
    EXPECT_NEAR(recs[0].point[1], 2.0, 1e-12);
    EXPECT_NEAR(recs[0].point[2], 0.0, 1e-12);
    EXPECT_NEAR(recs[0].u, 3.0, 1e-12);
    EXPECT_NEAR(recs[0].v, 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(recs[0].input[2], 0.3);
}

TEST(ControlPointIntegrator, FarPointsUseTheClampedSurfacePoint) {
    auto R = plate();
    ControlPointIntegrator cpi(1e-3, 2.0);
    // Projection is 5 away (> 0.4): the domain-clamped point is used instead
    auto recs = cpi.validate(R, {{12.0, 3.0, 5.0}});
    ASSERT_EQ(recs.size(), 1u);
    EXPECT_TRUE(recs[0].accepted);   // clamped onto the edge x = 10
    EXPECT_NEAR(recs[0].point[0], 10.0, 1e-12);
    EXPECT_NEAR(recs[0].point[1], 3.0, 1e-12);
    EXPECT_NEAR(recs[0].u, 10.0, 1e-12);
}

TEST(ControlPointIntegrator, OffRegionPointsAreRejectedSilently) {
    auto R = plateWithHole();
    ControlPointIntegrator cpi(1e-3, 2.0);
    auto recs = cpi.validate(R, {
        {1.0, 1.0, 0.0},      // inside
        {5.0, 3.0, 0.0},      // in the hole
        {10.5, 3.0, 0.0},     // beyond the edge, projection kept
        {NAN, 1.0, 0.0},
        {10.004, 3.0, 0.0}    // within the loose band (2 * 5 tol)
    });
    ASSERT_EQ(recs.size(), 5u);
    EXPECT_TRUE(recs[0].accepted);
    EXPECT_FALSE(recs[1].accepted);
    EXPECT_FALSE(recs[2].accepted);
    EXPECT_FALSE(recs[3].accepted);
    EXPECT_TRUE(recs[4].accepted);

    std::vector<double> up, vp;
    ControlPointIntegrator::collectPivots(recs, up, vp);
    ASSERT_EQ(up.size(), 2u);
    EXPECT_NEAR(up[0], 1.0, 1e-12);
    EXPECT_NEAR(vp[0], 1.0, 1e-12);
    EXPECT_NEAR(up[1], 10.0, 1e-12);   // clamped to the domain
}

TEST(ControlPointIntegrator, ConnectsToNearestInsideNodes) {
    auto R = plate();
    const double tol = 1e-3;
    ControlPointIntegrator cpi(tol, 2.0);   // connection radius 1.6

    StationBuilder sb(tol);
    auto u = sb.build({0.0, 10.0}, 2.0, {});
    auto v = sb.build({0.0, 6.0}, 2.0, {});
    PointClassifier pc(tol);
    auto grid = StationGrid::evaluate(R, u, v, pc);
    LineClipper clipper(pc);

    // Cell center: four nodes at sqrt(2)
    auto recs = cpi.validate(R, {{3.0, 3.0, 0.0}});
    auto lines = cpi.connect(R, recs, grid, clipper);
    ASSERT_EQ(lines.size(), 4u);
    for (const auto& l : lines) {
        EXPECT_NEAR(l.length(), std::sqrt(2.0), 1e-12);
        EXPECT_NEAR(l.from[0], 3.0, 1e-12);
        EXPECT_NEAR(l.from[1], 3.0, 1e-12);
    }

    // On a node: that node is the point itself and is skipped; the four
    // neighbours at distance 2 are beyond the radius
    recs = cpi.validate(R, {{4.0, 2.0, 0.0}});
    EXPECT_TRUE(cpi.connect(R, recs, grid, clipper).empty());

    // Rejected points get no connectors
    recs = cpi.validate(R, {{30.0, 3.0, 0.0}});
    ASSERT_FALSE(recs[0].accepted);
    EXPECT_TRUE(cpi.connect(R, recs, grid, clipper).empty());
}

TEST(ControlPointIntegrator, ConnectorLimit) {
    auto R = plateWithHole();
    const double tol = 1e-3;
    SlabGridOptions opts;
    opts.maxConnectors = 2;
    ControlPointIntegrator cpi(tol, 2.0, opts);

    StationBuilder sb(tol);
    auto u = sb.build({0.0, 10.0}, 2.0, {});
    auto v = sb.build({0.0, 6.0}, 2.0, {});
    PointClassifier pc(tol);
    auto grid = StationGrid::evaluate(R, u, v, pc);
    LineClipper clipper(pc);

    // (3, 1): nodes (2,0) (4,0) (2,2) (4,2) all at sqrt(2); only two are kept
    auto recs = cpi.validate(R, {{3.0, 1.0, 0.0}});
    EXPECT_EQ(cpi.connect(R, recs, grid, clipper).size(), 2u);
}

TEST(ControlPointIntegrator, ConnectorsCutByAHoleAreDropped) {
    // Narrow slot between the point and the nodes at x = 4
    std::vector<Point3> outer{{0,0,0}, {10,0,0}, {10,6,0}, {0,6,0}};
    std::vector<Point3> slot{{3.55,0.2,0}, {3.65,0.2,0}, {3.65,1.9,0}, {3.55,1.9,0}};
    auto R = PlanarRegion::fromWorldLoops({outer, slot}, 1e-6);
    const double tol = 1e-3;
    ControlPointIntegrator cpi(tol, 2.0);

    StationBuilder sb(tol);
    auto u = sb.build({0.0, 10.0}, 2.0, {});
    auto v = sb.build({0.0, 6.0}, 2.0, {});
    PointClassifier pc(tol);
    auto grid = StationGrid::evaluate(R, u, v, pc);
    LineClipper clipper(pc);

    // Within reach: (2,0), (4,0) and (4,2); the last two cross the slot and
    // keep less than 80% of their length
    auto recs = cpi.validate(R, {{3.4, 0.6, 0.0}});
    ASSERT_TRUE(recs[0].accepted);
    auto lines = cpi.connect(R, recs, grid, clipper);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NEAR(lines[0].to[0], 2.0, 1e-12);
    EXPECT_NEAR(lines[0].to[1], 0.0, 1e-12);
}
