#include <gtest/gtest.h>
#include "StationBuilder.hxx"
#include "SlabGridError.hxx"
#include <cmath>
#include <initializer_list>

static void expectStrictlyIncreasing(const std::vector<double>& s) {
    for (std::size_t k = 1; k < s.size(); ++k) EXPECT_LT(s[k - 1], s[k]) << "at " << k;
}

TEST(StationBuilder, RegularSubdivision) {
    StationBuilder sb(1e-6);
    auto s = sb.build({0.0, 10.0}, 2.5, {});
    ASSERT_EQ(s.size(), 5u);
    for (std::size_t k = 0; k < s.size(); ++k) EXPECT_NEAR(s[k], 2.5 * k, 1e-12);
    EXPECT_DOUBLE_EQ(s.back(), 10.0);

    // round(10 / 3) = 3 spans of 10/3
    s = sb.build({0.0, 10.0}, 3.0, {});
    ASSERT_EQ(s.size(), 4u);
    EXPECT_NEAR(s[1], 10.0 / 3.0, 1e-12);
}

TEST(StationBuilder, SpanCountIsClamped) {
    StationBuilder sb(1e-9);
    EXPECT_EQ(sb.spanCount(10.0, 100.0), 1);
    EXPECT_EQ(sb.spanCount(10.0, 1e-6), 200);
    EXPECT_EQ(sb.build({-1.0, 1.0}, 1e-6, {}).size(), 201u);
    auto s = sb.build({2.0, 3.0}, 50.0, {});
    ASSERT_EQ(s.size(), 2u);
    EXPECT_DOUBLE_EQ(s[0], 2.0);
    EXPECT_DOUBLE_EQ(s[1], 3.0);

    StationBuilder small(1e-9, 10);
    EXPECT_EQ(small.build({0.0, 1.0}, 1e-3, {}).size(), 11u);
}

TEST(StationBuilder, PivotsInsertedOutsideSnapBand) {
    StationBuilder sb(1e-6);   // snap band 0.4 * 2.5 = 1.0
    EXPECT_NEAR(sb.snapTolerance({0.0, 10.0}, 2.5), 1.0, 1e-12);

    auto s = sb.build({0.0, 10.0}, 2.5, {3.9});
    ASSERT_EQ(s.size(), 6u);
    EXPECT_DOUBLE_EQ(s[2], 3.9);
    expectStrictlyIncreasing(s);

    // 0.8 from station 5: absorbed
    s = sb.build({0.0, 10.0}, 2.5, {4.2});
    EXPECT_EQ(s.size(), 5u);

    // Second pivot falls in the band of the first
    s = sb.build({0.0, 10.0}, 2.5, {3.9, 3.7});
    EXPECT_EQ(s.size(), 6u);
}

TEST(StationBuilder, GridSharesTheSmallerSnapBand) {
    StationBuilder sb(1e-6);
    const Interval u{0.0, 10.0}, v{0.0, 2.6};   // du = 1, dv = 2.6 / 3
    EXPECT_NEAR(sb.snapTolerance(u, 1.0), 0.4, 1e-12);
    const double snap = sb.snapTolerance(u, v, 1.0);
    EXPECT_NEAR(snap, 0.4 * 2.6 / 3.0, 1e-12);

    // 0.37 from station 4: absorbed by the u band alone, kept by the shared band
    EXPECT_EQ(sb.build(u, 1.0, {4.37}).size(), 11u);
    auto s = sb.build(u, 1.0, {4.37}, snap);
    ASSERT_EQ(s.size(), 12u);
    EXPECT_DOUBLE_EQ(s[5], 4.37);
    expectStrictlyIncreasing(s);

    StationBuilder plain(1e-6, 200, 0.4, false);
    EXPECT_DOUBLE_EQ(plain.snapTolerance(u, v, 1.0), 1e-6);
}

TEST(StationBuilder, PivotsOutsideDomainIgnored) {
    StationBuilder sb(1e-6);
    auto s = sb.build({0.0, 10.0}, 2.5, {-4.0, 13.0, NAN, INFINITY});
    EXPECT_EQ(s.size(), 5u);
}

TEST(StationBuilder, RebuildWithOwnStationsIsIdempotent) {
    StationBuilder sb(1e-6);
    auto s = sb.build({0.0, 10.0}, 2.5, {3.9, 8.6});
    auto again = sb.build({0.0, 10.0}, 2.5, s);
    EXPECT_EQ(again, s);
}

TEST(StationBuilder, WithoutSnappingEveryPivotIsInserted) {
    StationBuilder sb(1e-6, 200, 0.4, false);
    auto s = sb.build({0.0, 10.0}, 2.5, {4.2, 4.2, 5.0, 4.9999999});
    // 4.2 once; 5.0 and 4.9999999 coincide with an existing station within tol
    ASSERT_EQ(s.size(), 6u);
    EXPECT_DOUBLE_EQ(s[2], 4.2);
    expectStrictlyIncreasing(s);
}

TEST(StationBuilder, InvalidInputThrows) {
    StationBuilder sb(1e-6);
    for (double spacing : std::initializer_list<double>{0.0, -1.0, NAN, INFINITY}) {
        try {
            sb.build({0.0, 10.0}, spacing, {});
            ADD_FAILURE() << "no error for spacing " << spacing;
        } catch (const SlabGridError& e) {
            EXPECT_EQ(e.kind(), SlabGridErrorKind::InvalidArgument);
        }
    }
    EXPECT_THROW(sb.build({5.0, 5.0}, 1.0, {}), SlabGridError);
    EXPECT_THROW(sb.build({5.0, 1.0}, 1.0, {}), SlabGridError);
}

TEST(StationGrid, NodesAreClassifiedOnce) {
    std::vector<Point3> outer{{0,0,0}, {10,0,0}, {10,6,0}, {0,6,0}};
    std::vector<Point3> hole{{3,1,0}, {7,1,0}, {7,5,0}, {3,5,0}};
    auto R = PlanarRegion::fromWorldLoops({outer, hole}, 1e-6);

    StationBuilder sb(1e-6);
    auto u = sb.build({0.0, 10.0}, 2.0, {});   // 0 2 4 6 8 10
    auto v = sb.build({0.0, 6.0}, 2.0, {});    // 0 2 4 6
    auto grid = StationGrid::evaluate(R, u, v, PointClassifier(1e-3));
    ASSERT_EQ(grid.size(), 24u);
    // (4,2), (4,4), (6,2), (6,4) sit inside the hole
    EXPECT_EQ(grid.insideCount(), 20u);
    EXPECT_FALSE(grid.inside[grid.index(2, 1)]);
    EXPECT_TRUE(grid.inside[grid.index(0, 0)]);
    EXPECT_NEAR(grid.points[grid.index(5, 3)][0], 10.0, 1e-12);
    EXPECT_NEAR(grid.points[grid.index(5, 3)][1], 6.0, 1e-12);
}
