#include <gtest/gtest.h>
#include "routecluster/customer_generator.hpp"
#include "routecluster/dbscan.hpp"
#include "routecluster/geo_math.hpp"
#include "test_helpers.hpp"

#include <stdexcept>
#include <vector>

using namespace routecluster;

// Three customers within a few hundred metres, a fourth ~20 km east.
TEST(Dbscan, TightTripleAndOutlier) {
    std::vector<GeoPoint> pts = {
        {69.000, 18.000}, {69.001, 18.001}, {69.002, 18.000}, {69.050, 18.500}};
    ClusteringResult r = DbscanClusterer(5.0, 3).cluster(pts);

    ASSERT_EQ(r.clusters.size(), 1u);
    EXPECT_EQ(r.clusters[0], (std::vector<size_t>{0, 1, 2}));
    EXPECT_EQ(r.noise, (std::vector<size_t>{3}));
    EXPECT_EQ(r.labels, (std::vector<int>{0, 0, 0, -1}));
}

TEST(Dbscan, EmptyInput) {
    ClusteringResult r = DbscanClusterer(5.0, 3).cluster({});
    EXPECT_TRUE(r.clusters.empty());
    EXPECT_TRUE(r.noise.empty());
    EXPECT_TRUE(r.labels.empty());
}

// Point 0 has too few neighbours to be core and is visited first, so it is
// tentatively noise; expansion from point 1 later absorbs it as a border point.
TEST(Dbscan, EarlyNoiseBecomesBorder) {
    // ~1.11 km apart along a meridian.
    std::vector<GeoPoint> pts = {{69.00, 18.0}, {69.01, 18.0}, {69.02, 18.0}, {69.03, 18.0}};
    ClusteringResult r = DbscanClusterer(1.5, 3).cluster(pts);

    ASSERT_EQ(r.clusters.size(), 1u);
    EXPECT_EQ(r.clusters[0].size(), 4u);
    EXPECT_TRUE(r.noise.empty());
}

TEST(Dbscan, ChainsThroughCorePoints) {
    // Consecutive points ~1.11 km apart; ends ~5.5 km apart.
    std::vector<GeoPoint> pts;
    for (int i = 0; i < 6; ++i) pts.push_back({69.0 + 0.01 * i, 18.0});
    ClusteringResult r = DbscanClusterer(1.2, 2).cluster(pts);
    ASSERT_EQ(r.clusters.size(), 1u);
    EXPECT_EQ(r.clusters[0].size(), 6u);
}

TEST(Dbscan, SeparatedGroupsInDiscoveryOrder) {
    std::vector<GeoPoint> pts = {
        {60.000, 10.000}, {69.000, 18.000}, {60.001, 10.001},
        {69.001, 18.001}, {60.002, 10.000}, {69.002, 18.000},
        {65.000, 14.000}};
    ClusteringResult r = DbscanClusterer(2.0, 3).cluster(pts);

    ASSERT_EQ(r.clusters.size(), 2u);
    EXPECT_EQ(r.clusters[0], (std::vector<size_t>{0, 2, 4}));
    EXPECT_EQ(r.clusters[1], (std::vector<size_t>{1, 3, 5}));
    EXPECT_EQ(r.noise, (std::vector<size_t>{6}));
}

TEST(Dbscan, MinPtsOneMakesEveryPointACluster) {
    std::vector<GeoPoint> pts = {{60.0, 10.0}, {65.0, 14.0}, {69.0, 18.0}};
    ClusteringResult r = DbscanClusterer(1.0, 1).cluster(pts);
    EXPECT_EQ(r.clusters.size(), 3u);
    EXPECT_TRUE(r.noise.empty());
}

// Every point lands in exactly one cluster or in noise, and clusters meet
// the minimum size.
TEST(Dbscan, PartitionsGeneratedSnapshot) {
    auto customers = generate_customer_snapshot(3000, 60, fixtures::test_today(), 11);
    std::vector<GeoPoint> pts = locations_of(customers);
    const int min_pts = 4;
    ClusteringResult r = DbscanClusterer(2.0, min_pts).cluster(pts);

    std::vector<int> seen(pts.size(), 0);
    for (size_t c = 0; c < r.clusters.size(); ++c) {
        EXPECT_GE(r.clusters[c].size(), static_cast<size_t>(min_pts));
        for (size_t i : r.clusters[c]) {
            ++seen[i];
            EXPECT_EQ(r.labels[i], static_cast<int>(c));
        }
    }
    for (size_t i : r.noise) {
        ++seen[i];
        EXPECT_EQ(r.labels[i], -1);
    }
    for (size_t i = 0; i < seen.size(); ++i)
        EXPECT_EQ(seen[i], 1) << "point " << i;
    EXPECT_GT(r.clusters.size(), 0u);
}

TEST(Dbscan, Deterministic) {
    auto customers = generate_customer_snapshot(2000, 40, fixtures::test_today(), 5);
    std::vector<GeoPoint> pts = locations_of(customers);
    DbscanClusterer dbscan(3.0, 3);
    ClusteringResult a = dbscan.cluster(pts);
    ClusteringResult b = dbscan.cluster(pts);
    EXPECT_EQ(a.labels, b.labels);
    EXPECT_EQ(a.clusters, b.clusters);
}

TEST(Dbscan, ClusterCustomersCopiesMembers) {
    std::vector<CustomerLocation> cs = {
        fixtures::customer("a", 69.000, 18.000),
        fixtures::customer("b", 69.001, 18.001),
        fixtures::customer("far", 69.050, 18.500),
        fixtures::customer("c", 69.002, 18.000)};
    auto groups = DbscanClusterer(5.0, 3).cluster_customers(cs);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(fixtures::ids_of(groups[0]), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(Dbscan, RejectsContractViolations) {
    EXPECT_THROW(DbscanClusterer(0.0, 3), std::invalid_argument);
    EXPECT_THROW(DbscanClusterer(-1.0, 3), std::invalid_argument);
    EXPECT_THROW(DbscanClusterer(5.0, 0), std::invalid_argument);
}
