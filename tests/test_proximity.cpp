#include <gtest/gtest.h>
#include "routecluster/geo_math.hpp"
#include "routecluster/proximity.hpp"
#include "test_helpers.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace routecluster;
using fixtures::customer;
using fixtures::ids_of;

TEST(Proximity, GroupsLargestFirstWithNoise) {
    auto lost = customer("lost", 91.0, 18.0, "Nowhere");
    std::vector<CustomerLocation> cs = {
        customer("o1", 60.000, 10.000, "Oslo"),
        customer("t1", 69.000, 18.000, "Tromsdalen"),
        customer("iso", 65.000, 14.000, "Mo"),
        customer("t2", 69.010, 18.010, "Kvaloya"),
        lost,
        customer("o2", 60.010, 10.000, "Oslo"),
        customer("t3", 69.020, 18.000, "Tromsdalen"),
        customer("o3", 60.020, 10.000, "Oslo"),
        customer("t4", 69.030, 18.000, "Tromsdalen"),
    };
    ProximityGrouping g = group_by_proximity(cs);

    EXPECT_EQ(g.total_customers, 9u);
    ASSERT_EQ(g.groups.size(), 2u);
    EXPECT_EQ(ids_of(g.groups[0].members),
              (std::vector<std::string>{"t1", "t2", "t3", "t4"}));
    EXPECT_EQ(g.groups[0].area_label, "Tromsdalen / Kvaloya");
    EXPECT_EQ(ids_of(g.groups[1].members), (std::vector<std::string>{"o1", "o2", "o3"}));
    EXPECT_EQ(g.groups[1].area_label, "Oslo");
    EXPECT_EQ(ids_of(g.noise), (std::vector<std::string>{"lost", "iso"}));
}

// A customer needs two others in range to seed a group; a lone pair does not.
TEST(Proximity, IsolatedPairStaysNoise) {
    std::vector<CustomerLocation> cs = {
        customer("p1", 65.000, 14.000, "Mo"),
        customer("t1", 69.000, 18.000),
        customer("t2", 69.010, 18.000),
        customer("p2", 65.005, 14.000, "Mo"),
        customer("t3", 69.020, 18.000),
    };
    ProximityGrouping g = group_by_proximity(cs);
    ASSERT_EQ(g.groups.size(), 1u);
    EXPECT_EQ(ids_of(g.groups[0].members), (std::vector<std::string>{"t1", "t2", "t3"}));
    EXPECT_EQ(ids_of(g.noise), (std::vector<std::string>{"p1", "p2"}));
}

TEST(Proximity, PairAloneFallsBackToSingleGroup) {
    std::vector<CustomerLocation> cs = {
        customer("p1", 65.000, 14.000, "Mo"), customer("p2", 65.005, 14.000, "Mo")};
    ProximityGrouping g = group_by_proximity(cs);
    ASSERT_EQ(g.groups.size(), 1u);
    EXPECT_EQ(ids_of(g.groups[0].members), (std::vector<std::string>{"p1", "p2"}));
    EXPECT_EQ(g.groups[0].area_label, "Mo");
    EXPECT_TRUE(g.noise.empty());
}

TEST(Proximity, GroupRadiusIsFarthestMember) {
    std::vector<CustomerLocation> cs = {
        customer("a", 69.00, 18.0), customer("b", 69.02, 18.0), customer("c", 69.04, 18.0)};
    ProximityGrouping g = group_by_proximity(cs, 5.0);
    ASSERT_EQ(g.groups.size(), 1u);
    const ProximityGroup& grp = g.groups[0];
    EXPECT_NEAR(grp.centroid.latitude, 69.02, 1e-12);
    EXPECT_NEAR(grp.radius_km, distance_km(grp.centroid, {69.04, 18.0}), 1e-9);
    EXPECT_NEAR(grp.radius_km, 2.224, 0.01);
}

TEST(Proximity, NoGroupFormsYieldsSingleGroup) {
    std::vector<CustomerLocation> cs = {
        customer("a", 60.0, 10.0, "Oslo"),
        customer("b", 65.0, 14.0, "Mo"),
        customer("c", 69.0, 18.0, "Mo")};
    ProximityGrouping g = group_by_proximity(cs, 15.0);
    ASSERT_EQ(g.groups.size(), 1u);
    EXPECT_EQ(g.groups[0].members.size(), 3u);
    EXPECT_EQ(g.groups[0].area_label, "Mo");
    EXPECT_TRUE(g.noise.empty());
}

TEST(Proximity, OnlyUnlocatedCustomers) {
    std::vector<CustomerLocation> cs = {customer("a", 100.0, 10.0), customer("b", 0.0, 200.0)};
    ProximityGrouping g = group_by_proximity(cs);
    EXPECT_TRUE(g.groups.empty());
    EXPECT_EQ(g.noise.size(), 2u);
    EXPECT_EQ(g.total_customers, 2u);
}

TEST(Proximity, AreaLabels) {
    auto a = customer("a", 69.0, 18.0, "Tromsdalen");
    auto b = customer("b", 69.0, 18.0, "Kvaloya");
    auto c = customer("c", 69.0, 18.0, "Kvaloya");
    auto d = customer("d", 69.0, 18.0, "Hamna");
    auto e = customer("e", 69.0, 18.0);
    e.area_name.reset();

    EXPECT_EQ(area_label({a}), "Tromsdalen");
    EXPECT_EQ(area_label({a, b, c}), "Kvaloya / Tromsdalen");
    EXPECT_EQ(area_label({a, b, c, d}), "Kvaloya area (3 places)");
    EXPECT_EQ(area_label({e, e}), "Unknown");
    EXPECT_EQ(area_label({}), "Unknown");
}

TEST(Proximity, RejectsNonPositiveRadius) {
    std::vector<CustomerLocation> cs = {customer("a", 69.0, 18.0)};
    EXPECT_THROW(group_by_proximity(cs, 0.0), std::invalid_argument);
    EXPECT_THROW(group_by_proximity(cs, -3.0), std::invalid_argument);
}
