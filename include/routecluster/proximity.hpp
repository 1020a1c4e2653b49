#ifndef ROUTECLUSTER_PROXIMITY_HPP
#define ROUTECLUSTER_PROXIMITY_HPP

#include "routecluster/types.hpp"

#include <string>
#include <vector>

namespace routecluster {

constexpr double kDefaultProximityRadiusKm = 15.0;

struct ProximityGroup {
    std::vector<CustomerLocation> members;
    GeoPoint centroid;
    double radius_km = 0.0;   // farthest member from centroid
    std::string area_label;
};

struct ProximityGrouping {
    std::vector<ProximityGroup> groups;      // largest first
    std::vector<CustomerLocation> noise;     // unlocated first, then isolated
    size_t total_customers = 0;
};

// Groups a whole customer list (no due-date filter) by DBSCAN. A group needs
// a customer with at least two others within radius_km. If no group forms,
// all located customers become one group.
// Throws std::invalid_argument for radius_km <= 0.
ProximityGrouping group_by_proximity(const std::vector<CustomerLocation>& customers,
                                     double radius_km = kDefaultProximityRadiusKm);

// "A", "A / B", or "A area (N places)" from the members' area names,
// most common first.
std::string area_label(const std::vector<CustomerLocation>& members);

}  // namespace routecluster

#endif  // ROUTECLUSTER_PROXIMITY_HPP
