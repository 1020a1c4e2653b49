#ifndef ROUTECLUSTER_DBSCAN_HPP
#define ROUTECLUSTER_DBSCAN_HPP

#include "routecluster/types.hpp"

#include <cstddef>
#include <vector>

namespace routecluster {

struct ClusteringResult {
    std::vector<int> labels;                    // per point: cluster index, -1 = noise
    std::vector<std::vector<size_t>> clusters;  // point indices, discovery order
    std::vector<size_t> noise;                  // ascending
};

// Grid-accelerated DBSCAN over lat/lng points with haversine distance.
// A point's neighbourhood includes itself, so min_pts counts the point.
// Output is deterministic for a given input order.
class DbscanClusterer {
public:
    // Throws std::invalid_argument for epsilon_km <= 0 or min_pts < 1.
    DbscanClusterer(double epsilon_km, int min_pts);

    ClusteringResult cluster(const std::vector<GeoPoint>& points) const;

    // Convenience: member lists instead of indices. Noise is dropped.
    std::vector<std::vector<CustomerLocation>> cluster_customers(
        const std::vector<CustomerLocation>& customers) const;

    double epsilon_km() const { return epsilon_km_; }
    int min_pts() const { return min_pts_; }

private:
    double epsilon_km_;
    int min_pts_;
};

}  // namespace routecluster

#endif  // ROUTECLUSTER_DBSCAN_HPP
