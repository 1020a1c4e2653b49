#ifndef ROUTECLUSTER_SPATIAL_GRID_HPP
#define ROUTECLUSTER_SPATIAL_GRID_HPP

#include "routecluster/types.hpp"

#include "absl/container/flat_hash_map.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace routecluster {

/**
 * Uniform lat/lng grid for epsilon-neighbourhood queries.
 *
 * Cells are at least epsilon_km wide along both axes, so every point within
 * epsilon of a query point sits in the 3x3 block around the query's cell.
 * Latitude cells are epsilon/111 degrees. Longitude cells are widened for the
 * highest |latitude| in the set, where meridians are closest together.
 *
 * Points with non-finite coordinates are not indexed and have no neighbours.
 * Longitudes are not wrapped at +-180.
 */
class SpatialGrid {
public:
    SpatialGrid(std::vector<GeoPoint> points, double epsilon_km);

    // Indices (ascending) of all points within epsilon_km of points[i],
    // including i itself. epsilon_km must not exceed the build epsilon.
    std::vector<size_t> neighbors_within(size_t i, double epsilon_km) const;

    std::vector<size_t> neighbors_within(size_t i) const {
        return neighbors_within(i, epsilon_km_);
    }

    size_t size() const { return points_.size(); }
    size_t cell_count() const { return cells_.size(); }
    double cell_lat_deg() const { return cell_lat_deg_; }
    double cell_lng_deg() const { return cell_lng_deg_; }
    double epsilon_km() const { return epsilon_km_; }

private:
    std::vector<GeoPoint> points_;
    double epsilon_km_;
    double cell_lat_deg_;
    double cell_lng_deg_;
    absl::flat_hash_map<uint64_t, std::vector<size_t>> cells_;  // cell_key -> point indices

    int64_t cell_x(const GeoPoint& p) const;
    int64_t cell_y(const GeoPoint& p) const;

    static uint64_t cell_key(int64_t x, int64_t y) {
        return (static_cast<uint64_t>(x) << 32) ^
               (static_cast<uint64_t>(y) & 0xffffffffULL);
    }
};

}  // namespace routecluster

#endif  // ROUTECLUSTER_SPATIAL_GRID_HPP
