#include "routecluster/spatial_grid.hpp"
#include "routecluster/geo_math.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace routecluster {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kFullLongitude = 360.0;

}  // namespace

SpatialGrid::SpatialGrid(std::vector<GeoPoint> points, double epsilon_km)
    : points_(std::move(points)), epsilon_km_(epsilon_km) {
    if (!std::isfinite(epsilon_km) || epsilon_km <= 0.0)
        throw std::invalid_argument("SpatialGrid: epsilon_km must be > 0");

    // |dlat| <= d / R along any great circle, and eps/111 deg >= eps/R rad.
    cell_lat_deg_ = epsilon_km / kKmPerDegreeLat;

    double max_abs_lat = 0.0;
    for (const auto& p : points_)
        if (std::isfinite(p.latitude) && std::isfinite(p.longitude))
            max_abs_lat = std::max(max_abs_lat, std::fabs(p.latitude));

    // Haversine bound: sin(dlng/2) * cos(lat_max) <= sin(d / 2R).
    double cos_max = std::cos(max_abs_lat * kPi / 180.0);
    double s = cos_max > 0.0
        ? std::sin(epsilon_km / (2.0 * kEarthRadiusKm)) / cos_max
        : 2.0;
    if (s >= 1.0) {
        cell_lng_deg_ = kFullLongitude;
    } else {
        double lng = 2.0 * std::asin(s) * 180.0 / kPi;
        cell_lng_deg_ = std::min(kFullLongitude, std::max(lng, cell_lat_deg_));
    }

    for (size_t i = 0; i < points_.size(); ++i) {
        const GeoPoint& p = points_[i];
        if (!std::isfinite(p.latitude) || !std::isfinite(p.longitude)) continue;
        cells_[cell_key(cell_x(p), cell_y(p))].push_back(i);
    }
}

int64_t SpatialGrid::cell_x(const GeoPoint& p) const {
    return static_cast<int64_t>(std::floor(p.longitude / cell_lng_deg_));
}

int64_t SpatialGrid::cell_y(const GeoPoint& p) const {
    return static_cast<int64_t>(std::floor(p.latitude / cell_lat_deg_));
}

std::vector<size_t> SpatialGrid::neighbors_within(size_t i, double epsilon_km) const {
    if (i >= points_.size())
        throw std::out_of_range("SpatialGrid::neighbors_within: index out of range");
    if (epsilon_km > epsilon_km_)
        throw std::invalid_argument(
            "SpatialGrid::neighbors_within: epsilon exceeds grid cell size");

    std::vector<size_t> out;
    const GeoPoint& p = points_[i];
    if (!std::isfinite(p.latitude) || !std::isfinite(p.longitude)) return out;

    int64_t cx = cell_x(p);
    int64_t cy = cell_y(p);
    for (int64_t dx = -1; dx <= 1; ++dx) {
        for (int64_t dy = -1; dy <= 1; ++dy) {
            auto it = cells_.find(cell_key(cx + dx, cy + dy));
            if (it == cells_.end()) continue;
            for (size_t j : it->second) {
                if (distance_km(p, points_[j]) <= epsilon_km)
                    out.push_back(j);
            }
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace routecluster
