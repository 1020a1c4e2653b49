#ifndef ROUTECLUSTER_GEO_MATH_HPP
#define ROUTECLUSTER_GEO_MATH_HPP

#include "routecluster/types.hpp"

#include <vector>

namespace routecluster {

constexpr double kEarthRadiusKm = 6371.0;
constexpr double kKmPerDegreeLat = 111.0;
constexpr double kMinBoxAreaKm2 = 0.1;

struct BoundingBox {
    double min_lat;
    double max_lat;
    double min_lng;
    double max_lng;
};

// Finite and inside [-90, 90] x [-180, 180].
bool is_valid(const GeoPoint& p);

// Haversine great-circle distance. +inf if any coordinate is non-finite,
// so comparisons against a radius discard the pair.
double distance_km(const GeoPoint& a, const GeoPoint& b);

// Arithmetic mean of lat/lng. points must be non-empty.
GeoPoint centroid(const std::vector<GeoPoint>& points);
GeoPoint centroid(const std::vector<CustomerLocation>& customers);

// points must be non-empty.
BoundingBox bounding_box(const std::vector<GeoPoint>& points);

// Box area using 111 km/deg latitude and 111*cos(centroid lat) km/deg
// longitude. Never below kMinBoxAreaKm2.
double bounding_box_area_km2(const std::vector<GeoPoint>& points);

std::vector<GeoPoint> locations_of(const std::vector<CustomerLocation>& customers);

}  // namespace routecluster

#endif  // ROUTECLUSTER_GEO_MATH_HPP
