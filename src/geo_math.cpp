#include "routecluster/geo_math.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace routecluster {

namespace {

constexpr double kPi = 3.14159265358979323846;

inline double to_rad(double deg) { return deg * kPi / 180.0; }

}  // namespace

bool is_valid(const GeoPoint& p) {
    return std::isfinite(p.latitude) && std::isfinite(p.longitude) &&
           p.latitude >= -90.0 && p.latitude <= 90.0 &&
           p.longitude >= -180.0 && p.longitude <= 180.0;
}

double distance_km(const GeoPoint& a, const GeoPoint& b) {
    if (!std::isfinite(a.latitude) || !std::isfinite(a.longitude) ||
        !std::isfinite(b.latitude) || !std::isfinite(b.longitude))
        return std::numeric_limits<double>::infinity();

    double dlat = to_rad(b.latitude - a.latitude);
    double dlng = to_rad(b.longitude - a.longitude);
    double s_lat = std::sin(dlat / 2.0);
    double s_lng = std::sin(dlng / 2.0);
    double h = s_lat * s_lat +
               std::cos(to_rad(a.latitude)) * std::cos(to_rad(b.latitude)) *
               s_lng * s_lng;
    return kEarthRadiusKm * 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
}

GeoPoint centroid(const std::vector<GeoPoint>& points) {
    double sum_lat = 0.0;
    double sum_lng = 0.0;
    for (const auto& p : points) {
        sum_lat += p.latitude;
        sum_lng += p.longitude;
    }
    double n = static_cast<double>(points.size());
    return {sum_lat / n, sum_lng / n};
}

GeoPoint centroid(const std::vector<CustomerLocation>& customers) {
    return centroid(locations_of(customers));
}

BoundingBox bounding_box(const std::vector<GeoPoint>& points) {
    BoundingBox box{points[0].latitude, points[0].latitude,
                    points[0].longitude, points[0].longitude};
    for (const auto& p : points) {
        box.min_lat = std::min(box.min_lat, p.latitude);
        box.max_lat = std::max(box.max_lat, p.latitude);
        box.min_lng = std::min(box.min_lng, p.longitude);
        box.max_lng = std::max(box.max_lng, p.longitude);
    }
    return box;
}

double bounding_box_area_km2(const std::vector<GeoPoint>& points) {
    BoundingBox box = bounding_box(points);
    GeoPoint c = centroid(points);
    double lat_km = (box.max_lat - box.min_lat) * kKmPerDegreeLat;
    double lng_km = (box.max_lng - box.min_lng) * kKmPerDegreeLat *
                    std::cos(to_rad(c.latitude));
    return std::max(lat_km * lng_km, kMinBoxAreaKm2);
}

std::vector<GeoPoint> locations_of(const std::vector<CustomerLocation>& customers) {
    std::vector<GeoPoint> out;
    out.reserve(customers.size());
    for (const auto& c : customers) out.push_back(c.location);
    return out;
}

}  // namespace routecluster
