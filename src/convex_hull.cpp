#include "routecluster/convex_hull.hpp"
#include "routecluster/geo_math.hpp"

#include <cmath>

namespace routecluster {

namespace {

constexpr double kPi = 3.14159265358979323846;

// z of (a - o) x (b - o) with x = longitude, y = latitude.
// Negative: b lies clockwise of o->a.
inline double cross(const GeoPoint& o, const GeoPoint& a, const GeoPoint& b) {
    return (a.longitude - o.longitude) * (b.latitude - o.latitude) -
           (a.latitude - o.latitude) * (b.longitude - o.longitude);
}

inline double dist2(const GeoPoint& a, const GeoPoint& b) {
    double dx = a.longitude - b.longitude;
    double dy = a.latitude - b.latitude;
    return dx * dx + dy * dy;
}

inline bool same(const GeoPoint& a, const GeoPoint& b) {
    return a.latitude == b.latitude && a.longitude == b.longitude;
}

}  // namespace

std::vector<GeoPoint> convex_hull(const std::vector<GeoPoint>& points) {
    const size_t n = points.size();
    if (n < 3) return points;

    size_t anchor = 0;
    for (size_t i = 1; i < n; ++i) {
        if (points[i].latitude < points[anchor].latitude ||
            (points[i].latitude == points[anchor].latitude &&
             points[i].longitude < points[anchor].longitude))
            anchor = i;
    }

    std::vector<GeoPoint> hull;
    size_t current = anchor;
    for (size_t step = 0; step < n; ++step) {
        hull.push_back(points[current]);

        size_t next = current;
        for (size_t i = 0; i < n; ++i) {
            if (same(points[i], points[current])) continue;
            if (next == current) {
                next = i;
                continue;
            }
            double c = cross(points[current], points[next], points[i]);
            if (c < 0.0 ||
                (c == 0.0 && dist2(points[current], points[i]) >
                             dist2(points[current], points[next])))
                next = i;
        }

        // next == current: every point coincides with the anchor.
        if (next == current || same(points[next], points[anchor])) break;
        current = next;
    }
    return hull;
}

double polygon_area_km2(const std::vector<GeoPoint>& polygon) {
    const size_t n = polygon.size();
    if (n < 3) return 0.0;

    GeoPoint c = centroid(polygon);
    double km_per_deg_lng = kKmPerDegreeLat * std::cos(c.latitude * kPi / 180.0);

    double twice_area = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const GeoPoint& p = polygon[i];
        const GeoPoint& q = polygon[(i + 1) % n];
        double px = (p.longitude - c.longitude) * km_per_deg_lng;
        double py = (p.latitude - c.latitude) * kKmPerDegreeLat;
        double qx = (q.longitude - c.longitude) * km_per_deg_lng;
        double qy = (q.latitude - c.latitude) * kKmPerDegreeLat;
        twice_area += px * qy - qx * py;
    }
    return std::fabs(twice_area) / 2.0;
}

}  // namespace routecluster
