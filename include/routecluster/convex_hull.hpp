#ifndef ROUTECLUSTER_CONVEX_HULL_HPP
#define ROUTECLUSTER_CONVEX_HULL_HPP

#include "routecluster/types.hpp"

#include <vector>

namespace routecluster {

// Gift-wrapping (Jarvis march) hull in lng/lat plane, counter-clockwise,
// starting at the lowest-latitude point (ties: lowest longitude). Collinear
// points are skipped in favour of the farthest one. The walk is bounded by
// n steps. Fewer than 3 points are returned unchanged.
std::vector<GeoPoint> convex_hull(const std::vector<GeoPoint>& points);

// Shoelace area of a polygon projected to km around its centroid.
// 0 for fewer than 3 vertices.
double polygon_area_km2(const std::vector<GeoPoint>& polygon);

}  // namespace routecluster

#endif  // ROUTECLUSTER_CONVEX_HULL_HPP
