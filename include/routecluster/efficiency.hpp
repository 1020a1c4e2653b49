#ifndef ROUTECLUSTER_EFFICIENCY_HPP
#define ROUTECLUSTER_EFFICIENCY_HPP

#include "routecluster/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace routecluster {

constexpr double kDepotSpeedKmh = 50.0;
constexpr double kIntraAreaSpeedKmh = 30.0;
constexpr double kDetourFactor = 1.5;
constexpr char kUnknownArea[] = "Unknown";

/**
 * Scores a candidate group of customers for a single day's route.
 *
 *   travel minutes = round trip depot<->centroid at 50 km/h
 *                  + avg radius * n * 1.5 at 30 km/h
 *                  + n * service minutes
 *   score          = clamp(0, 100, round(density*n*10 /
 *                          (1 + depot_km*0.05 + avg_radius_km*0.3) * 10))
 *
 * The coefficients are fixed; changing them changes which clusters are
 * recommended first.
 */
class EfficiencyScorer {
public:
    // Throws std::invalid_argument if depot is not a valid coordinate.
    EfficiencyScorer(GeoPoint depot, int service_minutes_per_stop, Date today);

    // Empty for fewer than 2 members. The returned cluster has id -1 and
    // is_area_fallback false.
    std::optional<Cluster> score(std::vector<CustomerLocation> members) const;

    const GeoPoint& depot() const { return depot_; }
    Date today() const { return today_; }

private:
    GeoPoint depot_;
    int service_minutes_per_stop_;
    Date today_;
};

// Most frequent area name, kUnknownArea for missing names; ties keep the
// first one seen.
std::string primary_area_name(const std::vector<CustomerLocation>& members);

}  // namespace routecluster

#endif  // ROUTECLUSTER_EFFICIENCY_HPP
