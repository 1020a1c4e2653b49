#include "routecluster/efficiency.hpp"
#include "routecluster/due_dates.hpp"
#include "routecluster/geo_math.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace routecluster {

EfficiencyScorer::EfficiencyScorer(GeoPoint depot, int service_minutes_per_stop,
                                   Date today)
    : depot_(depot), service_minutes_per_stop_(service_minutes_per_stop),
      today_(today) {
    if (!is_valid(depot))
        throw std::invalid_argument("EfficiencyScorer: depot has invalid coordinates");
}

std::optional<Cluster> EfficiencyScorer::score(
    std::vector<CustomerLocation> members) const {
    const size_t count = members.size();
    if (count < 2) return std::nullopt;
    const double n = static_cast<double>(count);

    Cluster c;
    std::vector<GeoPoint> pts = locations_of(members);
    c.centroid = centroid(pts);
    c.distance_from_depot_km = distance_km(depot_, c.centroid);

    double radius_sum = 0.0;
    for (const auto& p : pts) radius_sum += distance_km(p, c.centroid);
    c.avg_radius_from_centroid_km = radius_sum / n;

    c.density = n / bounding_box_area_km2(pts);

    const double d_depot = c.distance_from_depot_km;
    const double avg_r = c.avg_radius_from_centroid_km;

    double to_area = (d_depot * 2.0 / kDepotSpeedKmh) * 60.0;
    double within_area = (avg_r * n * kDetourFactor / kIntraAreaSpeedKmh) * 60.0;
    double service = n * service_minutes_per_stop_;
    c.estimated_travel_minutes =
        static_cast<int>(std::lround(to_area + within_area + service));
    c.estimated_km = static_cast<int>(std::lround(d_depot * 2.0 + avg_r * n * kDetourFactor));

    double raw = (c.density * n * 10.0) / (1.0 + d_depot * 0.05 + avg_r * 0.3);
    double scaled = std::round(raw * 10.0);
    c.efficiency_score = static_cast<int>(std::clamp(scaled, 0.0, 100.0));

    for (const auto& m : members) {
        if (is_overdue(m, today_)) ++c.overdue_count;
        if (m.category && !m.category->empty()) c.categories.insert(*m.category);
    }
    c.upcoming_count = static_cast<int>(count) - c.overdue_count;
    c.primary_area_name = primary_area_name(members);
    c.members = std::move(members);
    return c;
}

std::string primary_area_name(const std::vector<CustomerLocation>& members) {
    std::vector<std::pair<std::string, int>> counts;
    for (const auto& m : members) {
        const std::string& area =
            (m.area_name && !m.area_name->empty()) ? *m.area_name : std::string(kUnknownArea);
        auto it = std::find_if(counts.begin(), counts.end(),
                               [&](const auto& e) { return e.first == area; });
        if (it == counts.end())
            counts.emplace_back(area, 1);
        else
            ++it->second;
    }
    if (counts.empty()) return kUnknownArea;
    auto best = counts.begin();
    for (auto it = counts.begin(); it != counts.end(); ++it)
        if (it->second > best->second) best = it;
    return best->first;
}

}  // namespace routecluster
