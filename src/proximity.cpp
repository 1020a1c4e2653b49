#include "routecluster/proximity.hpp"
#include "routecluster/dbscan.hpp"
#include "routecluster/efficiency.hpp"
#include "routecluster/geo_math.hpp"
#include "routecluster/log.hpp"

#include <algorithm>
#include <utility>

namespace routecluster {

namespace {

// Neighbour counts include the point itself: a seed needs two others nearby,
// so an isolated pair stays noise.
constexpr int kProximityMinPts = 3;

ProximityGroup make_group(std::vector<CustomerLocation> members, std::string label) {
    ProximityGroup g;
    g.centroid = centroid(members);
    for (const auto& m : members)
        g.radius_km = std::max(g.radius_km, distance_km(g.centroid, m.location));
    g.members = std::move(members);
    g.area_label = std::move(label);
    return g;
}

}  // namespace

std::string area_label(const std::vector<CustomerLocation>& members) {
    std::vector<std::pair<std::string, int>> counts;
    for (const auto& m : members) {
        std::string area = (m.area_name && !m.area_name->empty())
            ? *m.area_name : std::string(kUnknownArea);
        auto it = std::find_if(counts.begin(), counts.end(),
                               [&](const auto& e) { return e.first == area; });
        if (it == counts.end())
            counts.emplace_back(std::move(area), 1);
        else
            ++it->second;
    }
    std::stable_sort(counts.begin(), counts.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    if (counts.empty()) return kUnknownArea;
    if (counts.size() == 1) return counts[0].first;
    if (counts.size() == 2) return counts[0].first + " / " + counts[1].first;
    return counts[0].first + " area (" + std::to_string(counts.size()) + " places)";
}

ProximityGrouping group_by_proximity(const std::vector<CustomerLocation>& customers,
                                     double radius_km) {
    DbscanClusterer dbscan(radius_km, kProximityMinPts);

    ProximityGrouping out;
    out.total_customers = customers.size();

    std::vector<CustomerLocation> located;
    for (const auto& c : customers) {
        if (is_valid(c.location))
            located.push_back(c);
        else
            out.noise.push_back(c);
    }
    if (located.empty()) return out;

    ClusteringResult res = dbscan.cluster(locations_of(located));
    ROUTECLUSTER_LOG("proximity(r=%.1fkm): %zu groups from %zu located customers",
                     radius_km, res.clusters.size(), located.size());

    if (res.clusters.empty()) {
        std::string label = primary_area_name(located);
        out.groups.push_back(make_group(std::move(located), std::move(label)));
        return out;
    }

    for (const auto& idx : res.clusters) {
        std::vector<CustomerLocation> members;
        members.reserve(idx.size());
        for (size_t i : idx) members.push_back(located[i]);
        std::string label = area_label(members);
        out.groups.push_back(make_group(std::move(members), std::move(label)));
    }
    std::stable_sort(out.groups.begin(), out.groups.end(),
                     [](const ProximityGroup& a, const ProximityGroup& b) {
                         return a.members.size() > b.members.size();
                     });
    for (size_t i : res.noise) out.noise.push_back(located[i]);
    return out;
}

}  // namespace routecluster
