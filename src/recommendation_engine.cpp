#include "routecluster/recommendation_engine.hpp"
#include "routecluster/dbscan.hpp"
#include "routecluster/due_dates.hpp"
#include "routecluster/efficiency.hpp"
#include "routecluster/geo_math.hpp"
#include "routecluster/log.hpp"

#include <algorithm>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace routecluster {

namespace {

// Relaxed-radius retry needs at least this many eligible customers.
constexpr size_t kMinForRetry = 3;
constexpr size_t kMinAreaGroup = 2;

struct Outcome {
    std::optional<Cluster> cluster;
    std::vector<size_t> kept;  // eligible indices that ended up in cluster
};

std::vector<CustomerLocation> gather(const std::vector<CustomerLocation>& eligible,
                                     const std::vector<size_t>& idx) {
    std::vector<CustomerLocation> out;
    out.reserve(idx.size());
    for (size_t i : idx) out.push_back(eligible[i]);
    return out;
}

}  // namespace

const char* strategy_name(Strategy s) {
    switch (s) {
        case Strategy::None:          return "none";
        case Strategy::Dbscan:        return "dbscan";
        case Strategy::RelaxedDbscan: return "dbscan-relaxed";
        case Strategy::AreaFallback:  return "area-fallback";
    }
    return "unknown";
}

RecommendationEngine::RecommendationEngine(ClusterParameters params, GeoPoint depot)
    : params_(params), depot_(depot) {
    params_.validate();
    if (!is_valid(depot_))
        throw std::invalid_argument("RecommendationEngine: depot has invalid coordinates");
}

std::vector<CustomerLocation> RecommendationEngine::eligible_customers(
    const std::vector<CustomerLocation>& customers, Date today) const {
    const Date horizon = add_days(today, params_.days_ahead_horizon);
    std::vector<CustomerLocation> out;
    for (const auto& c : customers) {
        if (!is_valid(c.location)) continue;
        auto due = resolve_next_due(c);
        if (!due || *due > horizon) continue;
        out.push_back(c);
    }
    return out;
}

std::vector<RecommendationEngine::Candidate> RecommendationEngine::area_candidates(
    const std::vector<CustomerLocation>& eligible) {
    std::vector<std::pair<std::string, std::vector<size_t>>> by_area;
    for (size_t i = 0; i < eligible.size(); ++i) {
        const auto& area = eligible[i].area_name;
        std::string key = (area && !area->empty()) ? *area : std::string(kUnknownArea);
        auto it = std::find_if(by_area.begin(), by_area.end(),
                               [&](const auto& e) { return e.first == key; });
        if (it == by_area.end())
            by_area.emplace_back(std::move(key), std::vector<size_t>{i});
        else
            it->second.push_back(i);
    }

    std::vector<Candidate> out;
    for (auto& [area, idx] : by_area) {
        if (idx.size() < kMinAreaGroup) continue;
        Candidate cand;
        cand.members = std::move(idx);
        cand.area_fallback = true;
        out.push_back(std::move(cand));
    }
    return out;
}

std::vector<RecommendationEngine::Candidate> RecommendationEngine::cluster_candidates(
    const std::vector<CustomerLocation>& eligible, RecommendationResult& result) const {
    std::vector<Candidate> out;
    const size_t min_size = static_cast<size_t>(params_.min_cluster_size);

    if (eligible.size() >= min_size) {
        std::vector<GeoPoint> pts = locations_of(eligible);

        double radius = params_.cluster_radius_km;
        ClusteringResult res =
            DbscanClusterer(radius, params_.min_cluster_size).cluster(pts);
        result.strategy = Strategy::Dbscan;
        ROUTECLUSTER_LOG("dbscan(r=%.2fkm, minPts=%d) found %zu clusters, %zu noise",
                         radius, params_.min_cluster_size,
                         res.clusters.size(), res.noise.size());

        if (res.clusters.empty() && eligible.size() >= kMinForRetry) {
            radius *= 2.0;
            res = DbscanClusterer(radius, params_.min_cluster_size).cluster(pts);
            result.strategy = Strategy::RelaxedDbscan;
            ROUTECLUSTER_LOG("retry dbscan(r=%.2fkm) found %zu clusters",
                             radius, res.clusters.size());
        }

        if (!res.clusters.empty()) {
            result.radius_used_km = radius;
            for (auto& idx : res.clusters) {
                Candidate cand;
                cand.members = std::move(idx);
                out.push_back(std::move(cand));
            }
            return out;
        }
    } else {
        ROUTECLUSTER_LOG("%zu eligible < min_cluster_size %d, skipping dbscan",
                         eligible.size(), params_.min_cluster_size);
    }

    out = area_candidates(eligible);
    result.strategy = Strategy::AreaFallback;
    result.radius_used_km = 0.0;
    ROUTECLUSTER_LOG("area fallback produced %zu groups", out.size());
    return out;
}

RecommendationResult RecommendationEngine::run(
    const std::vector<CustomerLocation>& customers, Date today) const {
    RecommendationResult result;
    std::vector<CustomerLocation> eligible = eligible_customers(customers, today);
    result.eligible_count = eligible.size();
    ROUTECLUSTER_LOG("%zu of %zu customers due within %d days",
                     eligible.size(), customers.size(), params_.days_ahead_horizon);
    if (eligible.empty()) return result;

    std::vector<Candidate> candidates = cluster_candidates(eligible, result);

    const EfficiencyScorer scorer(depot_, params_.service_time_minutes_per_stop, today);
    const size_t max_size = static_cast<size_t>(params_.max_customers_per_cluster);
    const int max_minutes = params_.max_travel_minutes;

    // Candidates share nothing after clustering; score them independently.
    std::vector<Outcome> outcomes(candidates.size());
    const std::ptrdiff_t n_cand = static_cast<std::ptrdiff_t>(candidates.size());
    #pragma omp parallel for schedule(dynamic)
    for (std::ptrdiff_t ci = 0; ci < n_cand; ++ci) {
        const Candidate& cand = candidates[static_cast<size_t>(ci)];
        Outcome& o = outcomes[static_cast<size_t>(ci)];

        std::optional<Cluster> scored = scorer.score(gather(eligible, cand.members));
        if (!scored) continue;

        const size_t size = cand.members.size();
        if (scored->estimated_travel_minutes > max_minutes && size > max_size)
            continue;

        if (size <= max_size) {
            o.cluster = std::move(scored);
            o.kept = cand.members;
        } else {
            // Keep the max_size members nearest the pre-trim centroid.
            std::vector<std::pair<double, size_t>> by_dist;
            by_dist.reserve(size);
            for (size_t idx : cand.members)
                by_dist.emplace_back(distance_km(eligible[idx].location, scored->centroid), idx);
            std::stable_sort(by_dist.begin(), by_dist.end(),
                             [](const auto& a, const auto& b) { return a.first < b.first; });
            std::vector<size_t> kept;
            kept.reserve(max_size);
            for (size_t k = 0; k < max_size; ++k) kept.push_back(by_dist[k].second);

            o.cluster = scorer.score(gather(eligible, kept));
            if (o.cluster) o.kept = std::move(kept);
        }
        if (o.cluster) o.cluster->is_area_fallback = cand.area_fallback;
    }

    std::vector<bool> assigned(eligible.size(), false);
    for (auto& o : outcomes) {
        if (!o.cluster) continue;
        for (size_t idx : o.kept) assigned[idx] = true;
        result.clusters.push_back(std::move(*o.cluster));
    }

    std::stable_sort(result.clusters.begin(), result.clusters.end(),
                     [](const Cluster& a, const Cluster& b) {
                         return a.efficiency_score > b.efficiency_score;
                     });
    for (size_t i = 0; i < result.clusters.size(); ++i)
        result.clusters[i].id = static_cast<int>(i);

    for (size_t i = 0; i < eligible.size(); ++i)
        if (!assigned[i]) result.unassigned.push_back(std::move(eligible[i]));

    ROUTECLUSTER_LOG("%s: %zu clusters ranked, %zu customers unassigned",
                     strategy_name(result.strategy), result.clusters.size(),
                     result.unassigned.size());
    return result;
}

std::vector<Cluster> RecommendationEngine::generate_recommendations(
    const std::vector<CustomerLocation>& customers, Date today) const {
    return run(customers, today).clusters;
}

std::vector<Cluster> RecommendationEngine::generate_recommendations(
    const std::vector<CustomerLocation>& customers) const {
    return generate_recommendations(customers, today_utc());
}

}  // namespace routecluster
