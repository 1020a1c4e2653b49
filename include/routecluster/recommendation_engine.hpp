#ifndef ROUTECLUSTER_RECOMMENDATION_ENGINE_HPP
#define ROUTECLUSTER_RECOMMENDATION_ENGINE_HPP

#include "routecluster/cluster_params.hpp"
#include "routecluster/types.hpp"

#include <cstddef>
#include <vector>

namespace routecluster {

enum class Strategy { None, Dbscan, RelaxedDbscan, AreaFallback };

const char* strategy_name(Strategy s);

struct RecommendationResult {
    std::vector<Cluster> clusters;                // ranked, best first, id == rank
    std::vector<CustomerLocation> unassigned;     // eligible but in no cluster
    Strategy strategy = Strategy::None;
    size_t eligible_count = 0;
    double radius_used_km = 0.0;                  // 0 unless DBSCAN produced the clusters
};

/**
 * Turns a customer snapshot into ranked visit clusters.
 *
 * Pipeline: eligibility filter -> DBSCAN(radius) -> DBSCAN(2 * radius) ->
 * area-name grouping, stopping at the first stage that yields clusters.
 * Candidates are then scored, dropped when both over the travel budget and
 * over the size cap, trimmed to the size cap (nearest to centroid) and
 * ranked by efficiency score.
 *
 * Stateless between calls; run() is safe to call concurrently.
 */
class RecommendationEngine {
public:
    // Validates params (std::invalid_argument) and the depot coordinate.
    RecommendationEngine(ClusterParameters params, GeoPoint depot);

    // Customers with a valid location whose resolved due date is on or
    // before today + days_ahead_horizon, in input order.
    std::vector<CustomerLocation> eligible_customers(
        const std::vector<CustomerLocation>& customers, Date today) const;

    RecommendationResult run(const std::vector<CustomerLocation>& customers,
                             Date today) const;

    std::vector<Cluster> generate_recommendations(
        const std::vector<CustomerLocation>& customers, Date today) const;

    // Uses today_utc().
    std::vector<Cluster> generate_recommendations(
        const std::vector<CustomerLocation>& customers) const;

    const ClusterParameters& params() const { return params_; }
    const GeoPoint& depot() const { return depot_; }

private:
    struct Candidate {
        std::vector<size_t> members;  // indices into the eligible list
        bool area_fallback = false;
    };

    ClusterParameters params_;
    GeoPoint depot_;

    std::vector<Candidate> cluster_candidates(
        const std::vector<CustomerLocation>& eligible,
        RecommendationResult& result) const;

    static std::vector<Candidate> area_candidates(
        const std::vector<CustomerLocation>& eligible);
};

}  // namespace routecluster

#endif  // ROUTECLUSTER_RECOMMENDATION_ENGINE_HPP
