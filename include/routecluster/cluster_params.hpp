#ifndef ROUTECLUSTER_CLUSTER_PARAMS_HPP
#define ROUTECLUSTER_CLUSTER_PARAMS_HPP

namespace routecluster {

struct ClusterParameters {
    int    days_ahead_horizon           = 60;
    int    max_customers_per_cluster    = 15;
    int    max_travel_minutes           = 480;
    int    min_cluster_size             = 3;     // DBSCAN minPts
    double cluster_radius_km            = 5.0;   // DBSCAN epsilon
    int    service_time_minutes_per_stop = 30;

    // Throws std::invalid_argument on contract violations
    // (cluster_radius_km <= 0, min_cluster_size < 1, ...).
    void validate() const;

    // base with fields overridden from ROUTECLUSTER_* environment variables.
    // Validates the result.
    static ClusterParameters from_env(const ClusterParameters& base);
    static ClusterParameters from_env();
};

inline ClusterParameters ClusterParameters::from_env() {
    return from_env(ClusterParameters{});
}

}  // namespace routecluster

#endif  // ROUTECLUSTER_CLUSTER_PARAMS_HPP
