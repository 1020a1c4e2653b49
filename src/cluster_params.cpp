#include "routecluster/cluster_params.hpp"

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <string>

namespace routecluster {

namespace {

void override_int(const char* name, int& field) {
    const char* e = std::getenv(name);
    if (!e) return;
    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(e, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != std::strlen(e))
        throw std::invalid_argument(
            std::string("ClusterParameters: ") + name + " is not an integer: " + e);
    field = value;
}

void override_double(const char* name, double& field) {
    const char* e = std::getenv(name);
    if (!e) return;
    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(e, &used);
    } catch (const std::exception&) {
        used = 0;
    }
    if (used == 0 || used != std::strlen(e))
        throw std::invalid_argument(
            std::string("ClusterParameters: ") + name + " is not a number: " + e);
    field = value;
}

}  // namespace

void ClusterParameters::validate() const {
    if (!std::isfinite(cluster_radius_km) || cluster_radius_km <= 0.0)
        throw std::invalid_argument("ClusterParameters: cluster_radius_km must be > 0");
    if (min_cluster_size < 1)
        throw std::invalid_argument("ClusterParameters: min_cluster_size must be >= 1");
    if (max_customers_per_cluster < 1)
        throw std::invalid_argument("ClusterParameters: max_customers_per_cluster must be >= 1");
    if (days_ahead_horizon < 0)
        throw std::invalid_argument("ClusterParameters: days_ahead_horizon must be >= 0");
    if (max_travel_minutes < 0)
        throw std::invalid_argument("ClusterParameters: max_travel_minutes must be >= 0");
    if (service_time_minutes_per_stop < 0)
        throw std::invalid_argument("ClusterParameters: service_time_minutes_per_stop must be >= 0");
}

ClusterParameters ClusterParameters::from_env(const ClusterParameters& base) {
    ClusterParameters p = base;
    override_int("ROUTECLUSTER_DAYS_AHEAD", p.days_ahead_horizon);
    override_int("ROUTECLUSTER_MAX_CUSTOMERS", p.max_customers_per_cluster);
    override_int("ROUTECLUSTER_MAX_TRAVEL_MINUTES", p.max_travel_minutes);
    override_int("ROUTECLUSTER_MIN_CLUSTER_SIZE", p.min_cluster_size);
    override_double("ROUTECLUSTER_RADIUS_KM", p.cluster_radius_km);
    override_int("ROUTECLUSTER_SERVICE_MINUTES", p.service_time_minutes_per_stop);
    p.validate();
    return p;
}

}  // namespace routecluster
