#ifndef ROUTECLUSTER_TYPES_HPP
#define ROUTECLUSTER_TYPES_HPP

#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace routecluster {

// Calendar day; customer due dates carry no time of day.
using Date = std::chrono::sys_days;

struct GeoPoint {
    double latitude = 0.0;
    double longitude = 0.0;
};

// One periodic service contract. next_due wins over last_visit + interval.
struct ServiceRecord {
    std::string kind;
    std::optional<Date> next_due;
    std::optional<Date> last_visit;
    int interval_months = 12;
};

// Point-in-time copy of a customer as supplied by the customer store.
struct CustomerLocation {
    std::string id;
    GeoPoint location;
    std::string display_name;
    std::optional<std::string> area_name;
    std::optional<std::string> category;
    std::optional<Date> next_due_date;
    std::vector<ServiceRecord> services;
};

struct Cluster {
    int id = -1;                      // rank, assigned after sorting
    std::vector<CustomerLocation> members;
    GeoPoint centroid;
    std::string primary_area_name;
    std::set<std::string> categories;
    int overdue_count = 0;
    int upcoming_count = 0;
    int efficiency_score = 0;         // [0, 100]
    int estimated_travel_minutes = 0;
    int estimated_km = 0;
    double density = 0.0;             // customers per km^2
    double avg_radius_from_centroid_km = 0.0;
    double distance_from_depot_km = 0.0;
    bool is_area_fallback = false;

    size_t size() const { return members.size(); }
};

}  // namespace routecluster

#endif  // ROUTECLUSTER_TYPES_HPP
