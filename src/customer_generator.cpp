#include "routecluster/customer_generator.hpp"
#include "routecluster/due_dates.hpp"
#include "routecluster/geo_math.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>

namespace routecluster {

std::vector<CustomerLocation> generate_customer_snapshot(
    size_t n, int num_towns, Date today, unsigned seed) {
    if (num_towns <= 0)
        throw std::invalid_argument("generate_customer_snapshot: num_towns must be > 0");

    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> lat_dist(59.0, 70.0);
    std::uniform_real_distribution<double> lng_dist(5.0, 25.0);
    std::uniform_real_distribution<double> spread_dist(0.5, 3.0);
    std::uniform_int_distribution<int> due_dist(-60, 120);

    // Town centres and per-town spread (km).
    std::vector<GeoPoint> towns(static_cast<size_t>(num_towns));
    std::vector<double> spreads(static_cast<size_t>(num_towns));
    for (int g = 0; g < num_towns; ++g) {
        towns[g] = {lat_dist(rng), lng_dist(rng)};
        spreads[g] = spread_dist(rng);
    }

    static const char* const kCategories[] = {"Electrical", "Fire alarm", "Electrical + Fire alarm"};

    std::normal_distribution<double> noise(0.0, 1.0);
    std::vector<CustomerLocation> out(n);
    for (size_t i = 0; i < n; ++i) {
        int g = static_cast<int>(i % static_cast<size_t>(num_towns));
        const GeoPoint& t = towns[g];
        double s = spreads[g];
        double km_per_deg_lng = kKmPerDegreeLat * std::cos(t.latitude * 3.14159265358979323846 / 180.0);

        CustomerLocation& c = out[i];
        c.id = "C" + std::to_string(i);
        c.display_name = "Customer " + std::to_string(i);
        c.location.latitude = std::clamp(t.latitude + s * noise(rng) / kKmPerDegreeLat, -90.0, 90.0);
        c.location.longitude = std::clamp(t.longitude + s * noise(rng) / km_per_deg_lng, -180.0, 180.0);
        c.area_name = "Town " + std::to_string(g);
        c.category = kCategories[i % 3];
        c.next_due_date = add_days(today, due_dist(rng));
    }
    return out;
}

}  // namespace routecluster
