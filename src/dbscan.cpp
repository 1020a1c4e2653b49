#include "routecluster/dbscan.hpp"
#include "routecluster/geo_math.hpp"
#include "routecluster/spatial_grid.hpp"

#include "absl/container/flat_hash_set.h"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace routecluster {

DbscanClusterer::DbscanClusterer(double epsilon_km, int min_pts)
    : epsilon_km_(epsilon_km), min_pts_(min_pts) {
    if (!std::isfinite(epsilon_km) || epsilon_km <= 0.0)
        throw std::invalid_argument("DbscanClusterer: epsilon_km must be > 0");
    if (min_pts < 1)
        throw std::invalid_argument("DbscanClusterer: min_pts must be >= 1");
}

ClusteringResult DbscanClusterer::cluster(const std::vector<GeoPoint>& points) const {
    const size_t n = points.size();
    ClusteringResult out;
    out.labels.assign(n, -1);
    if (n == 0) return out;

    SpatialGrid grid(points, epsilon_km_);
    const size_t min_pts = static_cast<size_t>(min_pts_);

    std::vector<bool> visited(n, false);
    std::vector<int> assigned(n, -1);
    int next_id = 0;

    // Expansion frontier: index-addressed FIFO plus a set for O(1) dedup.
    std::vector<size_t> queue;
    absl::flat_hash_set<size_t> queued;

    for (size_t i = 0; i < n; ++i) {
        if (visited[i]) continue;
        visited[i] = true;

        std::vector<size_t> neighbors = grid.neighbors_within(i);
        if (neighbors.size() < min_pts) continue;  // noise for now, may become border

        const int id = next_id++;
        assigned[i] = id;

        queue.assign(neighbors.begin(), neighbors.end());
        queued.clear();
        queued.insert(neighbors.begin(), neighbors.end());

        for (size_t head = 0; head < queue.size(); ++head) {
            size_t cur = queue[head];
            if (!visited[cur]) {
                visited[cur] = true;
                std::vector<size_t> cur_neighbors = grid.neighbors_within(cur);
                if (cur_neighbors.size() >= min_pts) {
                    for (size_t nb : cur_neighbors) {
                        if (assigned[nb] == -1 && queued.insert(nb).second)
                            queue.push_back(nb);
                    }
                }
            }
            if (assigned[cur] == -1) assigned[cur] = id;
        }
    }

    std::vector<std::vector<size_t>> groups(static_cast<size_t>(next_id));
    for (size_t i = 0; i < n; ++i)
        if (assigned[i] >= 0) groups[static_cast<size_t>(assigned[i])].push_back(i);

    // Border-only leftovers below min_pts revert to noise.
    for (auto& g : groups) {
        if (g.size() < min_pts) continue;
        int label = static_cast<int>(out.clusters.size());
        for (size_t idx : g) out.labels[idx] = label;
        out.clusters.push_back(std::move(g));
    }
    for (size_t i = 0; i < n; ++i)
        if (out.labels[i] < 0) out.noise.push_back(i);

    return out;
}

std::vector<std::vector<CustomerLocation>> DbscanClusterer::cluster_customers(
    const std::vector<CustomerLocation>& customers) const {
    ClusteringResult res = cluster(locations_of(customers));
    std::vector<std::vector<CustomerLocation>> out;
    out.reserve(res.clusters.size());
    for (const auto& idx : res.clusters) {
        std::vector<CustomerLocation> members;
        members.reserve(idx.size());
        for (size_t i : idx) members.push_back(customers[i]);
        out.push_back(std::move(members));
    }
    return out;
}

}  // namespace routecluster
