#ifndef ROUTECLUSTER_CUSTOMER_GENERATOR_HPP
#define ROUTECLUSTER_CUSTOMER_GENERATOR_HPP

#include "routecluster/types.hpp"

#include <cstddef>
#include <vector>

namespace routecluster {

// Synthetic customer snapshot for tests and benchmarks.
// Customers are drawn round-robin from num_towns towns whose centres are
// uniform in lat [59, 70], lng [5, 25]. Each town has a Gaussian spread of
// 0.5-3 km. Due dates are uniform in [today - 60, today + 120] days.
// Customer i belongs to town i % num_towns, area name "Town <g>".
std::vector<CustomerLocation> generate_customer_snapshot(
    size_t n, int num_towns, Date today, unsigned seed);

}  // namespace routecluster

#endif  // ROUTECLUSTER_CUSTOMER_GENERATOR_HPP
