#ifndef ROUTECLUSTER_LOG_HPP
#define ROUTECLUSTER_LOG_HPP

#include <cstdio>

namespace routecluster {

// True when ROUTECLUSTER_LOG is set to 1/y/Y. Read once per process.
bool log_enabled();

}  // namespace routecluster

#define ROUTECLUSTER_LOG(fmt, ...)                                          \
    do {                                                                    \
        if (::routecluster::log_enabled())                                  \
            std::fprintf(stderr, "[routecluster] " fmt "\n", ##__VA_ARGS__); \
    } while (0)

#endif  // ROUTECLUSTER_LOG_HPP
