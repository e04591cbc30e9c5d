#pragma once

#include <vector>
#include <mutex>
#include <random>
#include <utility>
#include <cstdint>
#include "types.hpp"
#include "error_code.hpp"
#include "health_tracker.hpp"

// Chooses replica targets for one chunk upload out of the currently healthy nodes.
class PlacementCoordinator {
private:
    HealthTracker* theTracker;

    std::mutex rng_mutex;
    std::mt19937_64 rng;

public:
    explicit PlacementCoordinator(HealthTracker* tracker);
    PlacementCoordinator(HealthTracker* tracker, uint64_t seed);

    // R distinct healthy nodes sampled uniformly without replacement.
    // Fails right away with INSUFFICIENT_HEALTHY_NODES when fewer than R are
    // healthy; it is up to the caller to retry later.
    std::pair<ErrorCode, std::vector<NodeInfo>> selectTargets(size_t replication_factor);
};
