#include "placement.hpp"
#include <iostream>
#include <algorithm>
#include <iterator>

PlacementCoordinator::PlacementCoordinator(HealthTracker* tracker)
    : PlacementCoordinator(tracker, std::random_device{}()) {
}

PlacementCoordinator::PlacementCoordinator(HealthTracker* tracker, uint64_t seed)
    : theTracker(tracker), rng(seed) {
}

std::pair<ErrorCode, std::vector<NodeInfo>> PlacementCoordinator::selectTargets(size_t replication_factor) {
    if (replication_factor == 0) {
        return {ErrorCode::INVALID_ARGUMENT, {}};
    }

    std::vector<NodeInfo> healthy = theTracker->healthyNodes();
    if (healthy.size() < replication_factor) {
        std::cerr << "[ERROR] Not enough healthy nodes. Need " << replication_factor
                  << ", have " << healthy.size() << "\n";
        return {ErrorCode::INSUFFICIENT_HEALTHY_NODES, {}};
    }

    std::vector<NodeInfo> selected;
    selected.reserve(replication_factor);
    {
        std::lock_guard<std::mutex> lock(rng_mutex);
        std::sample(healthy.begin(), healthy.end(), std::back_inserter(selected),
                    replication_factor, rng);
        // std::sample keeps the input order; shuffle so the first target varies too
        std::shuffle(selected.begin(), selected.end(), rng);
    }

    return {ErrorCode::OK, selected};
}
