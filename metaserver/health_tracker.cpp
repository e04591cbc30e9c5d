#include "health_tracker.hpp"
#include <iostream>
#include <future>
#include <exception>

HealthTracker::HealthTracker(std::vector<NodeInfo> nodes,
                             NodeTransport* transport,
                             std::chrono::milliseconds check_interval,
                             std::chrono::milliseconds probe_timeout)
    : nodes(std::move(nodes)), theTransport(transport),
      check_interval(check_interval), probe_timeout(probe_timeout) {

    // Nothing is routable until a probe has vouched for it
    for (const auto& node : this->nodes) {
        node_status[node.node_id] = false;
    }
}

HealthTracker::~HealthTracker() {
    stopMonitoring();
    if (monitor_thread.joinable()) {
        monitor_thread.join();
    }
}

bool HealthTracker::startMonitoring() {
    std::lock_guard<std::mutex> lock(control_mutex);

    if (monitor_thread.joinable()) {
        if (!loop_finished) {
            return false;  // already running
        }
        // A previous loop timed out on stop but has exited since
        monitor_thread.join();
    }

    stop_requested = false;
    loop_finished = false;
    monitor_thread = std::thread(&HealthTracker::monitorLoop, this);

    std::cout << "[INFO] Health monitoring started for " << nodes.size()
              << " nodes (interval " << check_interval.count() << " ms)\n";
    return true;
}

bool HealthTracker::stopMonitoring(std::chrono::milliseconds timeout) {
    std::thread finished;
    bool stopped_here = false;
    {
        std::unique_lock<std::mutex> lock(control_mutex);
        if (monitor_thread.joinable() && !loop_finished) {
            stop_requested = true;
            control_cv.notify_all();

            if (!control_cv.wait_for(lock, timeout, [this] { return loop_finished; })) {
                std::cerr << "[WARNING] Health monitor did not stop within "
                          << timeout.count() << " ms\n";
                return false;
            }
            stopped_here = true;
        }

        // Whoever takes the thread out under the lock is the only one to join it
        finished = std::move(monitor_thread);
    }

    if (finished.joinable()) {
        finished.join();
    }
    if (stopped_here) {
        std::cout << "[INFO] Health monitoring stopped\n";
    }
    return stopped_here;
}

bool HealthTracker::isMonitoring() {
    std::lock_guard<std::mutex> lock(control_mutex);
    return monitor_thread.joinable() && !loop_finished;
}

void HealthTracker::monitorLoop() {
    std::unique_lock<std::mutex> lock(control_mutex);

    while (!stop_requested) {
        lock.unlock();
        runProbeCycle();
        lock.lock();

        control_cv.wait_for(lock, check_interval, [this] { return stop_requested; });
    }

    loop_finished = true;
    control_cv.notify_all();
}

bool HealthTracker::probeNode(const NodeInfo& node) {
    try {
        return theTransport->healthCheck(node, probe_timeout) == ErrorCode::OK;
    } catch (const std::exception& e) {
        std::cerr << "[WARNING] Probe of " << node.node_id << " failed: " << e.what() << "\n";
        return false;
    }
}

void HealthTracker::runProbeCycle() {
    std::vector<std::future<bool>> probes;
    probes.reserve(nodes.size());

    for (const auto& node : nodes) {
        probes.push_back(std::async(std::launch::async, [this, &node]() {
            return probeNode(node);
        }));
    }

    std::vector<bool> results;
    results.reserve(nodes.size());
    for (auto& probe : probes) {
        results.push_back(probe.get());
    }

    {
        std::lock_guard<std::mutex> lock(status_mutex);
        for (size_t i = 0; i < nodes.size(); ++i) {
            bool& healthy = node_status[nodes[i].node_id];
            if (healthy != results[i]) {
                std::cout << "[HEALTH] Node " << nodes[i].node_id << " (" << nodes[i].address
                          << ") is now " << (results[i] ? "healthy" : "unhealthy") << "\n";
            }
            healthy = results[i];
        }
    }

    cycles_completed++;
}

bool HealthTracker::isHealthy(const std::string& node_id) const {
    std::lock_guard<std::mutex> lock(status_mutex);
    auto it = node_status.find(node_id);
    return it != node_status.end() && it->second;
}

std::vector<NodeInfo> HealthTracker::healthyNodes() const {
    std::lock_guard<std::mutex> lock(status_mutex);
    std::vector<NodeInfo> healthy;

    for (const auto& node : nodes) {
        auto it = node_status.find(node.node_id);
        if (it != node_status.end() && it->second) {
            healthy.push_back(node);
        }
    }
    return healthy;
}

HealthSnapshot HealthTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(status_mutex);
    return node_status;
}
