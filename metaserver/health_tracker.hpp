#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <chrono>
#include "types.hpp"
#include "node_transport.hpp"

constexpr std::chrono::milliseconds DEFAULT_CHECK_INTERVAL{30000};

// Last-known liveness of every configured DataNode.
//
// A single background thread owns all writes: every check_interval it probes
// all nodes in parallel and applies the results in one critical section.
// Readers only ever receive copies taken under the same lock, so a "healthy"
// answer means "answered a probe within the last interval", nothing more.
class HealthTracker {
private:
    const std::vector<NodeInfo> nodes;
    NodeTransport* theTransport;
    const std::chrono::milliseconds check_interval;
    const std::chrono::milliseconds probe_timeout;

    mutable std::mutex status_mutex;
    std::unordered_map<std::string, bool> node_status;  // node_id -> healthy

    // Monitor loop control
    std::mutex control_mutex;
    std::condition_variable control_cv;
    std::thread monitor_thread;
    bool stop_requested = false;
    bool loop_finished = true;

    std::atomic<uint64_t> cycles_completed{0};

    void monitorLoop();
    bool probeNode(const NodeInfo& node);

public:
    HealthTracker(std::vector<NodeInfo> nodes,
                  NodeTransport* transport,
                  std::chrono::milliseconds check_interval = DEFAULT_CHECK_INTERVAL,
                  std::chrono::milliseconds probe_timeout = DEFAULT_PROBE_TIMEOUT);
    ~HealthTracker();

    HealthTracker(const HealthTracker&) = delete;
    HealthTracker& operator=(const HealthTracker&) = delete;

    // Returns false if the monitor is already running.
    bool startMonitoring();

    // Returns false if the monitor was not running or did not finish its
    // current cycle within `timeout`.
    bool stopMonitoring(std::chrono::milliseconds timeout = std::chrono::seconds(10));

    bool isMonitoring();

    // Probes every node once, in parallel, and publishes the results.
    void runProbeCycle();

    bool isHealthy(const std::string& node_id) const;
    std::vector<NodeInfo> healthyNodes() const;
    HealthSnapshot snapshot() const;

    const std::vector<NodeInfo>& configuredNodes() const { return nodes; }
    uint64_t cycleCount() const { return cycles_completed.load(); }
};
