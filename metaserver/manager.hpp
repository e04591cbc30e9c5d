#pragma once

#include "registry.hpp"
#include "health_tracker.hpp"
#include "placement.hpp"
#include "node_transport.hpp"
#include <vector>
#include <string>
#include <utility>
#include <chrono>

struct NodeStatus {
    NodeInfo node;
    bool healthy;
};

// A chunk resolved for reading: its registry entry plus the recorded nodes
// that are healthy right now, in recorded order.
struct ChunkLocation {
    ChunkDescriptor chunk;
    std::vector<NodeInfo> healthy_nodes;
};

struct DeleteReport {
    size_t chunks_removed = 0;
    size_t replicas_deleted = 0;
    size_t replicas_orphaned = 0;  // replicas left behind on unhealthy or failing nodes
};

class Manager {
private:
    Registry* theRegistry;
    HealthTracker* theTracker;
    PlacementCoordinator* thePlacement;
    NodeTransport* theTransport;

    size_t default_replication_factor;
    std::chrono::milliseconds delete_timeout;

    const NodeInfo* findNode(const std::string& node_id) const;

public:
    Manager(Registry* aRegistry,
            HealthTracker* aTracker,
            PlacementCoordinator* aPlacement,
            NodeTransport* aTransport,
            size_t default_replication_factor = 2,
            std::chrono::milliseconds delete_timeout = DEFAULT_DELETE_TIMEOUT);

    // replication_factor 0 selects the configured default
    std::pair<ErrorCode, std::vector<NodeInfo>> allocateUploadTargets(size_t replication_factor);

    ErrorCode registerFile(const FileDescriptor& descriptor);

    // Only configured node ids are accepted; the node list must not be empty.
    ErrorCode registerChunk(const std::string& file_id,
                            int32_t index,
                            const std::string& chunk_id,
                            int64_t size,
                            const std::vector<std::string>& nodes);

    std::pair<ErrorCode, FileDescriptor> getFile(const std::string& file_id);
    std::vector<FileDescriptor> listFiles();

    // NO_HEALTHY_REPLICA when none of the recorded nodes is currently healthy
    std::pair<ErrorCode, ChunkLocation> locateChunk(const std::string& file_id, int32_t index);

    // Removes the registry record, then asks every healthy replica holder to
    // drop its copy. Node failures only show up in the report.
    std::pair<ErrorCode, DeleteReport> deleteFile(const std::string& file_id);

    std::vector<NodeStatus> nodeStatus() const;

    size_t defaultReplicationFactor() const { return default_replication_factor; }
};
