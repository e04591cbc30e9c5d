#pragma once

#include <string>
#include <vector>
#include <chrono>
#include "types.hpp"
#include "error_code.hpp"
#include "node_transport.hpp"

// Result of one per-node call inside a fan-out.
struct ReplicaOutcome {
    std::string node_id;
    ErrorCode result = ErrorCode::OK;
};

enum class ReplicationStatus {
    FULL,     // every requested replica stored
    PARTIAL,  // at least one, but fewer than requested
    FAILED    // no node accepted the chunk
};

struct ReplicationSummary {
    ReplicationStatus status = ReplicationStatus::FAILED;
    size_t requested = 0;
    std::vector<std::string> stored_on;  // node ids in outcome order
};

const char* replicationStatusName(ReplicationStatus status);

// Aggregate decision over a fan-out. Only nodes reporting OK count, each once.
ReplicationSummary summarizeReplication(const std::vector<ReplicaOutcome>& outcomes,
                                        size_t replication_factor);

// Stores the chunk on every target in parallel. One failing node never stops the
// others; the returned outcomes follow the order of `targets`.
std::vector<ReplicaOutcome> storeOnAll(NodeTransport* transport,
                                       const std::vector<NodeInfo>& targets,
                                       const Chunk& chunk,
                                       std::chrono::milliseconds timeout = DEFAULT_TRANSFER_TIMEOUT);

// Tries the candidates in order and stops at the first node that returns the
// chunk. `verify` may reject a payload, which counts as a failure of that node.
// Returns NO_HEALTHY_REPLICA for an empty candidate list and the last node
// error when every candidate failed.
ErrorCode fetchFirstAvailable(NodeTransport* transport,
                              const std::string& chunk_id,
                              const std::vector<NodeInfo>& candidates,
                              Chunk& out,
                              std::string* served_by = nullptr,
                              bool (*verify)(const std::string& chunk_id, const Chunk& chunk) = nullptr,
                              std::chrono::milliseconds timeout = DEFAULT_TRANSFER_TIMEOUT);
