#include "replication.hpp"
#include <iostream>
#include <future>
#include <algorithm>

const char* replicationStatusName(ReplicationStatus status) {
    switch (status) {
        case ReplicationStatus::FULL: return "FULL";
        case ReplicationStatus::PARTIAL: return "PARTIAL";
        case ReplicationStatus::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

ReplicationSummary summarizeReplication(const std::vector<ReplicaOutcome>& outcomes,
                                        size_t replication_factor) {
    ReplicationSummary summary;
    summary.requested = replication_factor;

    for (const auto& outcome : outcomes) {
        if (outcome.result != ErrorCode::OK) {
            continue;
        }
        if (std::find(summary.stored_on.begin(), summary.stored_on.end(), outcome.node_id)
                == summary.stored_on.end()) {
            summary.stored_on.push_back(outcome.node_id);
        }
    }

    if (summary.stored_on.empty()) {
        summary.status = ReplicationStatus::FAILED;
    } else if (summary.stored_on.size() < replication_factor) {
        summary.status = ReplicationStatus::PARTIAL;
    } else {
        summary.status = ReplicationStatus::FULL;
    }
    return summary;
}

std::vector<ReplicaOutcome> storeOnAll(NodeTransport* transport,
                                       const std::vector<NodeInfo>& targets,
                                       const Chunk& chunk,
                                       std::chrono::milliseconds timeout) {
    std::vector<std::future<ErrorCode>> pending;
    pending.reserve(targets.size());

    for (const auto& node : targets) {
        pending.push_back(std::async(std::launch::async, [transport, node, &chunk, timeout]() {
            return transport->storeChunk(node, chunk, timeout);
        }));
    }

    std::vector<ReplicaOutcome> outcomes;
    outcomes.reserve(targets.size());
    for (size_t i = 0; i < targets.size(); ++i) {
        ReplicaOutcome outcome;
        outcome.node_id = targets[i].node_id;
        outcome.result = pending[i].get();

        if (outcome.result == ErrorCode::OK) {
            std::cout << "[INFO] Chunk " << chunk.chunk_id << " (index " << chunk.index
                      << ") stored on " << outcome.node_id << "\n";
        } else {
            std::cerr << "[WARNING] Chunk " << chunk.chunk_id << " (index " << chunk.index
                      << ") not stored on " << outcome.node_id << ": "
                      << errorCodeName(outcome.result) << "\n";
        }
        outcomes.push_back(outcome);
    }
    return outcomes;
}

ErrorCode fetchFirstAvailable(NodeTransport* transport,
                              const std::string& chunk_id,
                              const std::vector<NodeInfo>& candidates,
                              Chunk& out,
                              std::string* served_by,
                              bool (*verify)(const std::string& chunk_id, const Chunk& chunk),
                              std::chrono::milliseconds timeout) {
    if (candidates.empty()) {
        return ErrorCode::NO_HEALTHY_REPLICA;
    }

    ErrorCode last_error = ErrorCode::TRANSPORT_FAILURE;
    for (const auto& node : candidates) {
        Chunk fetched;
        ErrorCode code = transport->fetchChunk(node, chunk_id, fetched, timeout);
        if (code != ErrorCode::OK) {
            last_error = code;
            continue;
        }

        if (verify != nullptr && !verify(chunk_id, fetched)) {
            std::cerr << "[WARNING] Chunk " << chunk_id << " from " << node.node_id
                      << " does not match its identifier, trying next replica\n";
            last_error = ErrorCode::STORAGE_ERROR;
            continue;
        }

        out = std::move(fetched);
        if (served_by != nullptr) {
            *served_by = node.node_id;
        }
        return ErrorCode::OK;
    }

    std::cerr << "[ERROR] Could not retrieve chunk " << chunk_id << " from any of "
              << candidates.size() << " replicas\n";
    return last_error;
}
