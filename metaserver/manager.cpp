#include "manager.hpp"
#include <iostream>
#include <algorithm>

Manager::Manager(Registry* aRegistry,
                 HealthTracker* aTracker,
                 PlacementCoordinator* aPlacement,
                 NodeTransport* aTransport,
                 size_t default_replication_factor,
                 std::chrono::milliseconds delete_timeout)
    : theRegistry(aRegistry), theTracker(aTracker), thePlacement(aPlacement),
      theTransport(aTransport), default_replication_factor(default_replication_factor),
      delete_timeout(delete_timeout) {
}

const NodeInfo* Manager::findNode(const std::string& node_id) const {
    const auto& nodes = theTracker->configuredNodes();
    auto it = std::find_if(nodes.begin(), nodes.end(),
                           [&node_id](const NodeInfo& node) { return node.node_id == node_id; });
    return it == nodes.end() ? nullptr : &*it;
}

std::pair<ErrorCode, std::vector<NodeInfo>> Manager::allocateUploadTargets(size_t replication_factor) {
    size_t wanted = replication_factor == 0 ? default_replication_factor : replication_factor;
    return thePlacement->selectTargets(wanted);
}

ErrorCode Manager::registerFile(const FileDescriptor& descriptor) {
    return theRegistry->registerFile(descriptor);
}

ErrorCode Manager::registerChunk(const std::string& file_id,
                                 int32_t index,
                                 const std::string& chunk_id,
                                 int64_t size,
                                 const std::vector<std::string>& nodes) {
    for (const auto& node_id : nodes) {
        if (findNode(node_id) == nullptr) {
            std::cerr << "[ERROR] Chunk " << chunk_id << " names unknown node " << node_id << "\n";
            return ErrorCode::INVALID_DESCRIPTOR;
        }
    }

    ErrorCode code = theRegistry->registerChunk(file_id, index, chunk_id, size, nodes);
    if (code == ErrorCode::OK && nodes.size() < default_replication_factor) {
        std::cerr << "[WARNING] Chunk " << chunk_id << " (index " << index << ") of file "
                  << file_id << " is under-replicated: " << nodes.size() << "/"
                  << default_replication_factor << " replicas\n";
    }
    return code;
}

std::pair<ErrorCode, FileDescriptor> Manager::getFile(const std::string& file_id) {
    return theRegistry->getFile(file_id);
}

std::vector<FileDescriptor> Manager::listFiles() {
    return theRegistry->listFiles();
}

std::pair<ErrorCode, ChunkLocation> Manager::locateChunk(const std::string& file_id, int32_t index) {
    auto [code, chunk] = theRegistry->resolveChunk(file_id, index);
    if (code != ErrorCode::OK) {
        return {code, {}};
    }

    ChunkLocation location;
    location.chunk = chunk;
    for (const auto& node_id : chunk.nodes) {
        const NodeInfo* node = findNode(node_id);
        if (node != nullptr && theTracker->isHealthy(node_id)) {
            location.healthy_nodes.push_back(*node);
        }
    }

    if (location.healthy_nodes.empty()) {
        std::cerr << "[WARNING] No healthy nodes hold chunk " << index << " of file "
                  << file_id << "\n";
        return {ErrorCode::NO_HEALTHY_REPLICA, location};
    }
    return {ErrorCode::OK, location};
}

std::pair<ErrorCode, DeleteReport> Manager::deleteFile(const std::string& file_id) {
    auto [code, record] = theRegistry->getFile(file_id);
    if (code != ErrorCode::OK) {
        return {code, {}};
    }

    // The registry delete is authoritative; a repeated delete stops here
    code = theRegistry->deleteFile(file_id);
    if (code != ErrorCode::OK) {
        return {code, {}};
    }

    DeleteReport report;
    report.chunks_removed = record.chunks.size();

    for (const auto& [index, chunk] : record.chunks) {
        for (const auto& node_id : chunk.nodes) {
            const NodeInfo* node = findNode(node_id);
            if (node == nullptr || !theTracker->isHealthy(node_id)) {
                std::cerr << "[WARNING] Node " << node_id << " is unavailable, chunk "
                          << chunk.chunk_id << " left orphaned\n";
                report.replicas_orphaned++;
                continue;
            }

            ErrorCode result = theTransport->deleteChunk(*node, chunk.chunk_id, delete_timeout);
            if (result == ErrorCode::OK || result == ErrorCode::CHUNK_NOT_FOUND) {
                report.replicas_deleted++;
            } else {
                std::cerr << "[WARNING] Failed to delete chunk " << chunk.chunk_id << " from "
                          << node_id << " (" << errorCodeName(result) << "), left orphaned\n";
                report.replicas_orphaned++;
            }
        }
    }

    std::cout << "[INFO] Deleted file " << file_id << ": " << report.chunks_removed
              << " chunks, " << report.replicas_deleted << " replicas removed, "
              << report.replicas_orphaned << " orphaned\n";
    return {ErrorCode::OK, report};
}

std::vector<NodeStatus> Manager::nodeStatus() const {
    HealthSnapshot snapshot = theTracker->snapshot();
    std::vector<NodeStatus> status;

    for (const auto& node : theTracker->configuredNodes()) {
        auto it = snapshot.find(node.node_id);
        status.push_back({node, it != snapshot.end() && it->second});
    }
    return status;
}
