#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <chrono>
#include <unordered_map>
#include <grpcpp/grpcpp.h>
#include "dfs.grpc.pb.h"
#include "types.hpp"
#include "error_code.hpp"

constexpr std::chrono::milliseconds DEFAULT_PROBE_TIMEOUT{5000};
constexpr std::chrono::milliseconds DEFAULT_TRANSFER_TIMEOUT{30000};
constexpr std::chrono::milliseconds DEFAULT_DELETE_TIMEOUT{5000};

// Node-scoped calls to a DataNode. Every call carries its own deadline and
// reports failure as an ErrorCode; nothing here throws.
class NodeTransport {
public:
    virtual ~NodeTransport() = default;

    virtual ErrorCode healthCheck(const NodeInfo& node, std::chrono::milliseconds timeout) = 0;

    virtual ErrorCode storeChunk(const NodeInfo& node, const Chunk& chunk,
                                 std::chrono::milliseconds timeout) = 0;

    // On success `out` holds the payload and the descriptor stored by the node.
    virtual ErrorCode fetchChunk(const NodeInfo& node, const std::string& chunk_id,
                                 Chunk& out, std::chrono::milliseconds timeout) = 0;

    virtual ErrorCode deleteChunk(const NodeInfo& node, const std::string& chunk_id,
                                  std::chrono::milliseconds timeout) = 0;
};

class GrpcNodeTransport : public NodeTransport {
private:
    std::mutex channels_mutex;
    std::unordered_map<std::string, std::shared_ptr<grpc::Channel>> channels;  // address -> channel

    std::unique_ptr<DataNodeService::Stub> stubFor(const std::string& address);

public:
    ErrorCode healthCheck(const NodeInfo& node, std::chrono::milliseconds timeout) override;
    ErrorCode storeChunk(const NodeInfo& node, const Chunk& chunk,
                         std::chrono::milliseconds timeout) override;
    ErrorCode fetchChunk(const NodeInfo& node, const std::string& chunk_id,
                         Chunk& out, std::chrono::milliseconds timeout) override;
    ErrorCode deleteChunk(const NodeInfo& node, const std::string& chunk_id,
                          std::chrono::milliseconds timeout) override;
};
