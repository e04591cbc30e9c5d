#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <chrono>
#include "dfs.grpc.pb.h"
#include "types.hpp"
#include "error_code.hpp"
#include "replication.hpp"
#include "chunker.hpp"
#include "node_transport.hpp"

constexpr std::chrono::milliseconds DEFAULT_METASERVER_TIMEOUT{10000};

struct ChunkUploadResult {
    int32_t index = 0;
    std::string chunk_id;
    int64_t size = 0;
    ErrorCode result = ErrorCode::OK;
    ReplicationSummary replication;
};

struct UploadReport {
    ErrorCode result = ErrorCode::OK;
    std::string message;
    std::string file_id;
    std::string filename;
    int64_t size = 0;
    int32_t total_chunks = 0;
    std::vector<ChunkUploadResult> chunks;
};

struct DownloadReport {
    ErrorCode result = ErrorCode::OK;
    std::string message;
    std::string file_id;
    std::string output_path;
    int64_t size = 0;
    std::optional<int32_t> failed_index;  // chunk that could not be read
};

struct FileListing {
    std::string file_id;
    std::string filename;
    int64_t size = 0;
    int32_t total_chunks = 0;
    std::string content_type;
    int64_t created_at = 0;  // ms since epoch
};

struct NodeListing {
    std::string node_id;
    std::string address;
    bool healthy = false;
};

struct DeleteSummary {
    int32_t chunks_removed = 0;
    int32_t replicas_deleted = 0;
    int32_t replicas_orphaned = 0;
};

class DfsClient {
private:
    MetaService::Stub theStub;
    NodeTransport* theTransport;
    size_t theChunkSize;
    int32_t theReplication;  // 0 = MetaServer default
    std::chrono::milliseconds theTimeout;

    void setDeadline(grpc::ClientContext& context) const;

public:
    DfsClient(std::shared_ptr<grpc::ChannelInterface> aChannel,
              NodeTransport* aTransport,
              size_t aChunkSize = DEFAULT_CHUNK_SIZE,
              int32_t aReplication = 0,
              std::chrono::milliseconds aTimeout = DEFAULT_METASERVER_TIMEOUT);

    bool IsMetaServerAvailable();

    // Splits the file, registers it and pushes every chunk to the nodes the
    // MetaServer picks. Stops at the first chunk no node accepted.
    UploadReport UploadFile(const std::string& path);

    // An empty output path writes <filename> into the working directory.
    DownloadReport DownloadFile(const std::string& file_id, const std::string& output_path = "");

    std::pair<ErrorCode, std::vector<FileListing>> ListFiles();

    std::pair<ErrorCode, std::vector<NodeListing>> GetNodeStatus();

    std::pair<ErrorCode, FileRecord> GetFileInfo(const std::string& file_id);

    std::pair<ErrorCode, DeleteSummary> DeleteFile(const std::string& file_id);

    static std::string GuessContentType(const std::string& path);
};
