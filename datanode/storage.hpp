#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <mutex>
#include <filesystem>
#include <atomic>
#include <functional>
#include <utility>
#include "dfs.pb.h"
#include "error_code.hpp"

struct StoredChunk {
    std::vector<char> data;
    ChunkMetadata metadata;
};

// Content-addressed chunk storage local to one DataNode.
//
// Layout: <storage_path>/<file_id>/<chunk_id>.chunk holds the payload and
// <chunk_id>.meta the serialized ChunkMetadata. Both are written to a
// temporary file first and renamed into place.
class DataNodeStorage {
private:
    std::string storage_path;
    std::atomic<int64_t> total_capacity;
    std::atomic<int64_t> used_space;

    // chunk_id -> descriptor, rebuilt from the .meta files at startup
    mutable std::mutex metadata_mutex;
    std::unordered_map<std::string, ChunkMetadata> chunk_metadata;

    // Helper methods
    std::string getChunkPath(const std::string& file_id, const std::string& chunk_id) const;
    std::string getMetaPath(const std::string& file_id, const std::string& chunk_id) const;
    std::string calculateChecksum(const std::vector<char>& data) const;
    bool writeAtomically(const std::string& path, const char* data, size_t size) const;
    ErrorCode writeChunkFiles(const std::string& chunk_id, const std::string& file_id,
                              int32_t index, const std::vector<char>& data);
    void ensureStorageDirectory();
    void loadExistingChunks();

public:
    explicit DataNodeStorage(const std::string& storage_path, int64_t capacity_bytes = 10L * 1024 * 1024 * 1024); // Default 10GB
    ~DataNodeStorage();

    // Chunk operations
    ErrorCode putChunk(const std::string& chunk_id, const std::string& file_id,
                       int32_t index, const std::vector<char>& data);
    std::pair<ErrorCode, StoredChunk> getChunk(const std::string& chunk_id);
    ErrorCode deleteChunk(const std::string& chunk_id);
    bool hasChunk(const std::string& chunk_id) const;

    // Walks the descriptors on disk one at a time. The visitor returns false to stop.
    void listChunks(const std::function<bool(const ChunkMetadata&)>& visitor) const;

    // Status and metrics
    size_t getChunkCount() const;
    int64_t getAvailableSpace() const;
    int64_t getUsedSpace() const;
    const std::string& getStoragePath() const { return storage_path; }

    // Maintenance
    bool performHealthCheck();

    static bool isValidId(const std::string& id);
};
