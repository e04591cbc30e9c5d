#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <utility>
#include "dfs.pb.h"
#include "types.hpp"
#include "error_code.hpp"
#include "cache.hpp"

// Conversions between the registry's descriptors and the persisted/wire record.
FileRecord toFileRecord(const FileDescriptor& descriptor);
FileDescriptor fromFileRecord(const FileRecord& record);

// Authoritative file -> chunk placement map.
//
// Each file is one JSON record (<metadata_dir>/<file_id>.json) holding its
// descriptor and full chunk map. Recently used records stay in an LRU cache.
// All read-modify-write cycles run under one mutex.
class Registry {
private:
    std::string metadata_dir;
    std::mutex registry_mutex;
    FileCache theCache;

    std::string recordPath(const std::string& file_id) const;

    // Both expect registry_mutex to be held
    ErrorCode loadRecord(const std::string& file_id, FileDescriptor& out);
    bool saveRecord(const FileDescriptor& descriptor);

public:
    explicit Registry(const std::string& metadata_dir, size_t cache_capacity = 1000);

    // Requires file_id, filename and total_chunks > 0. Replaces an existing
    // record with the same id.
    ErrorCode registerFile(const FileDescriptor& descriptor);

    ErrorCode registerChunk(const std::string& file_id,
                            int32_t index,
                            const std::string& chunk_id,
                            int64_t size,
                            const std::vector<std::string>& nodes);

    std::pair<ErrorCode, FileDescriptor> getFile(const std::string& file_id);

    // Full scan of the record directory
    std::vector<FileDescriptor> listFiles();

    std::pair<ErrorCode, ChunkDescriptor> resolveChunk(const std::string& file_id, int32_t index);

    ErrorCode deleteFile(const std::string& file_id);

    static bool isValidFileId(const std::string& file_id);
};
