#pragma once

#include <string>
#include <vector>
#include <map>
#include <unordered_map>
#include <chrono>
#include <cstdint>

struct NodeInfo {
    std::string node_id;
    std::string address;  // host:port of the node's gRPC endpoint
};

inline bool operator==(const NodeInfo& a, const NodeInfo& b) {
    return a.node_id == b.node_id && a.address == b.address;
}

// node_id -> healthy, copied under the tracker's lock
using HealthSnapshot = std::unordered_map<std::string, bool>;

// One chunk of a file, as produced by the chunker or fetched from a node.
struct Chunk {
    std::string chunk_id;
    std::string file_id;
    int32_t index = 0;
    std::vector<char> data;
};

struct ChunkedFile {
    std::string file_id;
    std::string filename;
    int64_t size = 0;
    int32_t total_chunks = 0;
    std::vector<Chunk> chunks;  // ordered by index
};

struct ChunkDescriptor {
    std::string chunk_id;
    std::string file_id;
    int32_t index = 0;
    int64_t size = 0;
    std::vector<std::string> nodes;  // node ids holding a replica
};

struct FileDescriptor {
    std::string file_id;
    std::string filename;
    int64_t size = 0;
    std::string content_type = "application/octet-stream";
    int32_t total_chunks = 0;
    std::chrono::system_clock::time_point created_at;
    std::chrono::system_clock::time_point updated_at;
    std::map<int32_t, ChunkDescriptor> chunks;  // index -> chunk
};

inline int64_t toEpochMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point fromEpochMillis(int64_t ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

// Current time at the millisecond precision records are persisted with.
inline std::chrono::system_clock::time_point currentTimeMillis() {
    return fromEpochMillis(toEpochMillis(std::chrono::system_clock::now()));
}
