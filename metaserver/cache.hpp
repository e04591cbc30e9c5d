#pragma once

#include <unordered_map>
#include <list>
#include <string>
#include <mutex>
#include <optional>
#include <cstdint>
#include "types.hpp"

// Recently used file records, keyed by file id. The registry consults it
// before reading a record file and keeps it in step with every write.
// Holds at most `capacity` records (minimum one) and drops the least
// recently used record first.
class FileCache {
private:
    struct Entry {
        FileDescriptor record;
        std::list<std::string>::iterator recency;
    };

    size_t capacity;
    mutable std::mutex cache_mutex;

    std::list<std::string> recency_order;  // most recent first
    std::unordered_map<std::string, Entry> entries;

    uint64_t hits = 0;
    uint64_t misses = 0;

public:
    explicit FileCache(size_t capacity = 1000);

    void store(const FileDescriptor& record);
    std::optional<FileDescriptor> lookup(const std::string& file_id);
    void invalidate(const std::string& file_id);

    size_t size() const;
    uint64_t hitCount() const;
    uint64_t missCount() const;
};
