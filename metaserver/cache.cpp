#include "cache.hpp"
#include <algorithm>

FileCache::FileCache(size_t capacity) : capacity(std::max<size_t>(capacity, 1)) {}

void FileCache::store(const FileDescriptor& record) {
    std::lock_guard<std::mutex> lock(cache_mutex);

    auto found = entries.find(record.file_id);
    if (found != entries.end()) {
        found->second.record = record;
        recency_order.splice(recency_order.begin(), recency_order, found->second.recency);
        return;
    }

    while (entries.size() >= capacity) {
        entries.erase(recency_order.back());
        recency_order.pop_back();
    }

    recency_order.push_front(record.file_id);
    entries.emplace(record.file_id, Entry{record, recency_order.begin()});
}

std::optional<FileDescriptor> FileCache::lookup(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(cache_mutex);

    auto found = entries.find(file_id);
    if (found == entries.end()) {
        ++misses;
        return std::nullopt;
    }

    ++hits;
    recency_order.splice(recency_order.begin(), recency_order, found->second.recency);
    return found->second.record;
}

void FileCache::invalidate(const std::string& file_id) {
    std::lock_guard<std::mutex> lock(cache_mutex);

    auto found = entries.find(file_id);
    if (found != entries.end()) {
        recency_order.erase(found->second.recency);
        entries.erase(found);
    }
}

size_t FileCache::size() const {
    std::lock_guard<std::mutex> lock(cache_mutex);
    return entries.size();
}

uint64_t FileCache::hitCount() const {
    std::lock_guard<std::mutex> lock(cache_mutex);
    return hits;
}

uint64_t FileCache::missCount() const {
    std::lock_guard<std::mutex> lock(cache_mutex);
    return misses;
}
