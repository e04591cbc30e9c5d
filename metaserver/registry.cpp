#include "registry.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <algorithm>
#include <filesystem>
#include <google/protobuf/util/json_util.h>

namespace fs = std::filesystem;

FileRecord toFileRecord(const FileDescriptor& descriptor) {
    FileRecord record;
    record.set_file_id(descriptor.file_id);
    record.set_filename(descriptor.filename);
    record.set_size(descriptor.size);
    record.set_content_type(descriptor.content_type);
    record.set_total_chunks(descriptor.total_chunks);
    record.set_created_at(toEpochMillis(descriptor.created_at));
    record.set_updated_at(toEpochMillis(descriptor.updated_at));

    auto& chunks = *record.mutable_chunks();
    for (const auto& [index, chunk] : descriptor.chunks) {
        ChunkRecord& entry = chunks[index];
        entry.set_chunk_id(chunk.chunk_id);
        entry.set_index(chunk.index);
        entry.set_size(chunk.size);
        for (const auto& node : chunk.nodes) {
            entry.add_nodes(node);
        }
    }
    return record;
}

FileDescriptor fromFileRecord(const FileRecord& record) {
    FileDescriptor descriptor;
    descriptor.file_id = record.file_id();
    descriptor.filename = record.filename();
    descriptor.size = record.size();
    descriptor.content_type = record.content_type();
    descriptor.total_chunks = record.total_chunks();
    descriptor.created_at = fromEpochMillis(record.created_at());
    descriptor.updated_at = fromEpochMillis(record.updated_at());

    for (const auto& [index, entry] : record.chunks()) {
        ChunkDescriptor chunk;
        chunk.chunk_id = entry.chunk_id();
        chunk.file_id = record.file_id();
        chunk.index = index;
        chunk.size = entry.size();
        chunk.nodes.assign(entry.nodes().begin(), entry.nodes().end());
        descriptor.chunks[index] = chunk;
    }
    return descriptor;
}

Registry::Registry(const std::string& metadata_dir, size_t cache_capacity)
    : metadata_dir(metadata_dir), theCache(cache_capacity) {
    fs::create_directories(metadata_dir);
    std::cout << "[INFO] Registry using metadata directory " << metadata_dir << "\n";
}

bool Registry::isValidFileId(const std::string& file_id) {
    if (file_id.empty() || file_id == "." || file_id == "..") {
        return false;
    }
    return file_id.find('/') == std::string::npos && file_id.find('\0') == std::string::npos;
}

std::string Registry::recordPath(const std::string& file_id) const {
    return (fs::path(metadata_dir) / (file_id + ".json")).string();
}

ErrorCode Registry::loadRecord(const std::string& file_id, FileDescriptor& out) {
    auto cached = theCache.lookup(file_id);
    if (cached.has_value()) {
        out = std::move(*cached);
        return ErrorCode::OK;
    }

    std::ifstream file(recordPath(file_id));
    if (!file.is_open()) {
        return ErrorCode::FILE_NOT_FOUND;
    }

    std::stringstream ss;
    ss << file.rdbuf();

    FileRecord record;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    auto status = google::protobuf::util::JsonStringToMessage(ss.str(), &record, options);
    if (!status.ok()) {
        std::cerr << "[ERROR] Corrupt file record " << recordPath(file_id) << ": "
                  << status.ToString() << "\n";
        return ErrorCode::STORAGE_ERROR;
    }

    out = fromFileRecord(record);
    theCache.store(out);
    return ErrorCode::OK;
}

bool Registry::saveRecord(const FileDescriptor& descriptor) {
    std::string json;
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    options.preserve_proto_field_names = true;
    auto status = google::protobuf::util::MessageToJsonString(toFileRecord(descriptor), &json, options);
    if (!status.ok()) {
        std::cerr << "[ERROR] Cannot serialize record for file " << descriptor.file_id
                  << ": " << status.ToString() << "\n";
        return false;
    }

    std::string path = recordPath(descriptor.file_id);
    std::string temp_path = path + ".tmp";
    {
        std::ofstream file(temp_path, std::ios::trunc);
        if (!file.is_open()) {
            std::cerr << "[ERROR] Failed to open file for writing: " << temp_path << "\n";
            return false;
        }
        file << json;
        file.flush();
        if (!file.good()) {
            std::cerr << "[ERROR] Failed to write record " << temp_path << "\n";
            return false;
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        std::cerr << "[ERROR] Failed to move record into place " << path << ": "
                  << ec.message() << "\n";
        fs::remove(temp_path, ec);
        return false;
    }

    theCache.store(descriptor);
    return true;
}

ErrorCode Registry::registerFile(const FileDescriptor& descriptor) {
    if (!isValidFileId(descriptor.file_id) || descriptor.filename.empty()
            || descriptor.total_chunks <= 0) {
        std::cerr << "[ERROR] Rejecting file registration with missing fields (file_id='"
                  << descriptor.file_id << "', filename='" << descriptor.filename
                  << "', total_chunks=" << descriptor.total_chunks << ")\n";
        return ErrorCode::INVALID_DESCRIPTOR;
    }

    FileDescriptor record = descriptor;
    record.chunks.clear();
    record.created_at = currentTimeMillis();
    record.updated_at = record.created_at;
    if (record.content_type.empty()) {
        record.content_type = "application/octet-stream";
    }

    std::lock_guard<std::mutex> lock(registry_mutex);
    if (!saveRecord(record)) {
        return ErrorCode::STORAGE_ERROR;
    }

    std::cout << "[INFO] Registered file " << record.filename << " (" << record.file_id
              << ", " << record.total_chunks << " chunks, " << record.size << " bytes)\n";
    return ErrorCode::OK;
}

ErrorCode Registry::registerChunk(const std::string& file_id,
                                  int32_t index,
                                  const std::string& chunk_id,
                                  int64_t size,
                                  const std::vector<std::string>& nodes) {
    if (!isValidFileId(file_id)) {
        return file_id.empty() ? ErrorCode::INVALID_DESCRIPTOR : ErrorCode::FILE_NOT_FOUND;
    }
    if (chunk_id.empty() || nodes.empty()) {
        // A chunk nobody holds must never be recorded
        std::cerr << "[ERROR] Rejecting chunk " << index << " of file " << file_id
                  << ": chunk_id and at least one node are required\n";
        return ErrorCode::INVALID_DESCRIPTOR;
    }

    std::lock_guard<std::mutex> lock(registry_mutex);

    FileDescriptor record;
    ErrorCode code = loadRecord(file_id, record);
    if (code != ErrorCode::OK) {
        return code;
    }

    if (index < 0 || index >= record.total_chunks) {
        std::cerr << "[ERROR] Chunk index " << index << " out of range for file " << file_id
                  << " (" << record.total_chunks << " chunks)\n";
        return ErrorCode::INVALID_DESCRIPTOR;
    }

    ChunkDescriptor chunk;
    chunk.chunk_id = chunk_id;
    chunk.file_id = file_id;
    chunk.index = index;
    chunk.size = size;
    for (const auto& node : nodes) {
        if (std::find(chunk.nodes.begin(), chunk.nodes.end(), node) == chunk.nodes.end()) {
            chunk.nodes.push_back(node);
        }
    }

    record.chunks[index] = chunk;
    record.updated_at = currentTimeMillis();

    if (!saveRecord(record)) {
        return ErrorCode::STORAGE_ERROR;
    }

    std::cout << "[INFO] Registered chunk " << chunk_id << " (index " << index << ") on "
              << chunk.nodes.size() << " nodes\n";
    return ErrorCode::OK;
}

std::pair<ErrorCode, FileDescriptor> Registry::getFile(const std::string& file_id) {
    if (!isValidFileId(file_id)) {
        return {ErrorCode::FILE_NOT_FOUND, {}};
    }

    std::lock_guard<std::mutex> lock(registry_mutex);
    FileDescriptor record;
    ErrorCode code = loadRecord(file_id, record);
    return {code, code == ErrorCode::OK ? record : FileDescriptor{}};
}

std::vector<FileDescriptor> Registry::listFiles() {
    std::lock_guard<std::mutex> lock(registry_mutex);
    std::vector<FileDescriptor> files;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(metadata_dir, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") {
            continue;
        }

        FileDescriptor record;
        if (loadRecord(entry.path().stem().string(), record) == ErrorCode::OK) {
            files.push_back(std::move(record));
        }
    }

    if (ec) {
        std::cerr << "[ERROR] Cannot scan metadata directory " << metadata_dir << ": "
                  << ec.message() << "\n";
    }

    std::sort(files.begin(), files.end(), [](const FileDescriptor& a, const FileDescriptor& b) {
        return a.created_at < b.created_at;
    });
    return files;
}

std::pair<ErrorCode, ChunkDescriptor> Registry::resolveChunk(const std::string& file_id, int32_t index) {
    auto [code, record] = getFile(file_id);
    if (code != ErrorCode::OK) {
        return {code, {}};
    }

    auto it = record.chunks.find(index);
    if (it == record.chunks.end()) {
        return {ErrorCode::CHUNK_NOT_FOUND, {}};
    }
    return {ErrorCode::OK, it->second};
}

ErrorCode Registry::deleteFile(const std::string& file_id) {
    if (!isValidFileId(file_id)) {
        return ErrorCode::FILE_NOT_FOUND;
    }

    std::lock_guard<std::mutex> lock(registry_mutex);
    theCache.invalidate(file_id);

    std::error_code ec;
    bool removed = fs::remove(recordPath(file_id), ec);
    if (ec) {
        std::cerr << "[ERROR] Failed to remove record of file " << file_id << ": "
                  << ec.message() << "\n";
        return ErrorCode::STORAGE_ERROR;
    }
    if (!removed) {
        return ErrorCode::FILE_NOT_FOUND;
    }

    std::cout << "[INFO] Deleted file record " << file_id << "\n";
    return ErrorCode::OK;
}
