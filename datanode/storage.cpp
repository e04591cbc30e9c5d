#include "storage.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <openssl/evp.h>

namespace fs = std::filesystem;

namespace {

int64_t nowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Distinguishes the temp files of concurrent writers of the same chunk
std::atomic<uint64_t> temp_sequence{0};

} // namespace

DataNodeStorage::DataNodeStorage(const std::string& storage_path, int64_t capacity_bytes)
    : storage_path(storage_path), total_capacity(capacity_bytes), used_space(0) {

    ensureStorageDirectory();
    loadExistingChunks();

    std::cout << "[INFO] DataNode storage initialized at " << storage_path
              << " with capacity " << capacity_bytes / (1024*1024) << " MB\n";
    std::cout << "[INFO] Found " << chunk_metadata.size() << " existing chunks, "
              << "using " << used_space.load() / (1024*1024) << " MB\n";
}

DataNodeStorage::~DataNodeStorage() {
}

bool DataNodeStorage::isValidId(const std::string& id) {
    if (id.empty() || id == "." || id == "..") {
        return false;
    }
    return id.find('/') == std::string::npos && id.find('\0') == std::string::npos;
}

void DataNodeStorage::ensureStorageDirectory() {
    fs::create_directories(storage_path);
}

void DataNodeStorage::loadExistingChunks() {
    std::lock_guard<std::mutex> lock(metadata_mutex);

    for (const auto& dir_entry : fs::recursive_directory_iterator(storage_path)) {
        if (!dir_entry.is_regular_file() || dir_entry.path().extension() != ".meta") {
            continue;
        }

        std::ifstream meta_file(dir_entry.path(), std::ios::binary);
        ChunkMetadata metadata;
        if (!meta_file.is_open() || !metadata.ParseFromIstream(&meta_file)) {
            std::cerr << "[WARNING] Skipping unreadable descriptor " << dir_entry.path() << "\n";
            continue;
        }

        fs::path chunk_path = dir_entry.path();
        chunk_path.replace_extension(".chunk");
        if (!fs::exists(chunk_path)) {
            std::cerr << "[WARNING] Descriptor without payload: " << dir_entry.path() << "\n";
            continue;
        }

        chunk_metadata[metadata.chunk_id()] = metadata;
        used_space += metadata.size();
    }
}

std::string DataNodeStorage::getChunkPath(const std::string& file_id, const std::string& chunk_id) const {
    // Chunks are grouped under their owning file for locality
    return (fs::path(storage_path) / file_id / (chunk_id + ".chunk")).string();
}

std::string DataNodeStorage::getMetaPath(const std::string& file_id, const std::string& chunk_id) const {
    return (fs::path(storage_path) / file_id / (chunk_id + ".meta")).string();
}

std::string DataNodeStorage::calculateChecksum(const std::vector<char>& data) const {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    EVP_Digest(data.data(), data.size(), hash, &hash_len, EVP_sha256(), nullptr);

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

bool DataNodeStorage::writeAtomically(const std::string& path, const char* data, size_t size) const {
    std::stringstream temp_name;
    temp_name << path << "." << std::hex << ++temp_sequence << ".tmp";
    std::string temp_path = temp_name.str();

    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        std::cerr << "[ERROR] Failed to open file for writing: " << temp_path << "\n";
        return false;
    }

    file.write(data, size);
    file.flush();

    std::error_code ec;
    if (!file.good()) {
        std::cerr << "[ERROR] Failed to write " << temp_path << "\n";
        file.close();
        fs::remove(temp_path, ec);
        return false;
    }
    file.close();

    fs::rename(temp_path, path, ec);
    if (ec) {
        std::cerr << "[ERROR] Failed to move " << temp_path << " into place: " << ec.message() << "\n";
        fs::remove(temp_path, ec);
        return false;
    }
    return true;
}

ErrorCode DataNodeStorage::putChunk(const std::string& chunk_id, const std::string& file_id,
                                    int32_t index, const std::vector<char>& data) {
    if (!isValidId(chunk_id) || !isValidId(file_id) || index < 0) {
        std::cerr << "[ERROR] Invalid chunk descriptor (chunk_id='" << chunk_id
                  << "', file_id='" << file_id << "', index=" << index << ")\n";
        return ErrorCode::INVALID_ARGUMENT;
    }

    // Reserve the space up front, crediting back the copy an overwrite replaces
    const int64_t size = static_cast<int64_t>(data.size());
    {
        std::lock_guard<std::mutex> lock(metadata_mutex);
        int64_t replaced = 0;
        auto it = chunk_metadata.find(chunk_id);
        if (it != chunk_metadata.end()) {
            replaced = it->second.size();
        }
        if (used_space.load() - replaced + size > total_capacity.load()) {
            std::cerr << "[ERROR] Insufficient storage space for chunk " << chunk_id << "\n";
            return ErrorCode::STORAGE_ERROR;
        }
        used_space += size;
    }

    ErrorCode result = writeChunkFiles(chunk_id, file_id, index, data);
    if (result != ErrorCode::OK) {
        used_space -= size;
    }
    return result;
}

ErrorCode DataNodeStorage::writeChunkFiles(const std::string& chunk_id, const std::string& file_id,
                                           int32_t index, const std::vector<char>& data) {
    std::error_code ec;
    fs::create_directories(fs::path(storage_path) / file_id, ec);
    if (ec) {
        std::cerr << "[ERROR] Cannot create directory for file " << file_id << ": " << ec.message() << "\n";
        return ErrorCode::STORAGE_ERROR;
    }

    ChunkMetadata metadata;
    metadata.set_chunk_id(chunk_id);
    metadata.set_file_id(file_id);
    metadata.set_index(index);
    metadata.set_size(static_cast<int64_t>(data.size()));
    metadata.set_checksum(calculateChecksum(data));
    metadata.set_stored_at(nowMillis());

    std::string serialized;
    if (!metadata.SerializeToString(&serialized)) {
        std::cerr << "[ERROR] Failed to serialize descriptor of chunk " << chunk_id << "\n";
        return ErrorCode::STORAGE_ERROR;
    }

    if (!writeAtomically(getChunkPath(file_id, chunk_id), data.data(), data.size())
            || !writeAtomically(getMetaPath(file_id, chunk_id), serialized.data(), serialized.size())) {
        return ErrorCode::STORAGE_ERROR;
    }

    {
        std::lock_guard<std::mutex> lock(metadata_mutex);

        // The reservation already counts the new copy
        auto it = chunk_metadata.find(chunk_id);
        if (it != chunk_metadata.end()) {
            used_space -= it->second.size();
        }

        chunk_metadata[chunk_id] = metadata;
    }

    std::cout << "[INFO] Stored chunk " << chunk_id
              << " (" << data.size() << " bytes, checksum: " << metadata.checksum().substr(0, 8) << "...)\n";

    return ErrorCode::OK;
}

std::pair<ErrorCode, StoredChunk> DataNodeStorage::getChunk(const std::string& chunk_id) {
    ChunkMetadata metadata;
    {
        std::lock_guard<std::mutex> lock(metadata_mutex);
        auto it = chunk_metadata.find(chunk_id);
        if (it == chunk_metadata.end()) {
            return {ErrorCode::CHUNK_NOT_FOUND, {}};
        }
        metadata = it->second;
    }

    std::string chunk_path = getChunkPath(metadata.file_id(), chunk_id);
    std::ifstream file(chunk_path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        std::cerr << "[ERROR] Chunk file missing: " << chunk_path << "\n";
        return {ErrorCode::CHUNK_NOT_FOUND, {}};
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    StoredChunk stored;
    stored.data.resize(static_cast<size_t>(size));
    file.read(stored.data.data(), size);
    if (file.gcount() != size) {
        std::cerr << "[ERROR] Short read of chunk " << chunk_id << "\n";
        return {ErrorCode::STORAGE_ERROR, {}};
    }
    file.close();

    // Verify checksum
    if (calculateChecksum(stored.data) != metadata.checksum()) {
        std::cerr << "[ERROR] Checksum verification failed for chunk " << chunk_id << "\n";
        return {ErrorCode::STORAGE_ERROR, {}};
    }

    stored.metadata = metadata;
    std::cout << "[INFO] Read chunk " << chunk_id << " (" << size << " bytes)\n";

    return {ErrorCode::OK, std::move(stored)};
}

ErrorCode DataNodeStorage::deleteChunk(const std::string& chunk_id) {
    std::lock_guard<std::mutex> lock(metadata_mutex);

    auto it = chunk_metadata.find(chunk_id);
    if (it == chunk_metadata.end()) {
        return ErrorCode::CHUNK_NOT_FOUND;
    }

    // The payload goes first. If it cannot be removed the chunk stays indexed.
    std::error_code chunk_ec;
    fs::remove(getChunkPath(it->second.file_id(), chunk_id), chunk_ec);
    if (chunk_ec) {
        std::cerr << "[ERROR] Failed to delete payload of chunk " << chunk_id << ": " << chunk_ec.message() << "\n";
        return ErrorCode::STORAGE_ERROR;
    }

    std::string file_id = it->second.file_id();
    used_space -= it->second.size();
    chunk_metadata.erase(it);

    // Without a payload the descriptor is skipped at restart, but it still has to go
    std::error_code meta_ec;
    fs::remove(getMetaPath(file_id, chunk_id), meta_ec);
    if (meta_ec) {
        std::cerr << "[ERROR] Failed to delete descriptor of chunk " << chunk_id << ": " << meta_ec.message() << "\n";
        return ErrorCode::STORAGE_ERROR;
    }

    // Drop the per-file directory once its last chunk is gone
    std::error_code ec;
    fs::path file_dir = fs::path(storage_path) / file_id;
    if (fs::is_empty(file_dir, ec) && !ec) {
        fs::remove(file_dir, ec);
    }

    std::cout << "[INFO] Deleted chunk " << chunk_id << "\n";
    return ErrorCode::OK;
}

bool DataNodeStorage::hasChunk(const std::string& chunk_id) const {
    std::lock_guard<std::mutex> lock(metadata_mutex);
    return chunk_metadata.find(chunk_id) != chunk_metadata.end();
}

void DataNodeStorage::listChunks(const std::function<bool(const ChunkMetadata&)>& visitor) const {
    std::error_code ec;
    for (auto it = fs::recursive_directory_iterator(storage_path, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file() || it->path().extension() != ".meta") {
            continue;
        }

        std::ifstream meta_file(it->path(), std::ios::binary);
        ChunkMetadata metadata;
        if (!meta_file.is_open() || !metadata.ParseFromIstream(&meta_file)) {
            continue;
        }

        if (!visitor(metadata)) {
            return;
        }
    }

    if (ec) {
        std::cerr << "[WARNING] Chunk listing interrupted: " << ec.message() << "\n";
    }
}

size_t DataNodeStorage::getChunkCount() const {
    std::lock_guard<std::mutex> lock(metadata_mutex);
    return chunk_metadata.size();
}

int64_t DataNodeStorage::getAvailableSpace() const {
    return total_capacity.load() - used_space.load();
}

int64_t DataNodeStorage::getUsedSpace() const {
    return used_space.load();
}

bool DataNodeStorage::performHealthCheck() {
    std::lock_guard<std::mutex> lock(metadata_mutex);

    int missing_chunks = 0;
    for (const auto& [chunk_id, metadata] : chunk_metadata) {
        if (!fs::exists(getChunkPath(metadata.file_id(), chunk_id))) {
            std::cerr << "[WARNING] Missing chunk file: " << chunk_id << "\n";
            missing_chunks++;
        }
    }

    if (missing_chunks > 0) {
        std::cerr << "[WARNING] Health check found " << missing_chunks << " issues\n";
        return false;
    }

    return true;
}
