#include "chunker.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <filesystem>
#include <random>
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace fs = std::filesystem;

Chunker::Chunker(size_t chunk_size) : chunk_size(chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
}

std::string Chunker::md5Hex(const char* data, size_t size) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(data, size, digest, &digest_len, EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(md5) failed");
    }

    std::stringstream ss;
    for (unsigned int i = 0; i < digest_len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return ss.str();
}

std::string Chunker::makeChunkId(const std::string& file_id, int32_t index,
                                 const std::vector<char>& data) {
    std::stringstream ss;
    ss << file_id << "_" << index << "_" << md5Hex(data.data(), data.size());
    return ss.str();
}

std::string Chunker::generateFileId() {
    unsigned char bytes[16];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        throw std::runtime_error("RAND_bytes failed while generating file id");
    }

    // RFC 4122 version 4, variant 1
    bytes[6] = (bytes[6] & 0x0f) | 0x40;
    bytes[8] = (bytes[8] & 0x3f) | 0x80;

    std::stringstream ss;
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ss << "-";
        }
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

std::pair<ErrorCode, ChunkedFile> Chunker::splitStream(std::istream& in,
                                                       const std::string& file_id) const {
    ChunkedFile result;
    result.file_id = file_id.empty() ? generateFileId() : file_id;

    int32_t index = 0;
    while (true) {
        std::vector<char> buffer(chunk_size);
        in.read(buffer.data(), static_cast<std::streamsize>(chunk_size));
        std::streamsize bytes_read = in.gcount();

        if (in.bad()) {
            std::cerr << "[ERROR] Read failed while splitting file " << result.file_id
                      << " at chunk " << index << "\n";
            return {ErrorCode::STORAGE_ERROR, {}};
        }

        buffer.resize(bytes_read);  // trim unused part

        // An empty input still produces exactly one (empty) chunk
        if (bytes_read > 0 || index == 0) {
            Chunk chunk;
            chunk.file_id = result.file_id;
            chunk.index = index;
            chunk.chunk_id = makeChunkId(result.file_id, index, buffer);
            chunk.data = std::move(buffer);

            result.size += static_cast<int64_t>(chunk.data.size());
            result.chunks.push_back(std::move(chunk));
            ++index;
        }

        if (static_cast<size_t>(bytes_read) < chunk_size) {
            break;
        }
    }

    result.total_chunks = static_cast<int32_t>(result.chunks.size());
    return {ErrorCode::OK, std::move(result)};
}

std::pair<ErrorCode, ChunkedFile> Chunker::splitFile(const std::string& path,
                                                     const std::string& file_id) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "[ERROR] Cannot open file: " << path << "\n";
        return {ErrorCode::FILE_NOT_FOUND, {}};
    }

    auto [code, chunked] = splitStream(file, file_id);
    if (code != ErrorCode::OK) {
        return {code, {}};
    }

    chunked.filename = fs::path(path).filename().string();
    std::cout << "[INFO] File " << chunked.filename << " split into "
              << chunked.total_chunks << " chunks\n";
    return {ErrorCode::OK, std::move(chunked)};
}

ErrorCode Chunker::reassemble(std::vector<Chunk> chunks,
                              const std::string& destination,
                              std::optional<int32_t> expected_total) const {
    if (chunks.empty()) {
        std::cerr << "[ERROR] No chunks to reassemble into " << destination << "\n";
        return ErrorCode::MISSING_CHUNK_INDEX;
    }

    // Chunks arrive from different nodes in no particular order
    std::sort(chunks.begin(), chunks.end(),
              [](const Chunk& a, const Chunk& b) { return a.index < b.index; });

    if (chunks.front().index < 0) {
        std::cerr << "[ERROR] Negative chunk index " << chunks.front().index << "\n";
        return ErrorCode::INVALID_ARGUMENT;
    }
    if (expected_total && chunks.back().index >= *expected_total) {
        std::cerr << "[ERROR] Chunk index " << chunks.back().index
                  << " is beyond the declared total of " << *expected_total << "\n";
        return ErrorCode::INVALID_ARGUMENT;
    }

    for (size_t i = 1; i < chunks.size(); ++i) {
        if (chunks[i].index == chunks[i - 1].index) {
            std::cerr << "[ERROR] Duplicate chunk index " << chunks[i].index << "\n";
            return ErrorCode::DUPLICATE_CHUNK_INDEX;
        }
    }

    for (size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].index != static_cast<int32_t>(i)) {
            std::cerr << "[ERROR] Missing chunk index " << i << "\n";
            return ErrorCode::MISSING_CHUNK_INDEX;
        }
    }

    if (expected_total && static_cast<int32_t>(chunks.size()) != *expected_total) {
        std::cerr << "[ERROR] Missing chunk index " << chunks.size()
                  << " (expected " << *expected_total << " chunks)\n";
        return ErrorCode::MISSING_CHUNK_INDEX;
    }

    fs::path dest_path = fs::absolute(destination);
    std::error_code ec;
    fs::create_directories(dest_path.parent_path(), ec);
    if (ec) {
        std::cerr << "[ERROR] Cannot create directory " << dest_path.parent_path()
                  << ": " << ec.message() << "\n";
        return ErrorCode::STORAGE_ERROR;
    }

    std::random_device rd;
    std::stringstream suffix;
    suffix << ".part-" << std::hex << rd();
    fs::path temp_path = dest_path;
    temp_path += suffix.str();

    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[ERROR] Cannot create output file: " << temp_path << "\n";
            return ErrorCode::STORAGE_ERROR;
        }

        for (const Chunk& chunk : chunks) {
            out.write(chunk.data.data(), static_cast<std::streamsize>(chunk.data.size()));
        }
        out.flush();

        if (!out.good()) {
            std::cerr << "[ERROR] Failed writing " << temp_path << "\n";
            out.close();
            fs::remove(temp_path, ec);
            return ErrorCode::STORAGE_ERROR;
        }
    }

    fs::rename(temp_path, dest_path, ec);
    if (ec) {
        std::cerr << "[ERROR] Cannot move " << temp_path << " to " << dest_path
                  << ": " << ec.message() << "\n";
        fs::remove(temp_path, ec);
        return ErrorCode::STORAGE_ERROR;
    }

    std::cout << "[INFO] Reassembled " << chunks.size() << " chunks into " << dest_path << "\n";
    return ErrorCode::OK;
}
