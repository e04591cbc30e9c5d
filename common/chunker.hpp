#pragma once

#include <string>
#include <vector>
#include <istream>
#include <optional>
#include <utility>
#include "types.hpp"
#include "error_code.hpp"

constexpr size_t DEFAULT_CHUNK_SIZE = 1024 * 1024; // 1 MB Chunks

// Splits byte streams into fixed-size content-addressed chunks and puts them
// back together. Holds no state besides the chunk size.
class Chunker {
private:
    size_t chunk_size;

public:
    // Throws std::invalid_argument for a zero chunk size.
    explicit Chunker(size_t chunk_size = DEFAULT_CHUNK_SIZE);

    size_t chunkSize() const { return chunk_size; }

    // Splits everything readable from `in`. An empty file_id generates a new one.
    // Always yields at least one chunk; an empty stream gives one empty chunk.
    std::pair<ErrorCode, ChunkedFile> splitStream(std::istream& in,
                                                  const std::string& file_id = "") const;

    // Same as splitStream, reading from a file on disk. The ChunkedFile carries
    // the base name of the path as its filename.
    std::pair<ErrorCode, ChunkedFile> splitFile(const std::string& path,
                                                const std::string& file_id = "") const;

    // Writes the chunks ordered by index to `destination`. Data goes to a
    // temporary file next to the destination which is renamed into place only
    // once everything was written. Indices must be exactly 0..n-1; when
    // expected_total is given n must equal it.
    ErrorCode reassemble(std::vector<Chunk> chunks,
                         const std::string& destination,
                         std::optional<int32_t> expected_total = std::nullopt) const;

    // <file_id>_<index>_<md5 of data>
    static std::string makeChunkId(const std::string& file_id, int32_t index,
                                   const std::vector<char>& data);

    // Random version 4 UUID.
    static std::string generateFileId();

    static std::string md5Hex(const char* data, size_t size);
};
