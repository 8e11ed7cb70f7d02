#pragma once

#include <cstdint>
#include <vector>

namespace skopje::download {

// Byte range [start, end) of a remote resource fetched by one task.
struct Chunk {
    uint64_t index = 0;
    uint64_t start = 0;
    uint64_t end = 0;  // exclusive

    uint64_t length() const { return end - start; }

    bool operator==(const Chunk& other) const {
        return index == other.index && start == other.start && end == other.end;
    }
};

// Number of chunks needed to cover file_size bytes: ceil(file_size / chunk_size).
uint64_t chunk_count(uint64_t file_size, uint64_t chunk_size);

// Partition [0, file_size) into consecutive chunks of chunk_size bytes; the last
// chunk holds the remainder. Throws InvalidArgumentError when chunk_size is zero.
std::vector<Chunk> plan_chunks(uint64_t file_size, uint64_t chunk_size);

} // namespace skopje::download
