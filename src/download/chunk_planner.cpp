#include "skopje/download/chunk_planner.hpp"
#include "skopje/error.hpp"

#include <algorithm>

namespace skopje::download {

uint64_t chunk_count(uint64_t file_size, uint64_t chunk_size) {
    SKOPJE_CHECK_ARGUMENT(chunk_size > 0, "chunk size must be greater than zero");
    // Written to avoid overflow of file_size + chunk_size - 1
    return file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
}

std::vector<Chunk> plan_chunks(uint64_t file_size, uint64_t chunk_size) {
    const uint64_t count = chunk_count(file_size, chunk_size);

    std::vector<Chunk> chunks;
    chunks.reserve(static_cast<size_t>(count));
    for (uint64_t i = 0; i < count; ++i) {
        Chunk chunk;
        chunk.index = i;
        chunk.start = i * chunk_size;
        chunk.end = chunk.start + std::min(chunk_size, file_size - chunk.start);
        chunks.push_back(chunk);
    }
    return chunks;
}

} // namespace skopje::download
