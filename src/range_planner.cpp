#include "blobfetch/range_planner.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>

namespace blobfetch {

std::vector<Chunk> planChunks(std::int64_t total_length,
                              std::int64_t existing_local_length,
                              std::int64_t chunk_size) {
    if (chunk_size <= 0) {
        throw std::invalid_argument(fmt::format("chunk size must be positive, got {}", chunk_size));
    }
    if (total_length < 0 || existing_local_length < 0) {
        throw std::invalid_argument("lengths must not be negative");
    }

    const std::int64_t total_chunks = chunkCount(total_length, chunk_size);

    std::vector<Chunk> chunks;
    chunks.reserve(static_cast<std::size_t>(total_chunks));
    for (std::int64_t i = 0; i < total_chunks; ++i) {
        Chunk chunk;
        chunk.index = static_cast<std::size_t>(i);
        chunk.offset = i * chunk_size;
        chunk.length = std::min(chunk_size, total_length - chunk.offset);
        chunk.done = existing_local_length >= chunk.end();
        chunks.push_back(chunk);
    }
    return chunks;
}

bool allChunksDone(const std::vector<Chunk>& chunks) noexcept {
    return std::all_of(chunks.begin(), chunks.end(), [](const Chunk& c) { return c.done; });
}

} // namespace blobfetch
