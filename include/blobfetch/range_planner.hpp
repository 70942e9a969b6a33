#pragma once

#include "chunk.hpp"

#include <cstdint>
#include <vector>

namespace blobfetch {

inline constexpr std::int64_t kDefaultChunkSize = 4 * 1024 * 1024;
inline constexpr std::int64_t kMaxChunkSize = 1024 * 1024 * 1024;

// ceil(total_length / chunk_size) without overflowing for any positive chunk_size.
[[nodiscard]] constexpr std::int64_t chunkCount(std::int64_t total_length, std::int64_t chunk_size) noexcept {
    return total_length / chunk_size + (total_length % chunk_size != 0 ? 1 : 0);
}

// Splits [0, total_length) into chunk_size pieces. A chunk is marked done when
// existing_local_length covers its whole range; the bytes are not verified.
[[nodiscard]] std::vector<Chunk> planChunks(std::int64_t total_length,
                                            std::int64_t existing_local_length,
                                            std::int64_t chunk_size);

[[nodiscard]] bool allChunksDone(const std::vector<Chunk>& chunks) noexcept;

} // namespace blobfetch
