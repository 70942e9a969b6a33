#pragma once

#include <cstddef>
#include <cstdint>

namespace blobfetch {

struct Chunk {
    std::size_t index{0};
    std::int64_t offset{0};
    std::int64_t length{0};
    bool done{false};

    [[nodiscard]] std::int64_t end() const noexcept { return offset + length; }
};

} // namespace blobfetch
