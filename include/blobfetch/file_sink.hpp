#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace blobfetch {

// Length of an existing regular file, or nullopt when nothing is there yet.
[[nodiscard]] std::optional<std::int64_t> localFileLength(const std::filesystem::path& path);

// One local file opened for positional writes. writeAt() carries its own
// offset, so concurrent callers on disjoint ranges need no locking.
class FileSink {
public:
    explicit FileSink(std::filesystem::path path);
    ~FileSink();

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    // Writes the whole buffer at offset. Bytes are handed to the OS before
    // returning; nothing is buffered in-process.
    std::size_t writeAt(std::int64_t offset, const char* data, std::size_t size);

    void sync();
    void truncate(std::int64_t length);

    [[nodiscard]] std::int64_t size() const;
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    [[noreturn]] void raiseErrno(const char* operation, int error) const;

    std::filesystem::path path_;
    int fd_{-1};
};

} // namespace blobfetch
