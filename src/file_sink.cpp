#include "blobfetch/file_sink.hpp"

#include "blobfetch/errors.hpp"

#include <cerrno>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace blobfetch {

std::optional<std::int64_t> localFileLength(const std::filesystem::path& path) {
    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (!std::filesystem::exists(status)) {
        return std::nullopt;
    }
    if (!std::filesystem::is_regular_file(status)) {
        throw LocalIOError(fmt::format("'{}' exists but is not a regular file", path.string()));
    }

    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw LocalIOError(fmt::format("Cannot read size of '{}': {}", path.string(), ec.message()));
    }
    return static_cast<std::int64_t>(size);
}

FileSink::FileSink(std::filesystem::path path) : path_(std::move(path)) {
    fd_ = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ == -1) {
        raiseErrno("open", errno);
    }
    spdlog::debug("opened '{}' for positional writes (fd {})", path_.string(), fd_);
}

FileSink::~FileSink() {
    if (fd_ != -1) {
        ::close(fd_);
    }
}

std::size_t FileSink::writeAt(std::int64_t offset, const char* data, std::size_t size) {
    std::size_t written = 0;
    while (written < size) {
        const ssize_t n = ::pwrite(fd_, data + written, size - written,
                                   static_cast<off_t>(offset) + static_cast<off_t>(written));
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            raiseErrno("write", errno);
        }
        written += static_cast<std::size_t>(n);
    }
    return written;
}

void FileSink::sync() {
    if (::fdatasync(fd_) == -1) {
        raiseErrno("sync", errno);
    }
}

void FileSink::truncate(std::int64_t length) {
    if (::ftruncate(fd_, static_cast<off_t>(length)) == -1) {
        raiseErrno("truncate", errno);
    }
}

std::int64_t FileSink::size() const {
    struct stat st {};
    if (::fstat(fd_, &st) == -1) {
        raiseErrno("stat", errno);
    }
    return static_cast<std::int64_t>(st.st_size);
}

void FileSink::raiseErrno(const char* operation, int error) const {
    throw LocalIOError(fmt::format("Cannot {} '{}': {}", operation, path_.string(),
                                   std::system_category().message(error)));
}

} // namespace blobfetch
