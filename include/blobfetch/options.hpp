#pragma once

#include "progress_reporter.hpp"
#include "range_planner.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace blobfetch {

inline constexpr int kMaxConcurrency = 64;

struct TransferOptions {
    std::string url;
    std::filesystem::path destination;
    std::optional<std::string> bearer_token;
    int concurrency{1};
    std::int64_t chunk_size{kDefaultChunkSize};
    std::chrono::milliseconds tick_interval{kDefaultTickInterval};
};

struct CommandLine {
    TransferOptions options;
    bool show_help{false};
    bool verbose{false};
};

// Parses program arguments (without argv[0]). Throws ConfigurationError.
[[nodiscard]] CommandLine parseArguments(const std::vector<std::string>& args);

// "auto" or an integer in [1, kMaxConcurrency].
[[nodiscard]] int parseConcurrency(const std::string& value);

// Host parallelism clamped to [1, kMaxAutoConcurrency].
[[nodiscard]] int autoConcurrency() noexcept;

// Plain byte count with an optional K, M or G suffix (powers of 1024).
[[nodiscard]] std::int64_t parseByteSize(const std::string& value);

// parseByteSize() limited to kMaxChunkSize.
[[nodiscard]] std::int64_t parseChunkSize(const std::string& value);

// An empty local path means the current directory. When the path names a
// directory, the file name is taken from the last segment of the URL path.
[[nodiscard]] std::filesystem::path resolveDestination(const std::string& url,
                                                       const std::filesystem::path& local_path);

void printUsage(const char* program_name);

} // namespace blobfetch
