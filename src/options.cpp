#include "blobfetch/options.hpp"

#include "blobfetch/chunk_worker_pool.hpp"
#include "blobfetch/detail/curl_utils.hpp"
#include "blobfetch/errors.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <thread>

#include <fmt/format.h>

namespace blobfetch {

namespace {

const std::string& requireValue(const std::vector<std::string>& args, std::size_t index) {
    if (index + 1 >= args.size()) {
        throw ConfigurationError(fmt::format("Option {} requires a value", args[index]));
    }
    return args[index + 1];
}

} // namespace

CommandLine parseArguments(const std::vector<std::string>& args) {
    CommandLine result;
    bool have_url = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& option = args[i];

        if (option == "--blob-url") {
            result.options.url = requireValue(args, i);
            have_url = true;
            ++i;
        } else if (option == "--local-path") {
            result.options.destination = requireValue(args, i);
            ++i;
        } else if (option == "--bearer-token") {
            result.options.bearer_token = requireValue(args, i);
            ++i;
        } else if (option == "-t" || option == "--threads") {
            result.options.concurrency = parseConcurrency(requireValue(args, i));
            ++i;
        } else if (option == "-c" || option == "--chunk-size") {
            result.options.chunk_size = parseChunkSize(requireValue(args, i));
            ++i;
        } else if (option == "-v" || option == "--verbose") {
            result.verbose = true;
        } else if (option == "-h" || option == "--help") {
            result.show_help = true;
            return result;
        } else {
            throw ConfigurationError(fmt::format("Unknown option: {}", option));
        }
    }

    if (!have_url || result.options.url.empty()) {
        throw ConfigurationError("--blob-url is required.");
    }
    return result;
}

int parseConcurrency(const std::string& value) {
    if (value == "auto") {
        return autoConcurrency();
    }

    int threads = 0;
    try {
        std::size_t consumed = 0;
        threads = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw ConfigurationError("Invalid thread count: " + value);
        }
    } catch (const std::logic_error&) {
        throw ConfigurationError("Invalid thread count: " + value);
    }

    if (threads <= 0 || threads > kMaxConcurrency) {
        throw ConfigurationError(fmt::format("Thread count must be between 1 and {}", kMaxConcurrency));
    }
    return threads;
}

int autoConcurrency() noexcept {
    const unsigned int hardware = std::thread::hardware_concurrency();
    return std::clamp(static_cast<int>(hardware), 1, kMaxAutoConcurrency);
}

std::int64_t parseByteSize(const std::string& value) {
    if (value.empty()) {
        throw ConfigurationError("Chunk size must not be empty");
    }

    std::string digits = value;
    std::int64_t multiplier = 1;
    switch (std::toupper(static_cast<unsigned char>(value.back()))) {
    case 'K':
        multiplier = 1024;
        break;
    case 'M':
        multiplier = 1024 * 1024;
        break;
    case 'G':
        multiplier = 1024 * 1024 * 1024;
        break;
    default:
        break;
    }
    if (multiplier != 1) {
        digits.pop_back();
    }

    if (digits.empty() || !std::all_of(digits.begin(), digits.end(),
                                       [](unsigned char c) { return std::isdigit(c) != 0; })) {
        throw ConfigurationError("Invalid chunk size: " + value);
    }

    std::int64_t count = 0;
    try {
        count = std::stoll(digits);
    } catch (const std::out_of_range&) {
        throw ConfigurationError("Chunk size out of range: " + value);
    }
    if (count <= 0 || count > std::numeric_limits<std::int64_t>::max() / multiplier) {
        throw ConfigurationError("Invalid chunk size: " + value);
    }
    return count * multiplier;
}

std::int64_t parseChunkSize(const std::string& value) {
    const std::int64_t size = parseByteSize(value);
    if (size > kMaxChunkSize) {
        throw ConfigurationError(fmt::format("Chunk size must not exceed {} bytes, got {}", kMaxChunkSize, value));
    }
    return size;
}

std::filesystem::path resolveDestination(const std::string& url, const std::filesystem::path& local_path) {
    std::filesystem::path destination = local_path.empty() ? std::filesystem::current_path() : local_path;

    std::error_code ec;
    if (!std::filesystem::is_directory(destination, ec)) {
        return destination;
    }

    const std::string file_name = detail::urlFileName(url);
    if (file_name.empty()) {
        throw ConfigurationError(fmt::format("Could not determine file name from blob URL '{}'.", url));
    }
    return destination / file_name;
}

void printUsage(const char* program_name) {
    std::cerr << "Usage: " << program_name
              << " --blob-url <url> [--local-path <path>] [--bearer-token <token>]"
                 " [-t <threads|auto>] [-c <size>] [-v]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  --blob-url <url>        Object to download (required)\n"
              << "  --local-path <path>     Destination file or directory (default: current directory)\n"
              << "  --bearer-token <token>  Send 'Authorization: Bearer <token>' with every request\n"
              << "  -t <threads|auto>       Concurrent chunk downloads (default: 1, auto: up to "
              << kMaxAutoConcurrency << ")\n"
              << "  -c <size>               Chunk size, with optional K/M/G suffix (default: 4M, max: 1G)\n"
              << "  -v, --verbose           Enable debug logging\n"
              << "  -h, --help              Show this message" << std::endl;
}

} // namespace blobfetch
