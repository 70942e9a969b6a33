#include "blobfetch/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace blobfetch {

void initLogging(bool verbose) {
    auto logger = spdlog::get("blobfetch");
    if (!logger) {
        logger = spdlog::stderr_color_mt("blobfetch");
    }
    logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_default_logger(logger);
}

} // namespace blobfetch
