#pragma once

namespace blobfetch {

// Installs the "blobfetch" stderr logger as spdlog's default logger.
void initLogging(bool verbose);

} // namespace blobfetch
