#pragma once

#include "options.hpp"
#include "remote_object.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <ostream>

namespace blobfetch {

enum class TransferOutcome {
    AlreadyComplete,
    Completed,
};

struct TransferSummary {
    TransferOutcome outcome{TransferOutcome::Completed};
    std::int64_t total_length{0};
    std::int64_t bytes_already_present{0};
    std::int64_t bytes_transferred{0};
    std::size_t chunks_total{0};
    std::size_t chunks_downloaded{0};
};

// Downloads one remote object into options.destination, reusing the chunks a
// previous partial run already wrote. Status lines and the final message go to
// status_out; failures are thrown as TransferError subclasses.
class ResumableDownloader final {
public:
    ResumableDownloader(TransferOptions options, RemoteObjectPtr remote, std::ostream& status_out);
    ~ResumableDownloader();

    ResumableDownloader(const ResumableDownloader&) = delete;
    ResumableDownloader& operator=(const ResumableDownloader&) = delete;

    TransferSummary run();

    [[nodiscard]] const TransferOptions& options() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace blobfetch
