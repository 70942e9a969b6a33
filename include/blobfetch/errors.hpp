#pragma once

#include <stdexcept>
#include <string>

namespace blobfetch {

class TransferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Invalid or missing user input, detected before the engine starts.
class ConfigurationError : public TransferError {
public:
    using TransferError::TransferError;
};

// The remote object's length could not be fetched.
class RemoteMetadataError : public TransferError {
public:
    explicit RemoteMetadataError(const std::string& message, long http_status = 0)
        : TransferError(message), http_status_(http_status) {}

    [[nodiscard]] long httpStatus() const noexcept { return http_status_; }

    [[nodiscard]] bool notFoundOrUnauthorized() const noexcept {
        return http_status_ == 401 || http_status_ == 403 || http_status_ == 404;
    }

private:
    long http_status_;
};

class RemoteRangeError : public TransferError {
public:
    using TransferError::TransferError;
};

class LocalIOError : public TransferError {
public:
    using TransferError::TransferError;
};

} // namespace blobfetch
