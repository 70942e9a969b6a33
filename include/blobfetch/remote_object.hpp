#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>

namespace blobfetch {

// Receives one buffer of a range stream. Returning false abandons the stream
// without raising an error.
using RangeConsumer = std::function<bool(const char* data, std::size_t size)>;

class RemoteObject {
public:
    virtual ~RemoteObject() = default;

    // Total size in bytes. Throws RemoteMetadataError.
    [[nodiscard]] virtual std::int64_t length() = 0;

    // Streams [offset, offset + length) into consumer. Throws RemoteRangeError;
    // exceptions raised by consumer propagate unchanged. Must be safe to call
    // from several threads at once.
    virtual void fetchRange(std::int64_t offset, std::int64_t length, const RangeConsumer& consumer) = 0;
};

using RemoteObjectPtr = std::shared_ptr<RemoteObject>;

} // namespace blobfetch
