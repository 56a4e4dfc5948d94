#pragma once

#include "lft/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace lft::network {

/// Per-operation deadline; std::nullopt blocks indefinitely
using Timeout = std::optional<std::chrono::milliseconds>;

/**
 * @brief Ordered, reliable, connected byte stream
 *
 * The engine never assumes anything beyond in-order delivery without loss.
 * Implementations map failures onto ErrorCode:
 *   ConnectionClosed - peer closed the stream
 *   Timeout          - deadline expired
 *   Cancelled        - close() was called locally
 *   IOFailure        - anything else
 *
 * THREAD SAFETY:
 * read_exact()/write_all() are driven by a single owning thread. close() may
 * be called from any thread and unblocks a pending operation.
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    virtual Result<void> read_exact(std::uint8_t* data, std::size_t size, Timeout timeout) = 0;

    virtual Result<void> write_all(const std::uint8_t* data, std::size_t size, Timeout timeout) = 0;

    virtual void close() = 0;

    /// Human-readable remote address for logs
    virtual std::string peer() const = 0;
};

} // namespace lft::network
