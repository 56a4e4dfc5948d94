#pragma once

#include "lft/core/result.hpp"
#include "lft/network/byte_stream.hpp"
#include "lft/protocol/frame.hpp"

#include <cstdint>
#include <vector>

namespace lft::protocol {

/**
 * @brief Frame-level view of a byte stream
 *
 * receive() reads the five-byte prefix, validates it, then reads exactly the
 * declared payload. Nothing is ever read past the end of the current frame.
 */
class FrameChannel {
public:
    explicit FrameChannel(network::ByteStream& stream,
                          network::Timeout write_timeout = std::nullopt);

    Result<void> send(const Frame& frame);

    Result<Frame> receive(network::Timeout timeout);

    network::ByteStream& stream() { return stream_; }

    std::uint64_t frames_sent() const noexcept { return frames_sent_; }
    std::uint64_t frames_received() const noexcept { return frames_received_; }

private:
    network::ByteStream& stream_;
    network::Timeout write_timeout_;
    std::vector<std::uint8_t> payload_;
    std::uint64_t frames_sent_ = 0;
    std::uint64_t frames_received_ = 0;
};

} // namespace lft::protocol
