#include "lft/protocol/frame_channel.hpp"
#include "lft/protocol/codec.hpp"

#include <spdlog/spdlog.h>

#include <array>

namespace lft::protocol {

FrameChannel::FrameChannel(network::ByteStream& stream, network::Timeout write_timeout)
    : stream_(stream), write_timeout_(write_timeout) {}

Result<void> FrameChannel::send(const Frame& frame) {
    const auto bytes = FrameCodec::encode(frame);
    if (auto result = stream_.write_all(bytes.data(), bytes.size(), write_timeout_); result.is_error()) {
        return result;
    }
    ++frames_sent_;
    if (frame_type(frame) != FrameType::DataChunk) {
        spdlog::debug("-> {} {}", stream_.peer(), describe(frame));
    }
    return Ok();
}

Result<Frame> FrameChannel::receive(network::Timeout timeout) {
    std::array<std::uint8_t, kFramePrefixSize> prefix_bytes{};
    if (auto result = stream_.read_exact(prefix_bytes.data(), prefix_bytes.size(), timeout);
        result.is_error()) {
        return Err<Frame>(result.error());
    }

    auto prefix = FrameCodec::decode_prefix(prefix_bytes.data());
    if (prefix.is_error()) {
        return Err<Frame>(prefix.error());
    }

    payload_.resize(prefix.value().length);
    if (auto result = stream_.read_exact(payload_.data(), payload_.size(), timeout); result.is_error()) {
        return Err<Frame>(result.error());
    }

    auto frame = FrameCodec::decode_payload(prefix.value().type, payload_);
    if (frame.is_error()) {
        return frame;
    }

    ++frames_received_;
    if (prefix.value().type != FrameType::DataChunk) {
        spdlog::debug("<- {} {}", stream_.peer(), describe(frame.value()));
    }
    return frame;
}

} // namespace lft::protocol
