#pragma once

/**
 * @file codec.hpp
 * @brief Binary encoding of protocol frames
 *
 * BINARY FORMAT (all integers big-endian, strings are [u32 length][UTF-8 bytes]):
 *
 * Header (0x01):
 *   [version: 1] [kind: 1] [name: string] [size: 8] [item_count: 8]
 * FolderEntryHeader (0x02):
 *   [kind: 1] [relative_path: string] [size: 8]
 * DataChunk (0x03):
 *   [entry_index: 8] [raw bytes: rest of payload]
 * Handshake (0x04):
 *   [total_items: 8] [total_bytes: 8]
 * Acknowledgment (0x05):
 *   [received_items: 8] [received_bytes: 8] [matched: 1]
 *
 * The codec is stateless. decode() rejects anything that is not exactly one
 * well-formed frame with ErrorCode::MalformedFrame.
 */

#include "lft/core/result.hpp"
#include "lft/protocol/frame.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace lft::protocol {

/// Type tag and payload length read from the first five bytes of a frame
struct FramePrefix {
    FrameType type = FrameType::Header;
    std::uint32_t length = 0;
};

class FrameCodec {
public:
    /// Full frame: prefix followed by payload
    static std::vector<std::uint8_t> encode(const Frame& frame);

    /// Payload only, without the five-byte prefix
    static std::vector<std::uint8_t> encode_payload(const Frame& frame);

    /// Decode a buffer holding exactly one complete frame
    static Result<Frame> decode(const std::vector<std::uint8_t>& bytes);

    /**
     * Validate the five-byte prefix of a streamed frame.
     *
     * Checks the type tag and that the declared length is plausible for that
     * type, so a corrupted stream is rejected before the payload is allocated.
     */
    static Result<FramePrefix> decode_prefix(const std::uint8_t* prefix);

    static Result<Frame> decode_payload(FrameType type, const std::vector<std::uint8_t>& payload);

    static bool length_is_valid(FrameType type, std::uint32_t length) noexcept;

    /// True if the string can travel as a name or path: UTF-8, no NUL, within kMaxPathLength
    static bool is_wire_string(const std::string& text);
};

} // namespace lft::protocol
