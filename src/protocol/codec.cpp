#include "lft/protocol/codec.hpp"

#include <sstream>
#include <string>

namespace lft::protocol {
namespace {

constexpr std::size_t kHeaderFixedSize = 1 + 1 + 4 + 8 + 8;
constexpr std::size_t kEntryFixedSize = 1 + 4 + 8;
constexpr std::size_t kHandshakeSize = 16;
constexpr std::size_t kAckSize = 17;

Result<Frame> malformed(const std::string& message) {
    return Err<Frame>(ErrorCode::MalformedFrame, message);
}

// ──────────────────────────────────────────────────────────
// Writers
// ──────────────────────────────────────────────────────────

void write_uint8(std::vector<std::uint8_t>& buffer, std::uint8_t value) {
    buffer.push_back(value);
}

void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        buffer.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }
}

void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        buffer.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }
}

void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
    write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
    buffer.insert(buffer.end(), str.begin(), str.end());
}

// ──────────────────────────────────────────────────────────
// Readers (bounds-checked, cursor advanced on success)
// ──────────────────────────────────────────────────────────

Result<std::uint8_t> read_uint8(const std::vector<std::uint8_t>& buffer, std::size_t& cursor) {
    if (cursor + 1 > buffer.size()) {
        return Err<std::uint8_t>(ErrorCode::MalformedFrame, "Buffer underflow reading uint8");
    }
    return Ok(buffer[cursor++]);
}

Result<std::uint32_t> read_uint32(const std::vector<std::uint8_t>& buffer, std::size_t& cursor) {
    if (cursor + 4 > buffer.size()) {
        return Err<std::uint32_t>(ErrorCode::MalformedFrame, "Buffer underflow reading uint32");
    }
    std::uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | buffer[cursor++];
    }
    return Ok(value);
}

Result<std::uint64_t> read_uint64(const std::vector<std::uint8_t>& buffer, std::size_t& cursor) {
    if (cursor + 8 > buffer.size()) {
        return Err<std::uint64_t>(ErrorCode::MalformedFrame, "Buffer underflow reading uint64");
    }
    std::uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value = (value << 8) | buffer[cursor++];
    }
    return Ok(value);
}

bool is_valid_utf8(const std::string& text) {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        std::uint32_t code_point = 0;
        if (lead == 0x00) {
            return false;
        } else if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            code_point = lead & 0x07;
        } else {
            return false;
        }
        if (i + extra >= text.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cont & 0x3F);
        }
        // Overlong encodings, surrogates and out-of-range values
        if ((extra == 1 && code_point < 0x80) || (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) || code_point > 0x10FFFF ||
            (code_point >= 0xD800 && code_point <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

Result<std::string> read_string(const std::vector<std::uint8_t>& buffer, std::size_t& cursor) {
    auto length_result = read_uint32(buffer, cursor);
    if (length_result.is_error()) {
        return Err<std::string>(length_result.error());
    }
    const std::uint32_t length = length_result.value();

    if (length > kMaxPathLength) {
        return Err<std::string>(ErrorCode::MalformedFrame,
                                "String length " + std::to_string(length) + " exceeds limit");
    }
    if (cursor + length > buffer.size()) {
        return Err<std::string>(ErrorCode::MalformedFrame, "Buffer underflow reading string");
    }

    std::string value(buffer.begin() + static_cast<std::ptrdiff_t>(cursor),
                      buffer.begin() + static_cast<std::ptrdiff_t>(cursor + length));
    cursor += length;

    if (!is_valid_utf8(value)) {
        return Err<std::string>(ErrorCode::MalformedFrame, "String is not valid UTF-8");
    }
    return Ok(std::move(value));
}

// ──────────────────────────────────────────────────────────
// Per-type payload encoders
// ──────────────────────────────────────────────────────────

void encode_into(std::vector<std::uint8_t>& out, const Header& header) {
    write_uint8(out, kProtocolVersion);
    write_uint8(out, static_cast<std::uint8_t>(header.kind));
    write_string(out, header.name);
    write_uint64(out, header.size);
    write_uint64(out, header.item_count);
}

void encode_into(std::vector<std::uint8_t>& out, const FolderEntryHeader& entry) {
    write_uint8(out, static_cast<std::uint8_t>(entry.kind));
    write_string(out, entry.relative_path);
    write_uint64(out, entry.size);
}

void encode_into(std::vector<std::uint8_t>& out, const DataChunk& chunk) {
    write_uint64(out, chunk.entry_index);
    out.insert(out.end(), chunk.data.begin(), chunk.data.end());
}

void encode_into(std::vector<std::uint8_t>& out, const Handshake& handshake) {
    write_uint64(out, handshake.total_items);
    write_uint64(out, handshake.total_bytes);
}

void encode_into(std::vector<std::uint8_t>& out, const Acknowledgment& ack) {
    write_uint64(out, ack.received_items);
    write_uint64(out, ack.received_bytes);
    write_uint8(out, ack.matched ? 1 : 0);
}

// ──────────────────────────────────────────────────────────
// Per-type payload decoders
// ──────────────────────────────────────────────────────────

Result<Frame> decode_header(const std::vector<std::uint8_t>& payload, std::size_t& cursor) {
    auto version_result = read_uint8(payload, cursor);
    if (version_result.is_error()) {
        return Err<Frame>(version_result.error());
    }
    if (version_result.value() != kProtocolVersion) {
        return malformed("Unsupported protocol version: " + std::to_string(version_result.value()));
    }

    auto kind_result = read_uint8(payload, cursor);
    if (kind_result.is_error()) {
        return Err<Frame>(kind_result.error());
    }
    const std::uint8_t kind = kind_result.value();
    if (kind > static_cast<std::uint8_t>(TransferKind::Folder)) {
        return malformed("Unknown transfer kind: " + std::to_string(kind));
    }

    auto name_result = read_string(payload, cursor);
    if (name_result.is_error()) {
        return Err<Frame>(name_result.error());
    }
    if (name_result.value().empty()) {
        return malformed("Header name is empty");
    }

    auto size_result = read_uint64(payload, cursor);
    if (size_result.is_error()) {
        return Err<Frame>(size_result.error());
    }
    auto count_result = read_uint64(payload, cursor);
    if (count_result.is_error()) {
        return Err<Frame>(count_result.error());
    }

    Header header;
    header.kind = static_cast<TransferKind>(kind);
    header.name = std::move(name_result.value());
    header.size = size_result.value();
    header.item_count = count_result.value();

    if (header.kind == TransferKind::File && header.item_count != 1) {
        return malformed("File header must declare exactly one item");
    }
    return Ok(Frame{std::move(header)});
}

Result<Frame> decode_entry(const std::vector<std::uint8_t>& payload, std::size_t& cursor) {
    auto kind_result = read_uint8(payload, cursor);
    if (kind_result.is_error()) {
        return Err<Frame>(kind_result.error());
    }
    const std::uint8_t kind = kind_result.value();
    if (kind > static_cast<std::uint8_t>(EntryKind::Directory)) {
        return malformed("Unknown entry kind: " + std::to_string(kind));
    }

    auto path_result = read_string(payload, cursor);
    if (path_result.is_error()) {
        return Err<Frame>(path_result.error());
    }
    if (path_result.value().empty()) {
        return malformed("Entry path is empty");
    }

    auto size_result = read_uint64(payload, cursor);
    if (size_result.is_error()) {
        return Err<Frame>(size_result.error());
    }

    FolderEntryHeader entry;
    entry.kind = static_cast<EntryKind>(kind);
    entry.relative_path = std::move(path_result.value());
    entry.size = size_result.value();

    if (entry.kind == EntryKind::Directory && entry.size != 0) {
        return malformed("Directory entry declares non-zero size");
    }
    return Ok(Frame{std::move(entry)});
}

Result<Frame> decode_chunk(const std::vector<std::uint8_t>& payload, std::size_t& cursor) {
    auto index_result = read_uint64(payload, cursor);
    if (index_result.is_error()) {
        return Err<Frame>(index_result.error());
    }

    const std::size_t data_size = payload.size() - cursor;
    if (data_size == 0) {
        return malformed("Data chunk carries no bytes");
    }
    if (data_size > kMaxChunkSize) {
        return malformed("Data chunk exceeds maximum chunk size");
    }

    DataChunk chunk;
    chunk.entry_index = index_result.value();
    chunk.data.assign(payload.begin() + static_cast<std::ptrdiff_t>(cursor), payload.end());
    cursor = payload.size();
    return Ok(Frame{std::move(chunk)});
}

Result<Frame> decode_handshake(const std::vector<std::uint8_t>& payload, std::size_t& cursor) {
    auto items_result = read_uint64(payload, cursor);
    if (items_result.is_error()) {
        return Err<Frame>(items_result.error());
    }
    auto bytes_result = read_uint64(payload, cursor);
    if (bytes_result.is_error()) {
        return Err<Frame>(bytes_result.error());
    }
    return Ok(Frame{Handshake{items_result.value(), bytes_result.value()}});
}

Result<Frame> decode_ack(const std::vector<std::uint8_t>& payload, std::size_t& cursor) {
    auto items_result = read_uint64(payload, cursor);
    if (items_result.is_error()) {
        return Err<Frame>(items_result.error());
    }
    auto bytes_result = read_uint64(payload, cursor);
    if (bytes_result.is_error()) {
        return Err<Frame>(bytes_result.error());
    }
    auto matched_result = read_uint8(payload, cursor);
    if (matched_result.is_error()) {
        return Err<Frame>(matched_result.error());
    }
    if (matched_result.value() > 1) {
        return malformed("Acknowledgment matched flag out of range");
    }
    return Ok(Frame{Acknowledgment{items_result.value(), bytes_result.value(), matched_result.value() == 1}});
}

} // namespace

std::vector<std::uint8_t> FrameCodec::encode_payload(const Frame& frame) {
    std::vector<std::uint8_t> payload;
    std::visit([&payload](const auto& typed) { encode_into(payload, typed); }, frame);
    return payload;
}

std::vector<std::uint8_t> FrameCodec::encode(const Frame& frame) {
    const auto payload = encode_payload(frame);

    std::vector<std::uint8_t> buffer;
    buffer.reserve(kFramePrefixSize + payload.size());
    write_uint8(buffer, static_cast<std::uint8_t>(frame_type(frame)));
    write_uint32(buffer, static_cast<std::uint32_t>(payload.size()));
    buffer.insert(buffer.end(), payload.begin(), payload.end());
    return buffer;
}

bool FrameCodec::is_wire_string(const std::string& text) {
    return text.size() <= kMaxPathLength && is_valid_utf8(text);
}

bool FrameCodec::length_is_valid(FrameType type, std::uint32_t length) noexcept {
    switch (type) {
        case FrameType::Header:
            return length >= kHeaderFixedSize && length <= kHeaderFixedSize + kMaxPathLength;
        case FrameType::FolderEntryHeader:
            return length >= kEntryFixedSize && length <= kEntryFixedSize + kMaxPathLength;
        case FrameType::DataChunk:
            return length > 8 && length <= kMaxPayloadSize;
        case FrameType::Handshake:
            return length == kHandshakeSize;
        case FrameType::Acknowledgment:
            return length == kAckSize;
    }
    return false;
}

Result<FramePrefix> FrameCodec::decode_prefix(const std::uint8_t* prefix) {
    const std::uint8_t tag = prefix[0];
    if (tag < static_cast<std::uint8_t>(FrameType::Header) ||
        tag > static_cast<std::uint8_t>(FrameType::Acknowledgment)) {
        std::ostringstream oss;
        oss << "Unknown frame type 0x" << std::hex << static_cast<int>(tag);
        return Err<FramePrefix>(ErrorCode::MalformedFrame, oss.str());
    }

    FramePrefix result;
    result.type = static_cast<FrameType>(tag);
    result.length = (static_cast<std::uint32_t>(prefix[1]) << 24) |
                    (static_cast<std::uint32_t>(prefix[2]) << 16) |
                    (static_cast<std::uint32_t>(prefix[3]) << 8) |
                    static_cast<std::uint32_t>(prefix[4]);

    if (!length_is_valid(result.type, result.length)) {
        return Err<FramePrefix>(ErrorCode::MalformedFrame,
                                std::string("Invalid length ") + std::to_string(result.length) +
                                    " for " + to_string(result.type) + " frame");
    }
    return Ok(result);
}

Result<Frame> FrameCodec::decode_payload(FrameType type, const std::vector<std::uint8_t>& payload) {
    if (payload.size() > kMaxPayloadSize ||
        !length_is_valid(type, static_cast<std::uint32_t>(payload.size()))) {
        return malformed(std::string("Invalid length ") + std::to_string(payload.size()) +
                         " for " + to_string(type) + " frame");
    }

    std::size_t cursor = 0;
    auto result = [&]() -> Result<Frame> {
        switch (type) {
            case FrameType::Header: return decode_header(payload, cursor);
            case FrameType::FolderEntryHeader: return decode_entry(payload, cursor);
            case FrameType::DataChunk: return decode_chunk(payload, cursor);
            case FrameType::Handshake: return decode_handshake(payload, cursor);
            case FrameType::Acknowledgment: return decode_ack(payload, cursor);
        }
        return malformed("Unknown frame type");
    }();

    if (result.is_ok() && cursor != payload.size()) {
        return malformed(std::to_string(payload.size() - cursor) + " trailing bytes in " +
                         to_string(type) + " frame");
    }
    return result;
}

Result<Frame> FrameCodec::decode(const std::vector<std::uint8_t>& bytes) {
    if (bytes.size() < kFramePrefixSize) {
        return malformed("Frame shorter than its prefix");
    }

    auto prefix = decode_prefix(bytes.data());
    if (prefix.is_error()) {
        return Err<Frame>(prefix.error());
    }

    const std::size_t expected = kFramePrefixSize + prefix.value().length;
    if (bytes.size() != expected) {
        return malformed("Frame declares " + std::to_string(prefix.value().length) +
                         " payload bytes but buffer holds " +
                         std::to_string(bytes.size() - kFramePrefixSize));
    }

    std::vector<std::uint8_t> payload(bytes.begin() + kFramePrefixSize, bytes.end());
    return decode_payload(prefix.value().type, payload);
}

} // namespace lft::protocol
