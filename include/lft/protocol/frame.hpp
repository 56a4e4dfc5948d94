#pragma once

/**
 * @file frame.hpp
 * @brief Wire messages exchanged between sender and receiver
 *
 * Every frame on the wire is:
 *   [type: 1 byte] [length: 4 bytes, big-endian] [payload: length bytes]
 *
 * The receiver therefore always knows how many bytes to read next and never
 * has to scan for delimiters.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace lft::protocol {

constexpr std::uint8_t kProtocolVersion = 1;

constexpr std::size_t kFramePrefixSize = 5;
constexpr std::size_t kDefaultChunkSize = 64 * 1024;
constexpr std::size_t kMaxChunkSize = 16 * 1024 * 1024;
constexpr std::size_t kMaxPathLength = 4096;
/// Largest payload any frame may declare (DataChunk: index + bytes)
constexpr std::size_t kMaxPayloadSize = kMaxChunkSize + 8;

enum class FrameType : std::uint8_t {
    Header = 0x01,
    FolderEntryHeader = 0x02,
    DataChunk = 0x03,
    Handshake = 0x04,
    Acknowledgment = 0x05
};

enum class TransferKind : std::uint8_t {
    File = 0,
    Folder = 1
};

enum class EntryKind : std::uint8_t {
    File = 0,
    Directory = 1
};

/**
 * @brief First frame of every transfer
 *
 * File mode: name is the file's base name, size its byte count, item_count 1.
 * Folder mode: name is the root folder name; size and item_count carry the
 * declared totals for progress display. The Handshake stays authoritative.
 */
struct Header {
    TransferKind kind = TransferKind::File;
    std::string name;
    std::uint64_t size = 0;
    std::uint64_t item_count = 1;

    bool operator==(const Header& o) const {
        return kind == o.kind && name == o.name && size == o.size && item_count == o.item_count;
    }
};

/// One per manifest entry, sent before that entry's data
struct FolderEntryHeader {
    EntryKind kind = EntryKind::File;
    std::string relative_path;  ///< '/'-separated, relative to the root folder
    std::uint64_t size = 0;     ///< Always 0 for directories

    bool operator==(const FolderEntryHeader& o) const {
        return kind == o.kind && relative_path == o.relative_path && size == o.size;
    }
};

struct DataChunk {
    std::uint64_t entry_index = 0;  ///< Sequence index of the entry this data belongs to
    std::vector<std::uint8_t> data;

    bool operator==(const DataChunk& o) const {
        return entry_index == o.entry_index && data == o.data;
    }
};

/// Sender's final declaration of folder totals
struct Handshake {
    std::uint64_t total_items = 0;
    std::uint64_t total_bytes = 0;

    bool operator==(const Handshake& o) const {
        return total_items == o.total_items && total_bytes == o.total_bytes;
    }
};

/// Receiver's reply to Handshake
struct Acknowledgment {
    std::uint64_t received_items = 0;
    std::uint64_t received_bytes = 0;
    bool matched = false;

    bool operator==(const Acknowledgment& o) const {
        return received_items == o.received_items && received_bytes == o.received_bytes &&
               matched == o.matched;
    }
};

using Frame = std::variant<Header, FolderEntryHeader, DataChunk, Handshake, Acknowledgment>;

FrameType frame_type(const Frame& frame);

const char* to_string(FrameType type);
const char* to_string(TransferKind kind);
const char* to_string(EntryKind kind);

/// One-line description for debug logs (never includes chunk contents)
std::string describe(const Frame& frame);

} // namespace lft::protocol
