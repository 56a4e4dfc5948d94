#include "lft/protocol/frame.hpp"

#include <sstream>

namespace lft::protocol {
namespace {

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

FrameType frame_type(const Frame& frame) {
    return std::visit(overloaded{
        [](const Header&) { return FrameType::Header; },
        [](const FolderEntryHeader&) { return FrameType::FolderEntryHeader; },
        [](const DataChunk&) { return FrameType::DataChunk; },
        [](const Handshake&) { return FrameType::Handshake; },
        [](const Acknowledgment&) { return FrameType::Acknowledgment; },
    }, frame);
}

const char* to_string(FrameType type) {
    switch (type) {
        case FrameType::Header: return "Header";
        case FrameType::FolderEntryHeader: return "FolderEntryHeader";
        case FrameType::DataChunk: return "DataChunk";
        case FrameType::Handshake: return "Handshake";
        case FrameType::Acknowledgment: return "Acknowledgment";
    }
    return "Unknown";
}

const char* to_string(TransferKind kind) {
    return kind == TransferKind::File ? "file" : "folder";
}

const char* to_string(EntryKind kind) {
    return kind == EntryKind::File ? "file" : "directory";
}

std::string describe(const Frame& frame) {
    std::ostringstream oss;
    std::visit(overloaded{
        [&oss](const Header& h) {
            oss << "Header{kind=" << to_string(h.kind) << ", name=" << h.name
                << ", size=" << h.size << ", items=" << h.item_count << "}";
        },
        [&oss](const FolderEntryHeader& e) {
            oss << "FolderEntryHeader{kind=" << to_string(e.kind) << ", path=" << e.relative_path
                << ", size=" << e.size << "}";
        },
        [&oss](const DataChunk& c) {
            oss << "DataChunk{entry=" << c.entry_index << ", bytes=" << c.data.size() << "}";
        },
        [&oss](const Handshake& h) {
            oss << "Handshake{items=" << h.total_items << ", bytes=" << h.total_bytes << "}";
        },
        [&oss](const Acknowledgment& a) {
            oss << "Acknowledgment{items=" << a.received_items << ", bytes=" << a.received_bytes
                << ", matched=" << (a.matched ? "true" : "false") << "}";
        },
    }, frame);
    return oss.str();
}

} // namespace lft::protocol
