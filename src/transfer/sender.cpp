#include "lft/transfer/sender.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

namespace lft::transfer {

Sender::Sender(TransferRequest request, SenderOptions options, events::EventSink sink)
    : request_(std::move(request)),
      options_(options),
      sink_(std::move(sink)),
      session_(Role::Sender),
      progress_(session_, sink_, options_.progress_interval) {}

TransferOutcome Sender::run(protocol::FrameChannel& channel) {
    if (options_.chunk_size == 0 || options_.chunk_size > protocol::kMaxChunkSize) {
        session_.abort(Error(ErrorCode::InvalidArgument,
                             "Chunk size must be between 1 and " +
                                 std::to_string(protocol::kMaxChunkSize) + " bytes"));
        return outcome();
    }

    if (auto started = session_.start(channel.stream().peer()); started.is_error()) {
        session_.abort(started.error());
        return outcome();
    }
    session_.set_expected(request_.declared_item_count, request_.declared_total_bytes);

    events::TransferStarted started;
    started.role = Role::Sender;
    started.kind = request_.kind;
    started.name = request_.name;
    started.expected_items = request_.declared_item_count;
    started.expected_bytes = request_.declared_total_bytes;
    started.local_path = request_.root_path;
    started.peer = session_.peer();
    emit(std::move(started));

    auto result = request_.kind == TransferKind::File ? send_single_file(channel) : send_folder(channel);
    if (result.is_error()) {
        session_.abort(result.error());
    }
    return outcome();
}

Result<void> Sender::send_single_file(protocol::FrameChannel& channel) {
    const protocol::Header header{TransferKind::File, request_.name, request_.declared_total_bytes, 1};
    if (auto sent = channel.send(header); sent.is_error()) {
        return sent;
    }
    if (auto moved = session_.transition_to(TransferPhase::SendingData); moved.is_error()) {
        return moved;
    }

    emit(events::EntryStarted{0, EntryKind::File, request_.name, request_.declared_total_bytes});
    if (auto sent = send_file_data(channel, request_.root_path, 0, request_.declared_total_bytes);
        sent.is_error()) {
        return sent;
    }

    session_.counters().record_item();
    emit(events::EntryCompleted{0, EntryKind::File, request_.name, request_.declared_total_bytes,
                                request_.root_path});

    if (auto moved = session_.transition_to(TransferPhase::Complete); moved.is_error()) {
        return moved;
    }
    progress_.emit();
    spdlog::info("Sent '{}' ({} bytes) to {}", request_.name, request_.declared_total_bytes,
                 session_.peer());
    return Ok();
}

Result<void> Sender::send_folder(protocol::FrameChannel& channel) {
    const auto& manifest = request_.manifest;
    const protocol::Header header{TransferKind::Folder, request_.name, manifest.total_bytes,
                                  manifest.total_items};
    if (auto sent = channel.send(header); sent.is_error()) {
        return sent;
    }
    if (auto moved = session_.transition_to(TransferPhase::SendingEntries); moved.is_error()) {
        return moved;
    }

    for (const auto& entry : manifest.entries) {
        if (auto sent = send_entry(channel, entry); sent.is_error()) {
            return sent;
        }
    }

    if (auto sent = channel.send(protocol::Handshake{manifest.total_items, manifest.total_bytes});
        sent.is_error()) {
        return sent;
    }
    if (auto moved = session_.transition_to(TransferPhase::AwaitingAcknowledgment); moved.is_error()) {
        return moved;
    }
    return await_acknowledgment(channel);
}

Result<void> Sender::send_entry(protocol::FrameChannel& channel, const ManifestEntry& entry) {
    const protocol::FolderEntryHeader frame{entry.kind, entry.relative_path, entry.size};
    if (auto sent = channel.send(frame); sent.is_error()) {
        return sent;
    }

    const fs::path source = request_.root_path / fs::path(entry.relative_path);
    if (entry.kind == EntryKind::File) {
        emit(events::EntryStarted{entry.sequence_index, entry.kind, entry.relative_path, entry.size});
        if (entry.size > 0) {
            if (auto moved = session_.transition_to(TransferPhase::SendingData); moved.is_error()) {
                return moved;
            }
        }
        if (auto sent = send_file_data(channel, source, entry.sequence_index, entry.size); sent.is_error()) {
            return sent;
        }
        if (auto moved = session_.transition_to(TransferPhase::SendingEntries); moved.is_error()) {
            return moved;
        }
    }

    session_.counters().record_item();
    emit(events::EntryCompleted{entry.sequence_index, entry.kind, entry.relative_path, entry.size, source});
    progress_.tick();
    return Ok();
}

Result<void> Sender::send_file_data(protocol::FrameChannel& channel,
                                    const fs::path& source,
                                    std::uint64_t entry_index,
                                    std::uint64_t declared_size) {
    std::ifstream input(source, std::ios::binary);
    if (!input) {
        return Err<void>(ErrorCode::IOFailure, "Failed to open source file: " + source.string());
    }

    std::uint64_t remaining = declared_size;
    while (remaining > 0) {
        const auto wanted = static_cast<std::size_t>(
            std::min<std::uint64_t>(remaining, options_.chunk_size));

        protocol::DataChunk chunk;
        chunk.entry_index = entry_index;
        chunk.data.resize(wanted);
        input.read(reinterpret_cast<char*>(chunk.data.data()), static_cast<std::streamsize>(wanted));
        const auto bytes_read = static_cast<std::size_t>(input.gcount());
        if (bytes_read == 0) {
            return Err<void>(ErrorCode::SizeMismatch,
                             source.string() + " shrank to " + std::to_string(declared_size - remaining) +
                                 " of " + std::to_string(declared_size) + " bytes since it was listed");
        }
        chunk.data.resize(bytes_read);

        if (auto sent = channel.send(protocol::Frame{std::move(chunk)}); sent.is_error()) {
            return sent;
        }
        remaining -= bytes_read;
        session_.counters().record_bytes(bytes_read);
        progress_.tick();
    }

    if (input.peek() != std::ifstream::traits_type::eof()) {
        return Err<void>(ErrorCode::SizeMismatch,
                         source.string() + " grew beyond its listed " + std::to_string(declared_size) +
                             " bytes");
    }
    return Ok();
}

Result<void> Sender::await_acknowledgment(protocol::FrameChannel& channel) {
    auto reply = channel.receive(options_.ack_timeout);
    if (reply.is_error()) {
        if (reply.error().code == ErrorCode::Timeout) {
            return Err<void>(ErrorCode::Timeout,
                             "No Acknowledgment within " + std::to_string(options_.ack_timeout.count()) +
                                 " ms");
        }
        return Err<void>(reply.error());
    }

    const auto* ack = std::get_if<protocol::Acknowledgment>(&reply.value());
    if (ack == nullptr) {
        return Err<void>(ErrorCode::ProtocolViolation,
                         "Expected Acknowledgment, got " + protocol::describe(reply.value()));
    }

    VerificationResult result;
    result.items_expected = request_.manifest.total_items;
    result.bytes_expected = request_.manifest.total_bytes;
    result.items_received = ack->received_items;
    result.bytes_received = ack->received_bytes;
    result.matched = ack->matched && result.items_received == result.items_expected &&
                     result.bytes_received == result.bytes_expected;
    verification_ = result;

    if (!result.matched) {
        return Err<void>(ErrorCode::VerificationMismatch, "Receiver reported " + result.describe());
    }

    if (auto moved = session_.transition_to(TransferPhase::Complete); moved.is_error()) {
        return moved;
    }
    progress_.emit();
    spdlog::info("Folder '{}' acknowledged by {}: {}", request_.name, session_.peer(), result.describe());
    return Ok();
}

void Sender::emit(events::TransferEvent event) const {
    if (sink_) {
        sink_(std::move(event));
    }
}

TransferOutcome Sender::outcome() const {
    TransferOutcome outcome;
    outcome.role = Role::Sender;
    outcome.kind = request_.kind;
    outcome.phase = session_.phase();
    outcome.error = session_.error();
    outcome.verification = verification_;
    outcome.items = session_.counters().items();
    outcome.bytes = session_.counters().bytes();
    outcome.local_path = request_.root_path;
    outcome.peer = session_.peer();
    outcome.elapsed = session_.elapsed();
    return outcome;
}

} // namespace lft::transfer
