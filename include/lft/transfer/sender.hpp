#pragma once

#include "lft/core/result.hpp"
#include "lft/events/events.hpp"
#include "lft/protocol/frame.hpp"
#include "lft/protocol/frame_channel.hpp"
#include "lft/transfer/progress.hpp"
#include "lft/transfer/session.hpp"
#include "lft/transfer/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace lft::transfer {

struct SenderOptions {
    std::size_t chunk_size = protocol::kDefaultChunkSize;
    std::chrono::milliseconds ack_timeout{30000};
    std::chrono::milliseconds progress_interval{500};
};

/**
 * @brief Send side of one transfer
 *
 * File:   Header, DataChunk*
 * Folder: Header, (FolderEntryHeader, DataChunk*)* in manifest order,
 *         Handshake, then waits up to ack_timeout for the Acknowledgment
 *
 * Files are re-read at send time; one that no longer matches its
 * snapshotted size aborts the transfer with SizeMismatch.
 */
class Sender {
public:
    Sender(TransferRequest request, SenderOptions options, events::EventSink sink = {});

    Sender(const Sender&) = delete;
    Sender& operator=(const Sender&) = delete;

    /// Drives the whole transfer; returns once the session is Complete or Aborted
    TransferOutcome run(protocol::FrameChannel& channel);

    [[nodiscard]] bool finished() const noexcept { return session_.finished(); }
    [[nodiscard]] const TransferSession& session() const noexcept { return session_; }

    [[nodiscard]] TransferOutcome outcome() const;

private:
    Result<void> send_single_file(protocol::FrameChannel& channel);
    Result<void> send_folder(protocol::FrameChannel& channel);
    Result<void> send_entry(protocol::FrameChannel& channel, const ManifestEntry& entry);
    Result<void> send_file_data(protocol::FrameChannel& channel,
                                const std::filesystem::path& source,
                                std::uint64_t entry_index,
                                std::uint64_t declared_size);
    Result<void> await_acknowledgment(protocol::FrameChannel& channel);

    void emit(events::TransferEvent event) const;

    TransferRequest request_;
    SenderOptions options_;
    events::EventSink sink_;
    TransferSession session_;
    ProgressReporter progress_;
    std::optional<VerificationResult> verification_;
};

} // namespace lft::transfer
