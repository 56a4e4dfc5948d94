#pragma once

#include "lft/core/result.hpp"
#include "lft/events/events.hpp"
#include "lft/protocol/frame.hpp"
#include "lft/transfer/progress.hpp"
#include "lft/transfer/session.hpp"
#include "lft/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <set>
#include <string>

namespace lft::transfer {

struct ReceiverOptions {
    std::filesystem::path receive_root = ".";
    std::chrono::milliseconds progress_interval{500};
};

/**
 * @brief Receive side of one transfer
 *
 * Frames are fed in arrival order through handle(). Single files land in
 * <root>/received_files/<name> (renamed to <stem>_<n><ext> if taken), folders
 * in <root>/received_folders/<name>, merging into an existing folder.
 * Folder entries whose cleaned names collide with a file already written in
 * the same transfer are renamed the same way instead of overwriting it.
 *
 * A failing frame aborts the session before handle() returns its error.
 * Partially written files stay on disk and are never reported complete.
 */
class Receiver {
public:
    static constexpr const char* kFilesDirectory = "received_files";
    static constexpr const char* kFoldersDirectory = "received_folders";

    using Reply = std::optional<protocol::Frame>;

    explicit Receiver(ReceiverOptions options, events::EventSink sink = {});

    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    /// Idle -> AwaitingHeader
    Result<void> begin(std::string peer);

    /**
     * Process one frame.
     *
     * RETURNS: the frame to send back, if any (the Acknowledgment after a
     * Handshake, sent even when verification fails), or the error that
     * aborted the session.
     */
    Result<Reply> handle(const protocol::Frame& frame);

    /// Abort because of a transport problem; an early end of stream inside a file is a SizeMismatch
    void fail(Error error);

    [[nodiscard]] bool finished() const noexcept { return session_.finished(); }
    [[nodiscard]] const TransferSession& session() const noexcept { return session_; }

    /// Destination file or folder, empty until the Header is accepted
    [[nodiscard]] const std::filesystem::path& destination() const noexcept { return destination_; }

    [[nodiscard]] TransferOutcome outcome() const;

private:
    struct OpenEntry {
        std::uint64_t index = 0;
        std::string relative_path;
        std::filesystem::path local_path;
        std::uint64_t size = 0;
        std::uint64_t received = 0;
    };

    Result<Reply> on_header(const protocol::Header& header);
    Result<Reply> on_entry(const protocol::FolderEntryHeader& entry);
    Result<Reply> on_chunk(const protocol::DataChunk& chunk);
    Result<Reply> on_handshake(const protocol::Handshake& handshake);

    Result<void> prepare_file_destination(const std::string& name);
    Result<void> prepare_folder_destination(const std::string& name);
    Result<void> open_file(const std::filesystem::path& path);
    Result<void> finish_file();

    Result<Reply> reject(Error error);
    Error unexpected(const char* frame_name) const;
    Error truncated() const;
    void close_file();
    void emit(events::TransferEvent event) const;

    ReceiverOptions options_;
    events::EventSink sink_;
    TransferSession session_;
    ProgressReporter progress_;

    std::optional<TransferKind> kind_;
    std::string name_;
    std::filesystem::path destination_;
    std::ofstream file_;
    std::optional<OpenEntry> current_;
    std::set<std::filesystem::path> written_files_;
    std::uint64_t next_index_ = 0;
    std::optional<VerificationResult> verification_;
};

} // namespace lft::transfer
