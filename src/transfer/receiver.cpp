#include "lft/transfer/receiver.hpp"
#include "lft/transfer/path_guard.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace fs = std::filesystem;

namespace lft::transfer {
namespace {

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

Result<Receiver::Reply> no_reply() {
    return Ok(Receiver::Reply{});
}

Result<void> ensure_directory(const fs::path& directory) {
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        return Err<void>(ErrorCode::IOFailure,
                         "Failed to create directory " + directory.string() + ": " + ec.message());
    }
    if (!fs::is_directory(directory, ec)) {
        return Err<void>(ErrorCode::IOFailure, directory.string() + " exists and is not a directory");
    }
    return Ok();
}

} // namespace

Receiver::Receiver(ReceiverOptions options, events::EventSink sink)
    : options_(std::move(options)),
      sink_(std::move(sink)),
      session_(Role::Receiver),
      progress_(session_, sink_, options_.progress_interval) {}

Result<void> Receiver::begin(std::string peer) {
    return session_.start(std::move(peer));
}

Result<Receiver::Reply> Receiver::handle(const protocol::Frame& frame) {
    if (finished()) {
        return Err<Reply>(ErrorCode::ProtocolViolation,
                          std::string("Frame after the transfer ended: ") + protocol::describe(frame));
    }

    return std::visit(overloaded{
        [this](const protocol::Header& header) { return on_header(header); },
        [this](const protocol::FolderEntryHeader& entry) { return on_entry(entry); },
        [this](const protocol::DataChunk& chunk) { return on_chunk(chunk); },
        [this](const protocol::Handshake& handshake) { return on_handshake(handshake); },
        [this](const protocol::Acknowledgment&) { return reject(unexpected("Acknowledgment")); },
    }, frame);
}

// ════════════════════════════════════════════════════════════════════════════
// Frame handlers
// ════════════════════════════════════════════════════════════════════════════

Result<Receiver::Reply> Receiver::on_header(const protocol::Header& header) {
    if (session_.phase() != TransferPhase::AwaitingHeader) {
        return reject(unexpected("Header"));
    }

    auto name = PathGuard::sanitize_name(header.name);
    if (name.is_error()) {
        return reject(name.error());
    }

    kind_ = header.kind;
    name_ = name.value();
    session_.set_expected(header.item_count, header.size);

    auto prepared = header.kind == TransferKind::File ? prepare_file_destination(name_)
                                                      : prepare_folder_destination(name_);
    if (prepared.is_error()) {
        return reject(prepared.error());
    }

    events::TransferStarted started;
    started.role = Role::Receiver;
    started.kind = header.kind;
    started.name = name_;
    started.expected_items = header.item_count;
    started.expected_bytes = header.size;
    started.local_path = destination_;
    started.peer = session_.peer();
    emit(std::move(started));

    if (header.kind == TransferKind::Folder) {
        if (auto moved = session_.transition_to(TransferPhase::ReceivingEntries); moved.is_error()) {
            return reject(moved.error());
        }
        return no_reply();
    }

    if (auto moved = session_.transition_to(TransferPhase::ReceivingData); moved.is_error()) {
        return reject(moved.error());
    }
    current_ = OpenEntry{next_index_++, name_, destination_, header.size, 0};
    emit(events::EntryStarted{current_->index, EntryKind::File, name_, header.size});

    if (header.size == 0) {
        if (auto done = finish_file(); done.is_error()) {
            return reject(done.error());
        }
    }
    return no_reply();
}

Result<Receiver::Reply> Receiver::on_entry(const protocol::FolderEntryHeader& entry) {
    if (kind_ == TransferKind::Folder && session_.phase() == TransferPhase::ReceivingData) {
        return reject(truncated());
    }
    if (session_.phase() != TransferPhase::ReceivingEntries) {
        return reject(unexpected("FolderEntryHeader"));
    }

    auto local = PathGuard::resolve(destination_, entry.relative_path);
    if (local.is_error()) {
        return reject(local.error());
    }
    const std::uint64_t index = next_index_++;

    if (entry.kind == EntryKind::Directory) {
        if (auto created = ensure_directory(local.value()); created.is_error()) {
            return reject(created.error());
        }
        session_.counters().record_item();
        emit(events::EntryCompleted{index, EntryKind::Directory, entry.relative_path, 0, local.value()});
        progress_.tick();
        return no_reply();
    }

    const auto parent = local.value().parent_path();
    std::error_code ec;
    if (!fs::is_directory(parent, ec)) {
        spdlog::warn("Parent of '{}' was not announced, creating it", entry.relative_path);
        if (auto created = ensure_directory(parent); created.is_error()) {
            return reject(created.error());
        }
    }

    fs::path target = local.value();
    if (written_files_.count(target) != 0) {
        auto renamed = PathGuard::unique_path(target);
        if (renamed.is_error()) {
            return reject(renamed.error());
        }
        spdlog::warn("'{}' maps onto a file already received in this transfer, saving as '{}'",
                     entry.relative_path, renamed.value().filename().string());
        target = renamed.value();
    }

    if (auto opened = open_file(target); opened.is_error()) {
        return reject(opened.error());
    }
    written_files_.insert(target);
    current_ = OpenEntry{index, entry.relative_path, target, entry.size, 0};
    emit(events::EntryStarted{index, EntryKind::File, entry.relative_path, entry.size});

    if (entry.size == 0) {
        if (auto done = finish_file(); done.is_error()) {
            return reject(done.error());
        }
        return no_reply();
    }

    if (auto moved = session_.transition_to(TransferPhase::ReceivingData); moved.is_error()) {
        return reject(moved.error());
    }
    return no_reply();
}

Result<Receiver::Reply> Receiver::on_chunk(const protocol::DataChunk& chunk) {
    if (session_.phase() != TransferPhase::ReceivingData || !current_) {
        return reject(unexpected("DataChunk"));
    }
    if (chunk.entry_index != current_->index) {
        return reject(Error(ErrorCode::ProtocolViolation,
                            "DataChunk for entry " + std::to_string(chunk.entry_index) +
                                " while receiving entry " + std::to_string(current_->index)));
    }

    const std::uint64_t incoming = chunk.data.size();
    if (current_->received + incoming > current_->size) {
        return reject(Error(ErrorCode::SizeMismatch,
                            "'" + current_->relative_path + "' overflows its declared " +
                                std::to_string(current_->size) + " bytes"));
    }

    file_.write(reinterpret_cast<const char*>(chunk.data.data()),
                static_cast<std::streamsize>(chunk.data.size()));
    if (!file_) {
        return reject(Error(ErrorCode::IOFailure,
                            "Failed to write " + current_->local_path.string()));
    }

    current_->received += incoming;
    session_.counters().record_bytes(incoming);
    progress_.tick();

    if (current_->received == current_->size) {
        if (auto done = finish_file(); done.is_error()) {
            return reject(done.error());
        }
    }
    return no_reply();
}

Result<Receiver::Reply> Receiver::on_handshake(const protocol::Handshake& handshake) {
    if (kind_ == TransferKind::Folder && session_.phase() == TransferPhase::ReceivingData) {
        // Tell the sender how far we got before giving up on the truncated entry
        verification_ = session_.counters().verify(handshake.total_items, handshake.total_bytes);
        verification_->matched = false;
        const Error error = truncated();
        close_file();
        session_.abort(error);
        return Ok(Reply{protocol::Acknowledgment{verification_->items_received,
                                                 verification_->bytes_received, false}});
    }
    if (session_.phase() != TransferPhase::ReceivingEntries) {
        return reject(unexpected("Handshake"));
    }

    for (auto next : {TransferPhase::AwaitingHandshake, TransferPhase::Verifying}) {
        if (auto moved = session_.transition_to(next); moved.is_error()) {
            return reject(moved.error());
        }
    }

    VerificationResult result = session_.counters().verify(handshake.total_items, handshake.total_bytes);
    const bool header_agrees = handshake.total_items == session_.expected_items() &&
                               handshake.total_bytes == session_.expected_bytes();
    if (!header_agrees) {
        spdlog::warn("Handshake totals ({} items / {} bytes) differ from the Header ({} / {})",
                     handshake.total_items, handshake.total_bytes,
                     session_.expected_items(), session_.expected_bytes());
        result.matched = false;
    }
    verification_ = result;

    const protocol::Acknowledgment ack{result.items_received, result.bytes_received, result.matched};
    if (!result.matched) {
        std::string message = result.describe();
        if (!header_agrees) {
            message += " (declared totals changed after the Header)";
        }
        session_.abort(Error(ErrorCode::VerificationMismatch, std::move(message)));
        return Ok(Reply{ack});
    }

    if (auto moved = session_.transition_to(TransferPhase::Complete); moved.is_error()) {
        return reject(moved.error());
    }
    progress_.emit();
    spdlog::info("Folder '{}' verified: {}", name_, result.describe());
    return Ok(Reply{ack});
}

// ════════════════════════════════════════════════════════════════════════════
// Destination handling
// ════════════════════════════════════════════════════════════════════════════

Result<void> Receiver::prepare_file_destination(const std::string& name) {
    const fs::path directory = options_.receive_root / kFilesDirectory;
    if (auto created = ensure_directory(directory); created.is_error()) {
        return created;
    }

    auto path = PathGuard::unique_path(directory / name);
    if (path.is_error()) {
        return Err<void>(path.error());
    }
    if (path.value().filename() != name) {
        spdlog::info("'{}' already exists, saving as '{}'", name, path.value().filename().string());
    }
    destination_ = path.value();
    return open_file(destination_);
}

Result<void> Receiver::prepare_folder_destination(const std::string& name) {
    const fs::path directory = options_.receive_root / kFoldersDirectory / name;
    std::error_code ec;
    if (fs::exists(directory, ec)) {
        spdlog::warn("Folder {} already exists, merging into it", directory.string());
    }
    if (auto created = ensure_directory(directory); created.is_error()) {
        return created;
    }
    destination_ = directory;
    return Ok();
}

Result<void> Receiver::open_file(const fs::path& path) {
    file_.open(path, std::ios::binary | std::ios::trunc);
    if (!file_) {
        file_.clear();
        return Err<void>(ErrorCode::IOFailure, "Failed to open " + path.string() + " for writing");
    }
    return Ok();
}

Result<void> Receiver::finish_file() {
    file_.close();
    if (file_.fail()) {
        file_.clear();
        return Err<void>(ErrorCode::IOFailure, "Failed to close " + current_->local_path.string());
    }

    session_.counters().record_item();
    emit(events::EntryCompleted{current_->index, EntryKind::File, current_->relative_path,
                                current_->size, current_->local_path});
    current_.reset();

    if (kind_ == TransferKind::File) {
        if (auto moved = session_.transition_to(TransferPhase::Complete); moved.is_error()) {
            return moved;
        }
        progress_.emit();
        spdlog::info("Received '{}' ({} bytes)", name_, session_.counters().bytes());
        return Ok();
    }

    progress_.tick();
    return session_.transition_to(TransferPhase::ReceivingEntries);
}

// ════════════════════════════════════════════════════════════════════════════
// Failure paths
// ════════════════════════════════════════════════════════════════════════════

void Receiver::fail(Error error) {
    if (finished()) {
        return;
    }
    if (error.code == ErrorCode::ConnectionClosed && current_ &&
        session_.phase() == TransferPhase::ReceivingData) {
        error = truncated();
    } else if (current_) {
        error.message += " (while receiving '" + current_->relative_path + "')";
    }
    close_file();
    session_.abort(std::move(error));
}

Result<Receiver::Reply> Receiver::reject(Error error) {
    close_file();
    session_.abort(error);
    return Err<Reply>(std::move(error));
}

Error Receiver::unexpected(const char* frame_name) const {
    return Error(ErrorCode::ProtocolViolation,
                 std::string("Unexpected ") + frame_name + " in phase " + to_string(session_.phase()));
}

Error Receiver::truncated() const {
    if (!current_) {
        return Error(ErrorCode::SizeMismatch, "Entry ended before its declared size");
    }
    return Error(ErrorCode::SizeMismatch,
                 "'" + current_->relative_path + "' ended after " + std::to_string(current_->received) +
                     " of " + std::to_string(current_->size) + " bytes");
}

void Receiver::close_file() {
    if (file_.is_open()) {
        file_.close();
    }
    file_.clear();
}

void Receiver::emit(events::TransferEvent event) const {
    if (sink_) {
        sink_(std::move(event));
    }
}

TransferOutcome Receiver::outcome() const {
    TransferOutcome outcome;
    outcome.role = Role::Receiver;
    outcome.kind = kind_;
    outcome.phase = session_.phase();
    outcome.error = session_.error();
    outcome.verification = verification_;
    outcome.items = session_.counters().items();
    outcome.bytes = session_.counters().bytes();
    outcome.local_path = destination_;
    outcome.peer = session_.peer();
    outcome.elapsed = session_.elapsed();
    return outcome;
}

} // namespace lft::transfer
