#pragma once

#include "lft/core/error.hpp"
#include "lft/protocol/frame.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace lft::transfer {

using protocol::EntryKind;
using protocol::TransferKind;

enum class Role {
    Sender,
    Receiver
};

/**
 * Receiver: Idle -> AwaitingHeader -> [ReceivingEntries] -> ReceivingData
 *           -> [AwaitingHandshake -> Verifying] -> Complete
 * Sender:   Idle -> SendingHeader -> [SendingEntries] -> SendingData
 *           -> [AwaitingAcknowledgment] -> Complete
 * Bracketed phases are folder mode only. Aborted is reachable from any
 * non-terminal phase.
 */
enum class TransferPhase {
    Idle,
    AwaitingHeader,
    ReceivingEntries,
    ReceivingData,
    AwaitingHandshake,
    Verifying,
    SendingHeader,
    SendingEntries,
    SendingData,
    AwaitingAcknowledgment,
    Complete,
    Aborted
};

inline const char* to_string(Role role) {
    return role == Role::Sender ? "sender" : "receiver";
}

inline const char* to_string(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::Idle: return "Idle";
        case TransferPhase::AwaitingHeader: return "AwaitingHeader";
        case TransferPhase::ReceivingEntries: return "ReceivingEntries";
        case TransferPhase::ReceivingData: return "ReceivingData";
        case TransferPhase::AwaitingHandshake: return "AwaitingHandshake";
        case TransferPhase::Verifying: return "Verifying";
        case TransferPhase::SendingHeader: return "SendingHeader";
        case TransferPhase::SendingEntries: return "SendingEntries";
        case TransferPhase::SendingData: return "SendingData";
        case TransferPhase::AwaitingAcknowledgment: return "AwaitingAcknowledgment";
        case TransferPhase::Complete: return "Complete";
        case TransferPhase::Aborted: return "Aborted";
    }
    return "Unknown";
}

inline bool is_terminal(TransferPhase phase) {
    return phase == TransferPhase::Complete || phase == TransferPhase::Aborted;
}

struct ManifestEntry {
    std::string relative_path;  ///< '/'-separated, relative to the root folder
    EntryKind kind = EntryKind::File;
    std::uint64_t size = 0;     ///< Snapshotted at enumeration time, 0 for directories
    std::uint64_t sequence_index = 0;
};

/// Something under the root that is deliberately not transferred
struct SkippedEntry {
    std::string relative_path;
    std::string reason;
};

/**
 * Depth-first pre-order listing of a folder, siblings sorted by name.
 * The root itself is implicit and not an entry.
 */
struct Manifest {
    std::vector<ManifestEntry> entries;
    std::vector<SkippedEntry> skipped;
    std::uint64_t total_items = 0;
    std::uint64_t total_bytes = 0;
};

/// What the sender was asked to transmit. Fixed before the first frame.
struct TransferRequest {
    TransferKind kind = TransferKind::File;
    std::filesystem::path root_path;
    std::string name;                     ///< Base name sent in the Header
    std::uint64_t declared_item_count = 0;
    std::uint64_t declared_total_bytes = 0;
    Manifest manifest;                    ///< Folder requests only
};

struct VerificationResult {
    std::uint64_t items_expected = 0;
    std::uint64_t items_received = 0;
    std::uint64_t bytes_expected = 0;
    std::uint64_t bytes_received = 0;
    bool matched = false;

    /// "expected 4 items / 1000005 bytes, received 4 items / 1000005 bytes"
    std::string describe() const {
        return "expected " + std::to_string(items_expected) + " items / " +
               std::to_string(bytes_expected) + " bytes, received " +
               std::to_string(items_received) + " items / " +
               std::to_string(bytes_received) + " bytes";
    }
};

/// Terminal report of one transfer, handed to the control layer
struct TransferOutcome {
    Role role = Role::Receiver;
    std::optional<TransferKind> kind;  ///< Unknown if aborted before the Header
    TransferPhase phase = TransferPhase::Idle;
    std::optional<Error> error;
    std::optional<VerificationResult> verification;
    std::uint64_t items = 0;
    std::uint64_t bytes = 0;
    std::filesystem::path local_path;  ///< Destination (receiver) or source (sender)
    std::string peer;
    std::chrono::milliseconds elapsed{0};

    bool succeeded() const { return phase == TransferPhase::Complete; }
};

} // namespace lft::transfer
