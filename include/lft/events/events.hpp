/**
 * @file events.hpp
 * @brief Events a transfer worker reports to the control thread
 *
 * Events are values. The worker pushes them into a ThreadSafeQueue and the
 * control thread drains it; the two threads share nothing else except the
 * session's atomic counters.
 *
 * NAMING CONVENTION:
 * - Past tense: TransferStarted, EntryCompleted
 */

#pragma once

#include "lft/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <variant>

namespace lft::events {

// ════════════════════════════════════════════════════════
// Lifecycle
// ════════════════════════════════════════════════════════

/**
 * @brief First event of every transfer
 *
 * WHO EMITS:
 * - Sender, before the Header goes out
 * - Receiver, once the Header is accepted and the destination exists
 */
struct TransferStarted {
    transfer::Role role = transfer::Role::Receiver;
    transfer::TransferKind kind = transfer::TransferKind::File;
    std::string name;
    std::uint64_t expected_items = 0;
    std::uint64_t expected_bytes = 0;
    std::filesystem::path local_path;
    std::string peer;
};

/**
 * @brief Terminal event, always the last one a worker emits
 */
struct TransferFinished {
    transfer::TransferOutcome outcome;
};

// ════════════════════════════════════════════════════════
// Entries
// ════════════════════════════════════════════════════════

/// A file's header was sent or accepted; data follows if size > 0
struct EntryStarted {
    std::uint64_t index = 0;
    transfer::EntryKind kind = transfer::EntryKind::File;
    std::string relative_path;
    std::uint64_t size = 0;
};

/**
 * @brief An entry is fully sent or fully on disk
 *
 * On the receive side a Directory entry is emitted after the directory has
 * been created, so event order shows directories before their files.
 */
struct EntryCompleted {
    std::uint64_t index = 0;
    transfer::EntryKind kind = transfer::EntryKind::File;
    std::string relative_path;
    std::uint64_t size = 0;
    std::filesystem::path local_path;
};

// ════════════════════════════════════════════════════════
// Progress
// ════════════════════════════════════════════════════════

/// Throttled to the configured progress interval
struct ProgressUpdated {
    std::uint64_t items = 0;
    std::uint64_t bytes = 0;
    std::uint64_t expected_items = 0;
    std::uint64_t expected_bytes = 0;
    double bytes_per_second = 0.0;
};

using TransferEvent = std::variant<TransferStarted, EntryStarted, EntryCompleted,
                                   ProgressUpdated, TransferFinished>;

/// Where a sender or receiver delivers its events; may be empty
using EventSink = std::function<void(TransferEvent)>;

} // namespace lft::events
