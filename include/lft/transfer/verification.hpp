#pragma once

#include "lft/transfer/types.hpp"

#include <atomic>
#include <cstdint>

namespace lft::transfer {

/**
 * @brief Running item/byte tallies of one transfer
 *
 * Written only by the worker thread; other threads may read for progress.
 * Counters only ever grow.
 */
class VerificationAccumulator {
public:
    void record_item() noexcept { items_.fetch_add(1, std::memory_order_relaxed); }

    void record_bytes(std::uint64_t count) noexcept {
        bytes_.fetch_add(count, std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t items() const noexcept {
        return items_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] std::uint64_t bytes() const noexcept {
        return bytes_.load(std::memory_order_relaxed);
    }

    /// Exact comparison against the sender's declared totals
    [[nodiscard]] VerificationResult verify(std::uint64_t expected_items,
                                            std::uint64_t expected_bytes) const noexcept {
        VerificationResult result;
        result.items_expected = expected_items;
        result.bytes_expected = expected_bytes;
        result.items_received = items();
        result.bytes_received = bytes();
        result.matched = result.items_received == expected_items &&
                         result.bytes_received == expected_bytes;
        return result;
    }

private:
    std::atomic<std::uint64_t> items_{0};
    std::atomic<std::uint64_t> bytes_{0};
};

} // namespace lft::transfer
