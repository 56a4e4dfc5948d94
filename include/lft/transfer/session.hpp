#pragma once

#include "lft/core/result.hpp"
#include "lft/transfer/types.hpp"
#include "lft/transfer/verification.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace lft::transfer {

/**
 * @brief Phase bookkeeping for one connection
 *
 * Every phase change goes through a per-role legal-transition table. The
 * phase and the counters are atomics so a control thread can poll progress;
 * everything else belongs to the worker thread.
 */
class TransferSession {
public:
    explicit TransferSession(Role role);

    [[nodiscard]] Role role() const noexcept { return role_; }
    [[nodiscard]] TransferPhase phase() const noexcept { return phase_.load(); }
    [[nodiscard]] bool finished() const noexcept { return is_terminal(phase()); }

    /// Idle -> AwaitingHeader (receiver) or SendingHeader (sender)
    Result<void> start(std::string peer);

    Result<void> transition_to(TransferPhase next);

    /// Moves to Aborted and keeps the first error. No-op once terminal.
    void abort(Error error);

    [[nodiscard]] const std::optional<Error>& error() const noexcept { return error_; }
    [[nodiscard]] const std::string& peer() const noexcept { return peer_; }

    VerificationAccumulator& counters() noexcept { return counters_; }
    const VerificationAccumulator& counters() const noexcept { return counters_; }

    /// Totals announced by the Header (or the request on the send side)
    void set_expected(std::uint64_t items, std::uint64_t bytes) noexcept;
    [[nodiscard]] std::uint64_t expected_items() const noexcept { return expected_items_.load(); }
    [[nodiscard]] std::uint64_t expected_bytes() const noexcept { return expected_bytes_.load(); }

    /// Time since start(), frozen once the session is terminal
    [[nodiscard]] std::chrono::milliseconds elapsed() const;

private:
    [[nodiscard]] bool can_transition(TransferPhase target) const noexcept;
    void set_phase(TransferPhase next);

    Role role_;
    std::atomic<TransferPhase> phase_{TransferPhase::Idle};
    std::optional<Error> error_;
    std::string peer_;
    VerificationAccumulator counters_;
    std::atomic<std::uint64_t> expected_items_{0};
    std::atomic<std::uint64_t> expected_bytes_{0};
    std::chrono::steady_clock::time_point started_at_{};
    std::chrono::steady_clock::time_point finished_at_{};
};

} // namespace lft::transfer
