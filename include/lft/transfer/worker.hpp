#pragma once

#include "lft/core/config.hpp"
#include "lft/core/result.hpp"
#include "lft/events/event_queue.hpp"
#include "lft/events/events.hpp"
#include "lft/network/byte_stream.hpp"
#include "lft/transfer/receiver.hpp"
#include "lft/transfer/sender.hpp"
#include "lft/transfer/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace lft::transfer {

/// Counters a control thread can poll while a transfer runs
struct ProgressSnapshot {
    TransferPhase phase = TransferPhase::Idle;
    std::uint64_t items = 0;
    std::uint64_t bytes = 0;
    std::uint64_t expected_items = 0;
    std::uint64_t expected_bytes = 0;
};

/**
 * @brief Runs one transfer on a dedicated thread
 *
 * The worker owns the stream and the sender/receiver for the duration of a
 * transfer. The control thread talks to it only through events(),
 * progress(), cancel() and wait(). The last event of every transfer is
 * TransferFinished.
 *
 * EXAMPLE:
 * TransferWorker worker(config);
 * worker.start_receive(std::move(stream));
 * while (worker.running()) { for (auto& e : worker.events().drain()) ...; }
 * auto outcome = worker.wait();
 */
class TransferWorker {
public:
    explicit TransferWorker(core::TransferConfig config);

    /// Cancels and joins a running transfer
    ~TransferWorker();

    TransferWorker(const TransferWorker&) = delete;
    TransferWorker& operator=(const TransferWorker&) = delete;

    Result<void> start_send(std::unique_ptr<network::ByteStream> stream, TransferRequest request);
    Result<void> start_receive(std::unique_ptr<network::ByteStream> stream);

    /// Thread-safe; closes the stream so the blocked call returns Cancelled
    void cancel();

    /// Blocks until the transfer ends; joins the thread
    TransferOutcome wait();

    /// nullopt if still running after timeout
    std::optional<TransferOutcome> wait_for(std::chrono::milliseconds timeout);

    [[nodiscard]] bool running() const noexcept { return running_.load(); }

    events::ThreadSafeQueue<events::TransferEvent>& events() noexcept { return events_; }

    [[nodiscard]] ProgressSnapshot progress() const;

private:
    Result<void> prepare(std::unique_ptr<network::ByteStream>& stream);
    void run_send();
    void run_receive();
    void finish(TransferOutcome outcome);
    void join();
    events::EventSink make_sink();

    core::TransferConfig config_;
    events::ThreadSafeQueue<events::TransferEvent> events_;

    mutable std::mutex mutex_;
    std::condition_variable done_cv_;
    std::unique_ptr<network::ByteStream> stream_;
    std::unique_ptr<Sender> sender_;
    std::unique_ptr<Receiver> receiver_;
    std::optional<TransferOutcome> outcome_;
    std::atomic<bool> running_{false};
    std::atomic<bool> cancelled_{false};
    std::thread thread_;
};

} // namespace lft::transfer
