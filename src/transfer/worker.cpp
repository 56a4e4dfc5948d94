#include "lft/transfer/worker.hpp"
#include "lft/protocol/frame_channel.hpp"

#include <spdlog/spdlog.h>

namespace lft::transfer {

TransferWorker::TransferWorker(core::TransferConfig config) : config_(std::move(config)) {}

TransferWorker::~TransferWorker() {
    if (running()) {
        cancel();
    }
    join();
}

Result<void> TransferWorker::prepare(std::unique_ptr<network::ByteStream>& stream) {
    if (running()) {
        return Err<void>(ErrorCode::InvalidArgument, "A transfer is already running on this worker");
    }
    if (!stream) {
        return Err<void>(ErrorCode::InvalidArgument, "No stream to transfer over");
    }
    join();

    std::lock_guard<std::mutex> lock(mutex_);
    outcome_.reset();
    sender_.reset();
    receiver_.reset();
    stream_ = std::move(stream);
    cancelled_ = false;
    return Ok();
}

Result<void> TransferWorker::start_send(std::unique_ptr<network::ByteStream> stream,
                                        TransferRequest request) {
    if (auto ready = prepare(stream); ready.is_error()) {
        return ready;
    }

    SenderOptions options;
    options.chunk_size = config_.chunk_size;
    options.ack_timeout = config_.ack_timeout;
    options.progress_interval = config_.progress_interval;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sender_ = std::make_unique<Sender>(std::move(request), options, make_sink());
    }

    running_ = true;
    thread_ = std::thread(&TransferWorker::run_send, this);
    return Ok();
}

Result<void> TransferWorker::start_receive(std::unique_ptr<network::ByteStream> stream) {
    if (auto ready = prepare(stream); ready.is_error()) {
        return ready;
    }

    ReceiverOptions options;
    options.receive_root = config_.receive_root;
    options.progress_interval = config_.progress_interval;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        receiver_ = std::make_unique<Receiver>(options, make_sink());
    }

    running_ = true;
    thread_ = std::thread(&TransferWorker::run_receive, this);
    return Ok();
}

void TransferWorker::run_send() {
    protocol::FrameChannel channel(*stream_, config_.io_deadline());
    finish(sender_->run(channel));
}

void TransferWorker::run_receive() {
    Receiver& receiver = *receiver_;
    protocol::FrameChannel channel(*stream_, config_.io_deadline());

    if (auto begun = receiver.begin(stream_->peer()); begun.is_error()) {
        receiver.fail(begun.error());
    }

    while (!receiver.finished()) {
        auto frame = channel.receive(config_.io_deadline());
        if (frame.is_error()) {
            receiver.fail(frame.error());
            break;
        }

        auto reply = receiver.handle(frame.value());
        if (reply.is_error()) {
            break;
        }
        if (reply.value()) {
            if (auto sent = channel.send(*reply.value()); sent.is_error()) {
                spdlog::warn("Could not deliver {} to {}: {}", protocol::describe(*reply.value()),
                             stream_->peer(), sent.error().describe());
                receiver.fail(sent.error());
                break;
            }
        }
    }

    finish(receiver.outcome());
}

void TransferWorker::finish(TransferOutcome outcome) {
    if (cancelled_ && outcome.phase == TransferPhase::Aborted && outcome.error &&
        outcome.error->code != ErrorCode::Cancelled) {
        outcome.error = Error(ErrorCode::Cancelled, "Transfer cancelled (" + outcome.error->message + ")");
    }

    events_.push(events::TransferFinished{outcome});

    std::unique_ptr<network::ByteStream> stream;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stream = std::move(stream_);
        outcome_ = std::move(outcome);
        running_ = false;
    }
    done_cv_.notify_all();
    // Destroying the stream closes the connection
    stream.reset();
}

void TransferWorker::cancel() {
    cancelled_ = true;
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_) {
        spdlog::info("Cancelling transfer with {}", stream_->peer());
        stream_->close();
    }
}

TransferOutcome TransferWorker::wait() {
    join();
    std::lock_guard<std::mutex> lock(mutex_);
    return outcome_.value_or(TransferOutcome{});
}

std::optional<TransferOutcome> TransferWorker::wait_for(std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!done_cv_.wait_for(lock, timeout, [this] { return !running_.load(); })) {
            return std::nullopt;
        }
    }
    join();
    std::lock_guard<std::mutex> lock(mutex_);
    return outcome_;
}

ProgressSnapshot TransferWorker::progress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const TransferSession* session = nullptr;
    if (sender_) {
        session = &sender_->session();
    } else if (receiver_) {
        session = &receiver_->session();
    }

    ProgressSnapshot snapshot;
    if (session == nullptr) {
        return snapshot;
    }
    snapshot.phase = session->phase();
    snapshot.items = session->counters().items();
    snapshot.bytes = session->counters().bytes();
    snapshot.expected_items = session->expected_items();
    snapshot.expected_bytes = session->expected_bytes();
    return snapshot;
}

void TransferWorker::join() {
    if (thread_.joinable()) {
        thread_.join();
    }
}

events::EventSink TransferWorker::make_sink() {
    return [this](events::TransferEvent event) { events_.push(std::move(event)); };
}

} // namespace lft::transfer
