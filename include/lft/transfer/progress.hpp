#pragma once

#include "lft/core/units.hpp"
#include "lft/events/events.hpp"
#include "lft/transfer/session.hpp"

#include <chrono>

namespace lft::transfer {

/// Turns session counters into ProgressUpdated events, at most once per interval
class ProgressReporter {
public:
    ProgressReporter(const TransferSession& session,
                     const events::EventSink& sink,
                     std::chrono::milliseconds interval)
        : session_(session), sink_(sink), interval_(interval) {}

    void tick() {
        const auto now = std::chrono::steady_clock::now();
        if (now - last_emit_ < interval_) {
            return;
        }
        last_emit_ = now;
        emit();
    }

    void emit() const {
        if (!sink_) {
            return;
        }
        events::ProgressUpdated update;
        update.items = session_.counters().items();
        update.bytes = session_.counters().bytes();
        update.expected_items = session_.expected_items();
        update.expected_bytes = session_.expected_bytes();
        update.bytes_per_second = bytes_per_second(update.bytes, session_.elapsed());
        sink_(update);
    }

private:
    const TransferSession& session_;
    const events::EventSink& sink_;
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_emit_{};
};

} // namespace lft::transfer
