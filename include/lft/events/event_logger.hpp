#pragma once

#include "lft/events/events.hpp"

namespace lft::events {

/**
 * @brief Writes transfer events to spdlog
 *
 * USAGE:
 * EventLogger logger;
 * for (const auto& event : worker.events().drain()) logger.log(event);
 *
 * Entry and progress events go to debug/info, a failed TransferFinished to
 * error.
 */
class EventLogger {
public:
    void log(const TransferEvent& event) const;

    void operator()(const TransferEvent& event) const { log(event); }

private:
    void on_started(const TransferStarted& e) const;
    void on_entry_started(const EntryStarted& e) const;
    void on_entry_completed(const EntryCompleted& e) const;
    void on_progress(const ProgressUpdated& e) const;
    void on_finished(const TransferFinished& e) const;
};

} // namespace lft::events
