#include "lft/events/event_logger.hpp"
#include "lft/core/units.hpp"

#include <spdlog/spdlog.h>

namespace lft::events {
namespace {

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

double percent(std::uint64_t done, std::uint64_t total) {
    if (total == 0) {
        return 100.0;
    }
    return 100.0 * static_cast<double>(done) / static_cast<double>(total);
}

} // namespace

void EventLogger::log(const TransferEvent& event) const {
    std::visit(overloaded{
        [this](const TransferStarted& e) { on_started(e); },
        [this](const EntryStarted& e) { on_entry_started(e); },
        [this](const EntryCompleted& e) { on_entry_completed(e); },
        [this](const ProgressUpdated& e) { on_progress(e); },
        [this](const TransferFinished& e) { on_finished(e); },
    }, event);
}

void EventLogger::on_started(const TransferStarted& e) const {
    spdlog::info("[TransferStarted] role={} kind={} name={} items={} size={} peer={} path={}",
        transfer::to_string(e.role),
        protocol::to_string(e.kind),
        e.name,
        e.expected_items,
        format_bytes(e.expected_bytes),
        e.peer,
        e.local_path.string());
}

void EventLogger::on_entry_started(const EntryStarted& e) const {
    spdlog::debug("[EntryStarted] #{} {} {} ({})",
        e.index,
        protocol::to_string(e.kind),
        e.relative_path,
        format_bytes(e.size));
}

void EventLogger::on_entry_completed(const EntryCompleted& e) const {
    spdlog::info("[EntryCompleted] #{} {} {} ({})",
        e.index,
        protocol::to_string(e.kind),
        e.relative_path,
        format_bytes(e.size));
}

void EventLogger::on_progress(const ProgressUpdated& e) const {
    spdlog::info("[Progress] {}/{} items, {}/{} ({:.1f}%) at {}",
        e.items,
        e.expected_items,
        format_bytes(e.bytes),
        format_bytes(e.expected_bytes),
        percent(e.bytes, e.expected_bytes),
        format_rate(e.bytes_per_second));
}

void EventLogger::on_finished(const TransferFinished& e) const {
    const auto& outcome = e.outcome;
    const char* kind = outcome.kind ? protocol::to_string(*outcome.kind) : "unknown";

    if (outcome.succeeded()) {
        spdlog::info("[TransferFinished] role={} kind={} phase=Complete items={} size={} elapsed={}ms path={}",
            transfer::to_string(outcome.role),
            kind,
            outcome.items,
            format_bytes(outcome.bytes),
            outcome.elapsed.count(),
            outcome.local_path.string());
        return;
    }

    spdlog::error("[TransferFinished] role={} kind={} phase={} error={} items={} size={} path={}",
        transfer::to_string(outcome.role),
        kind,
        transfer::to_string(outcome.phase),
        outcome.error ? outcome.error->describe() : std::string("none"),
        outcome.items,
        format_bytes(outcome.bytes),
        outcome.local_path.string());
    if (outcome.verification && !outcome.verification->matched) {
        spdlog::error("[TransferFinished] verification failed: {}", outcome.verification->describe());
    }
}

} // namespace lft::events
