#include "lft/transfer/session.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace lft::transfer {
namespace {

using PhaseTable = std::unordered_map<TransferPhase, std::vector<TransferPhase>>;

const PhaseTable& receiver_transitions() {
    static const PhaseTable table {
        {TransferPhase::Idle, {TransferPhase::AwaitingHeader}},
        {TransferPhase::AwaitingHeader, {TransferPhase::ReceivingEntries, TransferPhase::ReceivingData}},
        {TransferPhase::ReceivingEntries, {TransferPhase::ReceivingData, TransferPhase::AwaitingHandshake}},
        {TransferPhase::ReceivingData, {TransferPhase::ReceivingEntries, TransferPhase::Complete}},
        {TransferPhase::AwaitingHandshake, {TransferPhase::Verifying}},
        {TransferPhase::Verifying, {TransferPhase::Complete}},
    };
    return table;
}

const PhaseTable& sender_transitions() {
    static const PhaseTable table {
        {TransferPhase::Idle, {TransferPhase::SendingHeader}},
        {TransferPhase::SendingHeader, {TransferPhase::SendingEntries, TransferPhase::SendingData}},
        {TransferPhase::SendingEntries, {TransferPhase::SendingData, TransferPhase::AwaitingAcknowledgment}},
        {TransferPhase::SendingData, {TransferPhase::SendingEntries, TransferPhase::Complete}},
        {TransferPhase::AwaitingAcknowledgment, {TransferPhase::Complete}},
    };
    return table;
}

bool is_progressive(Role role, TransferPhase current, TransferPhase target) {
    if (target == TransferPhase::Aborted) {
        return true;
    }

    const auto& transitions = role == Role::Receiver ? receiver_transitions() : sender_transitions();
    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

TransferSession::TransferSession(Role role) : role_(role) {}

Result<void> TransferSession::start(std::string peer) {
    if (phase() != TransferPhase::Idle) {
        return Err<void>(ErrorCode::ProtocolViolation, "Session already started");
    }
    peer_ = std::move(peer);
    started_at_ = std::chrono::steady_clock::now();
    return transition_to(role_ == Role::Receiver ? TransferPhase::AwaitingHeader
                                                 : TransferPhase::SendingHeader);
}

Result<void> TransferSession::transition_to(TransferPhase next) {
    const TransferPhase current = phase();
    if (current == next) {
        return Ok();
    }

    if (!can_transition(next)) {
        return Err<void>(ErrorCode::ProtocolViolation,
                         std::string("Illegal ") + to_string(role_) + " transition " +
                             to_string(current) + " -> " + to_string(next));
    }

    spdlog::debug("[{}] {} -> {}", to_string(role_), to_string(current), to_string(next));
    set_phase(next);
    return Ok();
}

void TransferSession::abort(Error error) {
    if (finished()) {
        return;
    }
    spdlog::error("[{}] Transfer aborted in {}: {}", to_string(role_), to_string(phase()),
                  error.describe());
    error_ = std::move(error);
    set_phase(TransferPhase::Aborted);
}

void TransferSession::set_expected(std::uint64_t items, std::uint64_t bytes) noexcept {
    expected_items_ = items;
    expected_bytes_ = bytes;
}

std::chrono::milliseconds TransferSession::elapsed() const {
    if (started_at_ == std::chrono::steady_clock::time_point{}) {
        return std::chrono::milliseconds{0};
    }
    const auto end = finished() ? finished_at_ : std::chrono::steady_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - started_at_);
}

bool TransferSession::can_transition(TransferPhase target) const noexcept {
    const TransferPhase current = phase();
    if (current == target) {
        return true;
    }
    if (is_terminal(current)) {
        return false;
    }
    return is_progressive(role_, current, target);
}

void TransferSession::set_phase(TransferPhase next) {
    if (is_terminal(next)) {
        finished_at_ = std::chrono::steady_clock::now();
    }
    phase_ = next;
}

} // namespace lft::transfer
