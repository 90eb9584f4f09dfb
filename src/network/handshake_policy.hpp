#pragma once

#include "core/device.hpp"
#include "core/types.hpp"

#include <QString>

#include <optional>

namespace cliped::network {

enum class RequestDecisionKind {
    Reject,          // from ourselves, or a nil id
    RecordPending,   // new request; wait for the user
    RefreshPending,  // repeated request while already pending incoming
    MutualConsent,   // we had asked them too; both sides connect
    AlreadyConnected,
};

struct RequestDecision {
    RequestDecisionKind kind = RequestDecisionKind::Reject;
    QString reason;
};

/**
 * Decide what a ConnectionRequest from `remote_id` means given what the
 * registry holds for it (nullopt when unknown).
 */
[[nodiscard]] inline RequestDecision decide_connection_request(
    const Uuid& local_id,
    const Uuid& remote_id,
    std::optional<DeviceStatus> known_status
) {
    if (remote_id.is_nil() || remote_id == local_id) {
        return {RequestDecisionKind::Reject, QStringLiteral("Request from self")};
    }
    if (!known_status) {
        return {RequestDecisionKind::RecordPending, QString{}};
    }
    switch (*known_status) {
        case DeviceStatus::Discovered:
        case DeviceStatus::Disconnected:
            return {RequestDecisionKind::RecordPending, QString{}};
        case DeviceStatus::PendingIncoming:
            return {RequestDecisionKind::RefreshPending, QString{}};
        case DeviceStatus::PendingOutgoing:
            return {RequestDecisionKind::MutualConsent, QString{}};
        case DeviceStatus::Connected:
            return {RequestDecisionKind::AlreadyConnected, QString{}};
    }
    return {RequestDecisionKind::Reject, QStringLiteral("Unknown status")};
}

enum class AcceptDecisionKind {
    Reject,
    Confirm,          // our request was accepted
    AlreadyConnected, // duplicate accept after a mutual request
};

[[nodiscard]] inline AcceptDecisionKind decide_connection_accept(
    const Uuid& local_id,
    const Uuid& remote_id,
    std::optional<DeviceStatus> known_status
) {
    if (remote_id.is_nil() || remote_id == local_id || !known_status) {
        return AcceptDecisionKind::Reject;
    }
    if (*known_status == DeviceStatus::PendingOutgoing) {
        return AcceptDecisionKind::Confirm;
    }
    if (*known_status == DeviceStatus::Connected) {
        return AcceptDecisionKind::AlreadyConnected;
    }
    return AcceptDecisionKind::Reject;
}

/**
 * With two channels open for one pair, both sides keep the one initiated
 * by the lower device id. Returns true when the channel initiated by
 * `candidate_initiator` should replace the one initiated by
 * `existing_initiator`.
 */
[[nodiscard]] inline bool should_replace_channel(const Uuid& existing_initiator,
                                                 const Uuid& candidate_initiator) {
    return candidate_initiator < existing_initiator;
}

} // namespace cliped::network
