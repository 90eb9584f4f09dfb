#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cliped {

enum class DeviceStatus {
    Discovered,
    PendingOutgoing,
    PendingIncoming,
    Connected,
    Disconnected,
};

[[nodiscard]] constexpr std::string_view device_status_to_string(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::Discovered: return "discovered";
        case DeviceStatus::PendingOutgoing: return "pending_outgoing";
        case DeviceStatus::PendingIncoming: return "pending_incoming";
        case DeviceStatus::Connected: return "connected";
        case DeviceStatus::Disconnected: return "disconnected";
    }
    return "discovered";
}

/**
 * What flows to a connected peer. Partial syncs new entries as they are
 * captured; Total also replays the history when switched on; Disabled
 * sends nothing to the peer and ignores what it sends.
 */
enum class SyncMode {
    Total,
    Partial,
    Disabled,
};

[[nodiscard]] constexpr std::string_view sync_mode_to_string(SyncMode mode) {
    switch (mode) {
        case SyncMode::Total: return "total";
        case SyncMode::Partial: return "partial";
        case SyncMode::Disabled: return "disabled";
    }
    return "partial";
}

[[nodiscard]] std::optional<SyncMode> sync_mode_from_string(std::string_view text);

/**
 * Device - A participant in sync, local or remote.
 *
 * port is the peer's sync listener; address is the last address it was
 * seen from.
 */
struct Device {
    Uuid id;
    std::string name;
    std::string address;
    uint16_t port = 0;
    DeviceStatus status = DeviceStatus::Discovered;
    SyncMode sync_mode = SyncMode::Partial;
    Timestamp last_seen;

    bool operator==(const Device&) const = default;
};

/**
 * Trim surrounding whitespace; an empty result means the name is unusable.
 */
[[nodiscard]] std::string normalize_device_name(std::string_view name);

} // namespace cliped
