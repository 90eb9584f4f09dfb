#pragma once

#include "core/device.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <QMetaType>
#include <QMutex>
#include <QObject>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cliped::network {

/**
 * DeviceRegistry - The local identity and every remote device we know of.
 *
 * Each remote device has exactly one live status. All transitions are
 * atomic under one mutex and either apply fully or fail with
 * InvalidState, leaving the record untouched. Removed or disconnected
 * devices leave the registry; the removal signal carries a final snapshot.
 */
class DeviceRegistry : public QObject {
    Q_OBJECT

public:
    explicit DeviceRegistry(Device local, QObject* parent = nullptr);

    [[nodiscard]] Device local_device() const;

    /**
     * Trim and apply a new local name. InvalidName when nothing is left.
     */
    [[nodiscard]] Result<Device, Error> rename(const std::string& new_name);
    void set_local_port(uint16_t port);

    [[nodiscard]] std::vector<Device> list_discovered() const;
    [[nodiscard]] std::vector<Device> list_connected() const;
    [[nodiscard]] std::vector<Device> list_pending_incoming() const;
    [[nodiscard]] std::vector<Device> list_pending_outgoing() const;
    [[nodiscard]] std::optional<Device> find(const Uuid& id) const;

    /**
     * Record a discovery responder. Never changes status; only a
     * Discovered record takes the new name, address and port.
     */
    void upsert_discovered(const Device& device);

    /**
     * Forget a device. NotFound if unknown.
     */
    [[nodiscard]] Result<Device, Error> remove(const Uuid& id);

    // Handshake transitions.
    [[nodiscard]] Result<Device, Error> begin_outgoing(const Uuid& id);
    [[nodiscard]] Result<Device, Error> record_incoming_request(const Device& requester);
    [[nodiscard]] Result<Device, Error> accept(const Uuid& id);
    [[nodiscard]] Result<Device, Error> deny(const Uuid& id);
    [[nodiscard]] Result<Device, Error> confirm_outgoing(const Uuid& id);
    [[nodiscard]] Result<Device, Error> mark_disconnected(const Uuid& id);

    /**
     * Change what flows to and from a connected peer. NotFound if unknown,
     * InvalidState unless Connected. The mode lives as long as the
     * connection does.
     */
    [[nodiscard]] Result<Device, Error> set_sync_mode(const Uuid& id, SyncMode mode);

    /**
     * Refresh last_seen after traffic from a peer.
     */
    void touch(const Uuid& id);

    /**
     * Forget Discovered records not heard from within `max_age_ms`.
     * Devices in any other status are kept. Returns the dropped records.
     */
    std::vector<Device> prune_discovered(int64_t max_age_ms);

signals:
    void deviceChanged(const cliped::Device& device);
    void deviceRemoved(const cliped::Device& device);
    void localDeviceChanged(const cliped::Device& device);

private:
    [[nodiscard]] std::vector<Device> list_with_status(DeviceStatus status) const;

    /**
     * Move `id` from `from` to `to`, or fail with InvalidState / NotFound.
     */
    [[nodiscard]] Result<Device, Error> transition(const Uuid& id,
                                                   DeviceStatus from,
                                                   DeviceStatus to,
                                                   const char* operation);
    [[nodiscard]] Result<Device, Error> drop(const Uuid& id,
                                             std::optional<DeviceStatus> required,
                                             const char* operation,
                                             std::optional<DeviceStatus> final_status = std::nullopt);

    mutable QMutex mutex_;
    Device local_;
    std::map<Uuid, Device> devices_;
};

} // namespace cliped::network

Q_DECLARE_METATYPE(cliped::Device)
