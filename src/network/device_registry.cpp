#include "network/device_registry.hpp"
#include "core/logging.hpp"

#include <QMutexLocker>

namespace cliped::network {

namespace {

Error invalid_state(const char* operation, const Device& device) {
    return Error{ErrorCode::InvalidState,
                 std::string(operation) + ": device " + device.id.to_string() + " is " +
                     std::string(device_status_to_string(device.status))};
}

Error not_found(const Uuid& id) {
    return Error{ErrorCode::NotFound, "unknown device " + id.to_string()};
}

} // namespace

DeviceRegistry::DeviceRegistry(Device local, QObject* parent)
    : QObject(parent)
    , local_(std::move(local))
{
    qRegisterMetaType<cliped::Device>("cliped::Device");
}

Device DeviceRegistry::local_device() const {
    QMutexLocker lock(&mutex_);
    return local_;
}

Result<Device, Error> DeviceRegistry::rename(const std::string& new_name) {
    auto name = normalize_device_name(new_name);
    if (name.empty()) {
        return Result<Device, Error>::err(
            Error{ErrorCode::InvalidName, "device name must not be empty"});
    }

    Device updated;
    {
        QMutexLocker lock(&mutex_);
        local_.name = std::move(name);
        updated = local_;
    }
    emit localDeviceChanged(updated);
    return Result<Device, Error>::ok(std::move(updated));
}

void DeviceRegistry::set_local_port(uint16_t port) {
    Device updated;
    {
        QMutexLocker lock(&mutex_);
        if (local_.port == port) return;
        local_.port = port;
        updated = local_;
    }
    emit localDeviceChanged(updated);
}

std::vector<Device> DeviceRegistry::list_with_status(DeviceStatus status) const {
    QMutexLocker lock(&mutex_);
    std::vector<Device> out;
    for (const auto& [id, device] : devices_) {
        if (device.status == status) out.push_back(device);
    }
    return out;
}

std::vector<Device> DeviceRegistry::list_discovered() const {
    return list_with_status(DeviceStatus::Discovered);
}

std::vector<Device> DeviceRegistry::list_connected() const {
    return list_with_status(DeviceStatus::Connected);
}

std::vector<Device> DeviceRegistry::list_pending_incoming() const {
    return list_with_status(DeviceStatus::PendingIncoming);
}

std::vector<Device> DeviceRegistry::list_pending_outgoing() const {
    return list_with_status(DeviceStatus::PendingOutgoing);
}

std::optional<Device> DeviceRegistry::find(const Uuid& id) const {
    QMutexLocker lock(&mutex_);
    auto it = devices_.find(id);
    if (it == devices_.end()) return std::nullopt;
    return it->second;
}

void DeviceRegistry::upsert_discovered(const Device& device) {
    Device snapshot;
    {
        QMutexLocker lock(&mutex_);
        if (device.id.is_nil() || device.id == local_.id) return;

        auto it = devices_.find(device.id);
        if (it == devices_.end()) {
            Device fresh = device;
            fresh.status = DeviceStatus::Discovered;
            fresh.last_seen = Timestamp::now();
            it = devices_.emplace(fresh.id, fresh).first;
        } else {
            auto& known = it->second;
            known.last_seen = Timestamp::now();
            if (known.status == DeviceStatus::Discovered) {
                known.name = device.name;
                known.address = device.address;
                known.port = device.port;
            }
        }
        snapshot = it->second;
    }
    emit deviceChanged(snapshot);
}

Result<Device, Error> DeviceRegistry::remove(const Uuid& id) {
    return drop(id, std::nullopt, "remove");
}

Result<Device, Error> DeviceRegistry::begin_outgoing(const Uuid& id) {
    return transition(id, DeviceStatus::Discovered, DeviceStatus::PendingOutgoing, "begin_outgoing");
}

Result<Device, Error> DeviceRegistry::record_incoming_request(const Device& requester) {
    Device snapshot;
    {
        QMutexLocker lock(&mutex_);
        if (requester.id.is_nil() || requester.id == local_.id) {
            return Result<Device, Error>::err(
                Error{ErrorCode::InvalidState, "connection request from the local device"});
        }

        auto it = devices_.find(requester.id);
        if (it == devices_.end()) {
            Device fresh = requester;
            it = devices_.emplace(fresh.id, fresh).first;
        } else if (it->second.status != DeviceStatus::Discovered &&
                   it->second.status != DeviceStatus::PendingIncoming) {
            return Result<Device, Error>::err(invalid_state("record_incoming_request", it->second));
        }

        auto& device = it->second;
        device.name = requester.name;
        device.address = requester.address;
        if (requester.port != 0) device.port = requester.port;
        device.status = DeviceStatus::PendingIncoming;
        device.last_seen = Timestamp::now();
        snapshot = device;
    }
    emit deviceChanged(snapshot);
    return Result<Device, Error>::ok(std::move(snapshot));
}

Result<Device, Error> DeviceRegistry::accept(const Uuid& id) {
    return transition(id, DeviceStatus::PendingIncoming, DeviceStatus::Connected, "accept");
}

Result<Device, Error> DeviceRegistry::deny(const Uuid& id) {
    return drop(id, DeviceStatus::PendingIncoming, "deny");
}

Result<Device, Error> DeviceRegistry::confirm_outgoing(const Uuid& id) {
    return transition(id, DeviceStatus::PendingOutgoing, DeviceStatus::Connected, "confirm_outgoing");
}

Result<Device, Error> DeviceRegistry::mark_disconnected(const Uuid& id) {
    return drop(id, DeviceStatus::Connected, "mark_disconnected", DeviceStatus::Disconnected);
}

void DeviceRegistry::touch(const Uuid& id) {
    QMutexLocker lock(&mutex_);
    auto it = devices_.find(id);
    if (it != devices_.end()) {
        it->second.last_seen = Timestamp::now();
    }
}

Result<Device, Error> DeviceRegistry::set_sync_mode(const Uuid& id, SyncMode mode) {
    Device snapshot;
    {
        QMutexLocker lock(&mutex_);
        auto it = devices_.find(id);
        if (it == devices_.end()) {
            return Result<Device, Error>::err(not_found(id));
        }
        if (it->second.status != DeviceStatus::Connected) {
            return Result<Device, Error>::err(invalid_state("set_sync_mode", it->second));
        }
        it->second.sync_mode = mode;
        snapshot = it->second;
    }
    if (sync_debug_enabled()) {
        qCInfo(clipedSyncLog) << "SYNC: sync mode device_id=" << qstr(id)
                              << "->" << sync_mode_to_string(mode).data();
    }
    emit deviceChanged(snapshot);
    return Result<Device, Error>::ok(std::move(snapshot));
}

std::vector<Device> DeviceRegistry::prune_discovered(int64_t max_age_ms) {
    const auto now = Timestamp::now();
    std::vector<Uuid> stale;
    {
        QMutexLocker lock(&mutex_);
        for (const auto& [id, device] : devices_) {
            if (device.status == DeviceStatus::Discovered &&
                (now - device.last_seen).count() > max_age_ms) {
                stale.push_back(id);
            }
        }
    }

    std::vector<Device> dropped;
    for (const auto& id : stale) {
        // The record may have moved on since the scan; drop() rechecks.
        auto result = drop(id, DeviceStatus::Discovered, "prune");
        if (result.is_ok()) dropped.push_back(std::move(result).unwrap());
    }
    return dropped;
}

Result<Device, Error> DeviceRegistry::transition(const Uuid& id,
                                                 DeviceStatus from,
                                                 DeviceStatus to,
                                                 const char* operation) {
    Device snapshot;
    {
        QMutexLocker lock(&mutex_);
        auto it = devices_.find(id);
        if (it == devices_.end()) {
            return Result<Device, Error>::err(not_found(id));
        }
        if (it->second.status != from) {
            return Result<Device, Error>::err(invalid_state(operation, it->second));
        }
        it->second.status = to;
        it->second.last_seen = Timestamp::now();
        snapshot = it->second;
    }
    if (sync_debug_enabled()) {
        qCInfo(clipedSyncLog) << "SYNC:" << operation << "device_id=" << qstr(id)
                              << "->" << device_status_to_string(to).data();
    }
    emit deviceChanged(snapshot);
    return Result<Device, Error>::ok(std::move(snapshot));
}

Result<Device, Error> DeviceRegistry::drop(const Uuid& id,
                                           std::optional<DeviceStatus> required,
                                           const char* operation,
                                           std::optional<DeviceStatus> final_status) {
    Device snapshot;
    {
        QMutexLocker lock(&mutex_);
        auto it = devices_.find(id);
        if (it == devices_.end()) {
            return Result<Device, Error>::err(not_found(id));
        }
        if (required && it->second.status != *required) {
            return Result<Device, Error>::err(invalid_state(operation, it->second));
        }
        snapshot = it->second;
        if (final_status) snapshot.status = *final_status;
        devices_.erase(it);
    }
    if (sync_debug_enabled()) {
        qCInfo(clipedSyncLog) << "SYNC:" << operation << "device_id=" << qstr(id);
    }
    emit deviceRemoved(snapshot);
    return Result<Device, Error>::ok(std::move(snapshot));
}

} // namespace cliped::network
