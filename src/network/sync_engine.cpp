#include "network/sync_engine.hpp"
#include "network/device_registry.hpp"
#include "network/file_transfer.hpp"
#include "network/handshake.hpp"
#include "storage/clipboard_store.hpp"
#include "core/logging.hpp"

namespace cliped::network {

SyncEngine::SyncEngine(storage::ClipboardStore& store,
                       DeviceRegistry& registry,
                       HandshakeService& handshake,
                       FileTransferService& transfers,
                       QObject* parent)
    : QObject(parent)
    , store_(store)
    , registry_(registry)
    , handshake_(handshake)
    , transfers_(transfers)
{
    connect(&store_, &storage::ClipboardStore::entryAppended,
            this, &SyncEngine::onEntryAppended);
    connect(&handshake_, &HandshakeService::peerMessage,
            this, &SyncEngine::onPeerMessage);

    // Entries too large for one frame arrive as transfers.
    connect(&transfers_, &FileTransferService::transferCompleted, this,
            [this](const ClipboardEntry& entry, const Uuid& from) {
                if (!entry.is_file()) {
                    emit remoteEntryApplied(entry, from);
                }
            });
}

void SyncEngine::set_sync_enabled(bool enabled) {
    if (enabled_ == enabled) return;
    enabled_ = enabled;
    qCInfo(clipedSyncLog) << "SYNC: entry sync" << (enabled ? "enabled" : "paused");
}

int SyncEngine::broadcast(const ClipboardEntry& entry) {
    int queued = 0;
    const auto payload = entry.is_file() ? QByteArray{} : encode_entry(entry);

    for (const auto& peer : handshake_.connected_peers()) {
        if (modeOf(peer) == SyncMode::Disabled) {
            continue;
        }
        if (sendEntry(peer, entry, payload)) {
            ++queued;
        }
    }

    if (sync_debug_enabled()) {
        qCInfo(clipedSyncLog) << "SYNC: broadcast entry" << QString::fromStdString(entry.id)
                              << "peers=" << queued;
    }
    return queued;
}

Result<Device, Error> SyncEngine::set_sync_mode(const Uuid& peer, SyncMode mode) {
    const auto before = registry_.find(peer);
    auto changed = registry_.set_sync_mode(peer, mode);
    if (changed.is_err() || mode != SyncMode::Total || !before || before->sync_mode == SyncMode::Total) {
        return changed;
    }

    auto history = store_.page(0, store_.capacity());
    if (history.is_err()) {
        qCWarning(clipedSyncLog) << "SYNC: cannot read history for" << qstr(peer) << ":"
                                 << QString::fromStdString(history.unwrap_err().message);
        return changed;
    }

    const auto& entries = history.unwrap();
    int queued = 0;
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        const auto payload = it->is_file() ? QByteArray{} : encode_entry(*it);
        if (sendEntry(peer, *it, payload)) {
            ++queued;
        }
    }
    qCInfo(clipedSyncLog) << "SYNC: full sync to" << qstr(peer) << "entries=" << queued
                          << "of" << entries.size();
    return changed;
}

bool SyncEngine::sendEntry(const Uuid& peer, const ClipboardEntry& entry, const QByteArray& payload) {
    const auto id = QString::fromStdString(entry.id);

    if (entry.is_file() || static_cast<uint64_t>(payload.size()) > handshake_.options().max_frame_bytes) {
        auto offered = transfers_.send_entry(peer, entry);
        if (offered.is_err()) {
            const auto reason = QString::fromStdString(offered.unwrap_err().message);
            qCWarning(clipedSyncLog) << "SYNC: transfer of" << id << "to" << qstr(peer) << "failed:" << reason;
            emit syncFailed(id, peer, reason);
            return false;
        }
        return true;
    }

    auto sent = handshake_.send_to(peer, MessageType::ClipboardEntry, payload);
    if (sent.is_err()) {
        // A full or stalled queue closes the channel; the device is reported disconnected.
        const auto reason = QString::fromStdString(sent.unwrap_err().message);
        qCWarning(clipedSyncLog) << "SYNC: send of" << id << "to" << qstr(peer) << "failed:" << reason;
        emit syncFailed(id, peer, reason);
        return false;
    }
    return true;
}

SyncMode SyncEngine::modeOf(const Uuid& peer) const {
    const auto device = registry_.find(peer);
    return device ? device->sync_mode : SyncMode::Disabled;
}

void SyncEngine::onEntryAppended(const ClipboardEntry& entry) {
    if (!enabled_ || entry.origin_device != registry_.local_device().id) {
        return;
    }
    broadcast(entry);
}

void SyncEngine::onPeerMessage(const Uuid& peer, MessageType type, const QByteArray& payload) {
    const bool accepting = enabled_ && modeOf(peer) != SyncMode::Disabled;

    if (type == MessageType::ClipboardEntry) {
        if (accepting) {
            applyRemoteEntry(peer, payload);
        }
        return;
    }

    if (FileTransferService::is_transfer_message(type)) {
        // New offers are ignored while paused or disabled; running transfers finish.
        if (!accepting && type == MessageType::FileOffer) {
            return;
        }
        transfers_.handle_message(peer, type, payload);
        return;
    }

    qCWarning(clipedSyncLog) << "SYNC: unexpected" << message_type_name(type) << "from" << qstr(peer);
}

void SyncEngine::applyRemoteEntry(const Uuid& peer, const QByteArray& payload) {
    auto decoded = decode_entry(payload);
    if (decoded.is_err()) {
        qCWarning(clipedSyncLog) << "SYNC: rejected entry from" << qstr(peer) << ":"
                                 << QString::fromStdString(decoded.unwrap_err().message);
        return;
    }
    auto entry = std::move(decoded).unwrap();
    if (entry.is_file()) {
        // File entries only arrive through a verified transfer.
        qCWarning(clipedSyncLog) << "SYNC: file entry outside a transfer from" << qstr(peer);
        return;
    }

    auto appended = store_.append(entry);
    if (appended.is_err()) {
        if (appended.unwrap_err().is(ErrorCode::DuplicateEntry)) {
            return;
        }
        qCWarning(clipedSyncLog) << "SYNC: cannot store entry from" << qstr(peer) << ":"
                                 << QString::fromStdString(appended.unwrap_err().message);
        return;
    }

    if (sync_debug_enabled()) {
        qCInfo(clipedSyncLog) << "SYNC: applied entry" << QString::fromStdString(entry.id)
                              << "from" << qstr(peer);
    }
    emit remoteEntryApplied(entry, peer);
}

} // namespace cliped::network
