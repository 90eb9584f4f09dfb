#pragma once

#include "core/clipboard_entry.hpp"
#include "core/device.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/protocol.hpp"

#include <QObject>
#include <QString>

namespace cliped::storage {
class ClipboardStore;
}

namespace cliped::network {

class DeviceRegistry;
class FileTransferService;
class HandshakeService;

/**
 * SyncEngine - Pushes local clipboard entries to every Connected peer and
 * applies theirs.
 *
 * Only entries originating on this device are broadcast; received entries
 * are stored but never relayed. Sending never blocks: each peer has its
 * own bounded queue in its channel. Entries that do not fit one frame, and
 * file entries, go through the chunked transfer path instead.
 *
 * Each peer's sync mode filters both directions: Disabled peers neither
 * get nor give entries. Switching a peer to Total replays the history to
 * it once, oldest first.
 */
class SyncEngine : public QObject {
    Q_OBJECT

public:
    SyncEngine(storage::ClipboardStore& store,
               DeviceRegistry& registry,
               HandshakeService& handshake,
               FileTransferService& transfers,
               QObject* parent = nullptr);

    /**
     * Send `entry` to every Connected peer whose mode is not Disabled.
     * Returns how many peers it was queued for.
     */
    int broadcast(const ClipboardEntry& entry);

    /**
     * Change a Connected peer's mode. Entering Total queues the whole
     * history for that peer.
     */
    Result<Device, Error> set_sync_mode(const Uuid& peer, SyncMode mode);

    // Pauses both directions of entry sync; registry state is untouched.
    void set_sync_enabled(bool enabled);
    [[nodiscard]] bool is_sync_enabled() const { return enabled_; }

signals:
    void remoteEntryApplied(const cliped::ClipboardEntry& entry, const cliped::Uuid& from);
    // An entry could not be queued for a peer.
    void syncFailed(const QString& entryId, const cliped::Uuid& peer, const QString& reason);

private slots:
    void onEntryAppended(const cliped::ClipboardEntry& entry);
    void onPeerMessage(const cliped::Uuid& peer, cliped::network::MessageType type, const QByteArray& payload);

private:
    void applyRemoteEntry(const Uuid& peer, const QByteArray& payload);
    bool sendEntry(const Uuid& peer, const ClipboardEntry& entry, const QByteArray& payload);
    [[nodiscard]] SyncMode modeOf(const Uuid& peer) const;

    storage::ClipboardStore& store_;
    DeviceRegistry& registry_;
    HandshakeService& handshake_;
    FileTransferService& transfers_;
    bool enabled_ = true;
};

} // namespace cliped::network
