#pragma once

#include "core/clipboard_entry.hpp"
#include "core/config.hpp"
#include "core/device.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <QObject>
#include <QPointer>
#include <QString>

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

class QSettings;

namespace cliped::storage {
class ClipboardStore;
}

namespace cliped::network {
class DeviceRegistry;
class DiscoveryService;
class FileTransferService;
class HandshakeService;
class SyncEngine;
}

namespace cliped::app {

class ClipboardBackend;

/**
 * ClipedCore - Everything a front end talks to.
 *
 * Owns the store, registry, discovery, handshake, transfer and sync
 * components and wires them together. Commands return immediately;
 * network outcomes arrive as signals.
 */
class ClipedCore : public QObject {
    Q_OBJECT

public:
    /**
     * Open the store and build every component. Nothing touches the
     * network until start().
     */
    [[nodiscard]] static Result<std::unique_ptr<ClipedCore>, Error> create(
        CoreConfig config, Device local, QObject* parent = nullptr);

    ~ClipedCore() override;

    /**
     * Listen for peers and start discovery (skipped when discovery_port
     * is 0). Returns the bound sync port.
     */
    [[nodiscard]] Result<uint16_t, Error> start();
    void stop();

    // Optional collaborators; neither is owned.
    void attach_clipboard(ClipboardBackend* backend);
    void attach_settings(QSettings* settings);

    // History
    [[nodiscard]] Result<std::vector<ClipboardEntry>, Error>
    get_clipboard_history_paginated(int offset, int limit) const;
    [[nodiscard]] Result<int, Error> get_clipboard_history_count() const;

    /**
     * Append an entry built by the front end. A missing id, origin or
     * timestamp is filled in; a present id must match the content.
     */
    Result<ClipboardEntry, Error> add_clipboard_item(ClipboardEntry entry);
    Result<ClipboardEntry, Error> delete_clipboard_item(const std::string& entry_id);
    Result<int, Error> clear_clipboard_history();

    /**
     * Record text the clipboard adapter observed. Ignored while monitoring
     * is off, and once after set_clipboard_content() wrote the same text.
     */
    Result<ClipboardEntry, Error> ingest_clipboard_text(const QString& text);
    Result<ClipboardEntry, Error> ingest_clipboard_image(const QString& data_url);

    /**
     * Write text to the system clipboard without recording it again.
     */
    Result<void, Error> set_clipboard_content(const QString& text);

    [[nodiscard]] bool is_monitoring_enabled() const { return monitoring_; }
    bool toggle_monitoring();
    void set_monitoring_enabled(bool enabled);

    void set_sync_enabled(bool enabled);
    [[nodiscard]] bool is_sync_enabled() const;

    // Devices
    [[nodiscard]] Device get_local_device() const;
    Result<Device, Error> update_device_name(const std::string& name);

    /**
     * Start a discovery cycle and return what the registry already knows
     * that is not connected. discoveryFinished() reports the cycle.
     */
    std::vector<Device> discover_devices();
    [[nodiscard]] std::vector<Device> get_connected_devices() const;
    [[nodiscard]] std::vector<Device> get_pending_connections() const;

    Result<Device, Error> send_connection_request_to_device(const Device& device);
    Result<Device, Error> accept_connection(const Uuid& device_id);
    Result<Device, Error> deny_connection(const Uuid& device_id);
    Result<Device, Error> remove_device(const Uuid& device_id);

    /**
     * Change what a Connected device gets and gives. Switching to Total
     * sends it the whole history once.
     */
    Result<Device, Error> set_sync_mode(const Uuid& device_id, SyncMode mode);

    /**
     * Query "host[:port]" (port defaults to the discovery port) and send a
     * connection request to the first device that answers from that host.
     * InvalidState when discovery is off.
     */
    Result<void, Error> connect_to_address(const std::string& target);

    // Files
    Result<ClipboardEntry, Error> add_file_to_clipboard(const std::string& path);
    [[nodiscard]] Result<QByteArray, Error> get_file_content(const std::string& path) const;
    Result<std::string, Error> save_received_file(const QByteArray& bytes, const std::string& file_name);

    [[nodiscard]] const CoreConfig& config() const { return config_; }
    [[nodiscard]] storage::ClipboardStore& store() { return *store_; }
    [[nodiscard]] network::DeviceRegistry& registry() { return *registry_; }
    [[nodiscard]] network::HandshakeService& handshake() { return *handshake_; }
    [[nodiscard]] network::DiscoveryService* discovery() { return discovery_.get(); }

signals:
    void clipboardUpdated(const cliped::ClipboardEntry& entry);
    void connectionRequestReceived(const cliped::Device& device);
    void connectionAccepted(const cliped::Device& device);
    void connectionDenied(const cliped::Device& device);
    void connectionRequestFailed(const cliped::Device& device, const QString& reason);
    void deviceDisconnected(const cliped::Device& device, const QString& reason);
    void discoveryFinished(const std::vector<cliped::Device>& devices);
    void transferFailed(const QString& fileName, const QString& reason);
    void syncFailed(const QString& entryId, const cliped::Uuid& peer, const QString& reason);
    void monitoringChanged(bool enabled);
    void error(const QString& message);

private:
    ClipedCore(CoreConfig config, std::unique_ptr<storage::ClipboardStore> store, Device local, QObject* parent);

    void onClipboardTextChanged(const QString& text);
    void onClipboardImageChanged(const QString& data_url);
    void onRegistryDeviceChanged(const Device& device);

    CoreConfig config_;
    std::unique_ptr<storage::ClipboardStore> store_;
    std::unique_ptr<network::DeviceRegistry> registry_;
    std::unique_ptr<network::HandshakeService> handshake_;
    std::unique_ptr<network::FileTransferService> transfers_;
    std::unique_ptr<network::SyncEngine> sync_;
    std::unique_ptr<network::DiscoveryService> discovery_;

    QPointer<ClipboardBackend> clipboard_;
    QSettings* settings_ = nullptr;
    bool monitoring_ = true;
    std::optional<QString> ignore_once_;
    // Hosts named by connect_to_address() still waiting for an answer.
    std::set<std::string> connect_hosts_;
};

} // namespace cliped::app
