#include "app/cliped_core.hpp"
#include "app/clipboard_backend.hpp"
#include "app/settings.hpp"
#include "core/logging.hpp"
#include "network/device_registry.hpp"
#include "network/discovery.hpp"
#include "network/file_transfer.hpp"
#include "network/handshake.hpp"
#include "network/sync_engine.hpp"
#include "storage/clipboard_store.hpp"

#include <QDir>
#include <QFile>
#include <QSettings>

#include <algorithm>

namespace cliped::app {

namespace {

network::ConnectionOptions connection_options(const CoreConfig& config) {
    network::ConnectionOptions options;
    options.connect_timeout_ms = config.connect_timeout_ms;
    options.send_timeout_ms = config.send_timeout_ms;
    options.heartbeat_interval_ms = config.heartbeat_interval_ms;
    options.heartbeat_timeout_ms = config.heartbeat_timeout_ms;
    options.max_queue_bytes = config.max_queue_bytes;
    options.max_frame_bytes = config.max_frame_bytes;
    return options;
}

network::TransferOptions transfer_options(const CoreConfig& config) {
    network::TransferOptions options;
    options.staging_dir = config.staging_dir;
    options.download_dir = config.download_dir;
    const uint32_t frame_room = config.max_frame_bytes > static_cast<uint32_t>(network::FileChunk::kPrefixSize)
                                    ? config.max_frame_bytes - network::FileChunk::kPrefixSize
                                    : 1;
    options.chunk_size = std::min(config.chunk_size, frame_room);
    options.max_chunk_size = frame_room;
    options.pump_high_water = config.max_queue_bytes / 2;
    return options;
}

network::DiscoveryOptions discovery_options(const CoreConfig& config) {
    network::DiscoveryOptions options;
    options.port = config.discovery_port;
    options.interval_ms = config.discovery_interval_ms;
    options.window_ms = config.discovery_window_ms;
    options.peer_ttl_ms = config.discovery_interval_ms * 3;
    options.targets = config.discovery_targets;
    return options;
}

template<typename T>
std::vector<T> concat(std::vector<T> a, const std::vector<T>& b) {
    a.insert(a.end(), b.begin(), b.end());
    return a;
}

} // namespace

Result<std::unique_ptr<ClipedCore>, Error> ClipedCore::create(CoreConfig config, Device local, QObject* parent) {
    using R = Result<std::unique_ptr<ClipedCore>, Error>;

    if (local.id.is_nil()) {
        return R::err(Error{ErrorCode::InvalidState, "local device id is nil"});
    }
    local.name = normalize_device_name(local.name);
    if (local.name.empty()) {
        return R::err(Error{ErrorCode::InvalidName, "local device name is empty"});
    }

    auto store = storage::ClipboardStore::open(config.db_path, local.id, config.history_cap);
    if (store.is_err()) {
        return R::err(store.unwrap_err());
    }

    std::unique_ptr<ClipedCore> core(
        new ClipedCore(std::move(config), std::move(store).unwrap(), std::move(local), parent));
    return R::ok(std::move(core));
}

ClipedCore::ClipedCore(CoreConfig config, std::unique_ptr<storage::ClipboardStore> store, Device local, QObject* parent)
    : QObject(parent)
    , config_(std::move(config))
    , store_(std::move(store))
    , registry_(std::make_unique<network::DeviceRegistry>(std::move(local)))
    , handshake_(std::make_unique<network::HandshakeService>(*registry_, connection_options(config_)))
    , transfers_(std::make_unique<network::FileTransferService>(*handshake_, *store_, transfer_options(config_)))
    , sync_(std::make_unique<network::SyncEngine>(*store_, *registry_, *handshake_, *transfers_))
{
    if (config_.discovery_port != 0) {
        discovery_ = std::make_unique<network::DiscoveryService>(*registry_, discovery_options(config_));
        connect(discovery_.get(), &network::DiscoveryService::discoveryFinished,
                this, &ClipedCore::discoveryFinished);
        connect(discovery_.get(), &network::DiscoveryService::error,
                this, &ClipedCore::error);
    }

    connect(store_.get(), &storage::ClipboardStore::entryAppended,
            this, &ClipedCore::clipboardUpdated);

    connect(handshake_.get(), &network::HandshakeService::connectionRequestReceived,
            this, &ClipedCore::connectionRequestReceived);
    connect(handshake_.get(), &network::HandshakeService::connectionAccepted,
            this, &ClipedCore::connectionAccepted);
    connect(handshake_.get(), &network::HandshakeService::connectionDenied,
            this, &ClipedCore::connectionDenied);
    connect(handshake_.get(), &network::HandshakeService::requestFailed,
            this, &ClipedCore::connectionRequestFailed);
    connect(handshake_.get(), &network::HandshakeService::deviceDisconnected,
            this, &ClipedCore::deviceDisconnected);
    connect(transfers_.get(), &network::FileTransferService::transferFailed,
            this, &ClipedCore::transferFailed);
    connect(sync_.get(), &network::SyncEngine::syncFailed,
            this, &ClipedCore::syncFailed);
    connect(registry_.get(), &network::DeviceRegistry::deviceChanged,
            this, &ClipedCore::onRegistryDeviceChanged);

    // Mirror text from peers onto the system clipboard.
    connect(sync_.get(), &network::SyncEngine::remoteEntryApplied, this,
            [this](const ClipboardEntry& entry, const Uuid&) {
                if (!clipboard_ || !monitoring_ || entry.content_type != ContentType::Text) {
                    return;
                }
                const auto text = QString::fromStdString(entry.content);
                if (clipboard_->text() != text) {
                    ignore_once_ = text;
                    clipboard_->set_text(text);
                }
            });
}

ClipedCore::~ClipedCore() {
    stop();
}

Result<uint16_t, Error> ClipedCore::start() {
    auto listening = handshake_->start(config_.sync_port);
    if (listening.is_err()) {
        return listening;
    }
    if (discovery_ && !discovery_->is_running()) {
        auto started = discovery_->start();
        if (started.is_err()) {
            // Peers can still be reached by address.
            qCWarning(clipedDiscoveryLog) << "DISCOVERY: disabled:"
                                          << QString::fromStdString(started.unwrap_err().message);
        }
    }
    return listening;
}

void ClipedCore::stop() {
    if (discovery_) {
        discovery_->stop();
    }
    handshake_->stop();
}

void ClipedCore::attach_clipboard(ClipboardBackend* backend) {
    if (clipboard_) {
        QObject::disconnect(clipboard_.data(), nullptr, this, nullptr);
    }
    clipboard_ = backend;
    if (backend) {
        connect(backend, &ClipboardBackend::textChanged, this, &ClipedCore::onClipboardTextChanged);
        connect(backend, &ClipboardBackend::imageChanged, this, &ClipedCore::onClipboardImageChanged);
    }
}

void ClipedCore::attach_settings(QSettings* settings) {
    settings_ = settings;
}

// ============================================================================
// History
// ============================================================================

Result<std::vector<ClipboardEntry>, Error> ClipedCore::get_clipboard_history_paginated(int offset, int limit) const {
    return store_->page(offset, limit);
}

Result<int, Error> ClipedCore::get_clipboard_history_count() const {
    return store_->count();
}

Result<ClipboardEntry, Error> ClipedCore::add_clipboard_item(ClipboardEntry entry) {
    using R = Result<ClipboardEntry, Error>;

    if (entry.origin_device.is_nil()) {
        entry.origin_device = registry_->local_device().id;
    }
    if (entry.timestamp.millis() == 0) {
        entry.timestamp = Timestamp::now();
    }
    if (entry.id.empty()) {
        if (entry.is_file()) {
            if (!entry.file) {
                return R::err(Error{ErrorCode::InvalidState, "file entry without metadata"});
            }
            entry.id = derive_entry_id(ContentType::File, entry.file->hash);
        } else {
            entry.id = derive_entry_id(entry.content_type, entry.content);
        }
    }

    auto valid = validate_entry(std::move(entry));
    if (valid.is_err()) {
        return valid;
    }
    auto appended = store_->append(valid.unwrap());
    if (appended.is_err()) {
        return R::err(appended.unwrap_err());
    }
    return valid;
}

Result<ClipboardEntry, Error> ClipedCore::delete_clipboard_item(const std::string& entry_id) {
    return store_->remove(entry_id);
}

Result<int, Error> ClipedCore::clear_clipboard_history() {
    auto cleared = store_->clear();
    if (cleared.is_err()) {
        return Result<int, Error>::err(cleared.unwrap_err());
    }
    return Result<int, Error>::ok(static_cast<int>(cleared.unwrap().size()));
}

Result<ClipboardEntry, Error> ClipedCore::ingest_clipboard_text(const QString& text) {
    using R = Result<ClipboardEntry, Error>;

    if (!monitoring_) {
        return R::err(Error{ErrorCode::InvalidState, "clipboard monitoring is off"});
    }
    if (ignore_once_ && *ignore_once_ == text) {
        ignore_once_.reset();
        return R::err(Error{ErrorCode::InvalidState, "change written by cliped"});
    }
    ignore_once_.reset();
    if (text.trimmed().isEmpty()) {
        return R::err(Error{ErrorCode::InvalidState, "empty clipboard text"});
    }

    auto entry = create_text_entry(text.toStdString(), registry_->local_device().id);
    auto appended = store_->append(entry);
    if (appended.is_err()) {
        return R::err(appended.unwrap_err());
    }
    return R::ok(std::move(entry));
}

Result<ClipboardEntry, Error> ClipedCore::ingest_clipboard_image(const QString& data_url) {
    using R = Result<ClipboardEntry, Error>;

    if (!monitoring_) {
        return R::err(Error{ErrorCode::InvalidState, "clipboard monitoring is off"});
    }
    if (!data_url.startsWith(QStringLiteral("data:image/"))) {
        return R::err(Error{ErrorCode::InvalidState, "not an image data url"});
    }

    auto entry = create_image_entry(data_url.toStdString(), registry_->local_device().id);
    auto appended = store_->append(entry);
    if (appended.is_err()) {
        return R::err(appended.unwrap_err());
    }
    return R::ok(std::move(entry));
}

Result<void, Error> ClipedCore::set_clipboard_content(const QString& text) {
    if (!clipboard_) {
        return Result<void, Error>::err(Error{ErrorCode::InvalidState, "no clipboard attached"});
    }
    ignore_once_ = text;
    clipboard_->set_text(text);
    return Result<void, Error>::ok();
}

void ClipedCore::onClipboardTextChanged(const QString& text) {
    auto ingested = ingest_clipboard_text(text);
    if (ingested.is_err() && sync_debug_enabled()) {
        qCInfo(clipedStoreLog) << "STORE: clipboard change skipped:"
                               << QString::fromStdString(ingested.unwrap_err().message);
    }
}

void ClipedCore::onClipboardImageChanged(const QString& data_url) {
    auto ingested = ingest_clipboard_image(data_url);
    if (ingested.is_err() && sync_debug_enabled()) {
        qCInfo(clipedStoreLog) << "STORE: clipboard image skipped:"
                               << QString::fromStdString(ingested.unwrap_err().message);
    }
}

bool ClipedCore::toggle_monitoring() {
    set_monitoring_enabled(!monitoring_);
    return monitoring_;
}

void ClipedCore::set_monitoring_enabled(bool enabled) {
    if (monitoring_ == enabled) return;
    monitoring_ = enabled;
    ignore_once_.reset();
    qInfo() << "cliped: clipboard monitoring" << (enabled ? "on" : "off");
    emit monitoringChanged(enabled);
}

void ClipedCore::set_sync_enabled(bool enabled) {
    sync_->set_sync_enabled(enabled);
}

bool ClipedCore::is_sync_enabled() const {
    return sync_->is_sync_enabled();
}

// ============================================================================
// Devices
// ============================================================================

Device ClipedCore::get_local_device() const {
    return registry_->local_device();
}

Result<Device, Error> ClipedCore::update_device_name(const std::string& name) {
    auto renamed = registry_->rename(name);
    if (renamed.is_ok() && settings_) {
        save_device_name(*settings_, QString::fromStdString(renamed.unwrap().name));
    }
    return renamed;
}

std::vector<Device> ClipedCore::discover_devices() {
    if (discovery_ && discovery_->is_running()) {
        discovery_->discover_now();
    }
    return concat(concat(registry_->list_discovered(), registry_->list_pending_outgoing()),
                  registry_->list_pending_incoming());
}

std::vector<Device> ClipedCore::get_connected_devices() const {
    return registry_->list_connected();
}

std::vector<Device> ClipedCore::get_pending_connections() const {
    return registry_->list_pending_incoming();
}

Result<Device, Error> ClipedCore::send_connection_request_to_device(const Device& device) {
    // A device typed in by address may not have been discovered yet.
    if (!registry_->find(device.id)) {
        auto discovered = device;
        discovered.status = DeviceStatus::Discovered;
        discovered.last_seen = Timestamp::now();
        registry_->upsert_discovered(discovered);
    }
    return handshake_->send_connection_request(device.id);
}

Result<Device, Error> ClipedCore::accept_connection(const Uuid& device_id) {
    return handshake_->accept(device_id);
}

Result<Device, Error> ClipedCore::deny_connection(const Uuid& device_id) {
    return handshake_->deny(device_id);
}

Result<Device, Error> ClipedCore::remove_device(const Uuid& device_id) {
    return handshake_->remove(device_id);
}

Result<Device, Error> ClipedCore::set_sync_mode(const Uuid& device_id, SyncMode mode) {
    return sync_->set_sync_mode(device_id, mode);
}

Result<void, Error> ClipedCore::connect_to_address(const std::string& target) {
    if (!discovery_) {
        return Result<void, Error>::err(
            Error{ErrorCode::InvalidState, "discovery is off; cannot reach " + target});
    }
    QHostAddress address;
    uint16_t port = 0;
    if (!network::parse_discovery_target(target, config_.discovery_port, address, port)) {
        return Result<void, Error>::err(Error{ErrorCode::NetworkUnreachable, "bad address " + target});
    }

    bool is_v4 = false;
    const auto v4 = address.toIPv4Address(&is_v4);
    const auto host = is_v4 ? QHostAddress(v4).toString().toStdString() : address.toString().toStdString();
    connect_hosts_.insert(host);

    const auto normalized = (is_v4 ? host : "[" + host + "]") + ":" + std::to_string(port);
    if (std::find(config_.discovery_targets.begin(), config_.discovery_targets.end(), normalized) ==
        config_.discovery_targets.end()) {
        config_.discovery_targets.push_back(normalized);
        discovery_->set_targets(config_.discovery_targets);
    }
    qInfo() << "cliped: looking for a device at" << QString::fromStdString(normalized);
    discovery_->discover_now();
    return Result<void, Error>::ok();
}

void ClipedCore::onRegistryDeviceChanged(const Device& device) {
    if (device.status != DeviceStatus::Discovered || connect_hosts_.erase(device.address) == 0) {
        return;
    }
    auto requested = send_connection_request_to_device(device);
    if (requested.is_err()) {
        const auto reason = QString::fromStdString(requested.unwrap_err().message);
        qWarning() << "cliped: connection request to" << QString::fromStdString(device.address)
                   << "failed:" << reason;
        emit connectionRequestFailed(device, reason);
    }
}

// ============================================================================
// Files
// ============================================================================

Result<ClipboardEntry, Error> ClipedCore::add_file_to_clipboard(const std::string& path) {
    using R = Result<ClipboardEntry, Error>;

    auto described = describe_file(path);
    if (described.is_err()) {
        return R::err(described.unwrap_err());
    }
    auto entry = create_file_entry(std::move(described).unwrap(), registry_->local_device().id);
    auto appended = store_->append(entry);
    if (appended.is_err()) {
        return R::err(appended.unwrap_err());
    }
    return R::ok(std::move(entry));
}

Result<QByteArray, Error> ClipedCore::get_file_content(const std::string& path) const {
    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<QByteArray, Error>::err(
            Error{ErrorCode::Io, "cannot read " + path + ": " + file.errorString().toStdString()});
    }
    return Result<QByteArray, Error>::ok(file.readAll());
}

Result<std::string, Error> ClipedCore::save_received_file(const QByteArray& bytes, const std::string& file_name) {
    using R = Result<std::string, Error>;

    const auto dir = config_.download_dir.empty() ? QDir::tempPath().toStdString() : config_.download_dir;
    if (!QDir().mkpath(QString::fromStdString(dir))) {
        return R::err(Error{ErrorCode::Io, "cannot create " + dir});
    }
    const auto path = network::unique_download_path(dir, network::sanitize_file_name(file_name));

    QFile file(QString::fromStdString(path));
    if (!file.open(QIODevice::WriteOnly) || file.write(bytes) != bytes.size()) {
        return R::err(Error{ErrorCode::Io, "cannot write " + path + ": " + file.errorString().toStdString()});
    }
    return R::ok(path);
}

} // namespace cliped::app
