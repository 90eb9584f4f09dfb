#include "app/settings.hpp"

#include <QDebug>
#include <QDir>
#include <QHostInfo>
#include <QStandardPaths>
#include <QStringList>

namespace cliped::app {

namespace {

QString data_path(const QString& relative) {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QDir::temp().filePath(QStringLiteral("cliped/") + relative);
    }
    return QDir(base).filePath(relative);
}

// Values outside [min, max] keep the fallback instead of wrapping.
template<typename T>
T read_number(QSettings& settings, const char* key, T fallback, long long min, long long max) {
    const auto stored = settings.value(QString::fromLatin1(key));
    if (!stored.isValid()) {
        return fallback;
    }
    bool ok = false;
    const auto value = stored.toLongLong(&ok);
    if (!ok || value < min || value > max) {
        qWarning() << "cliped: ignoring setting" << key << "=" << stored.toString()
                   << "(expected" << min << "to" << max << ")";
        return fallback;
    }
    return static_cast<T>(value);
}

constexpr long long kMaxPort = 65535;
constexpr long long kMaxTimeoutMs = 60ll * 60 * 1000;

} // namespace

Uuid get_or_create_device_id(QSettings& settings) {
    const QString key = QString::fromLatin1(kSettingsDeviceId);
    const QString stored = settings.value(key).toString();
    if (!stored.isEmpty()) {
        auto parsed = Uuid::parse(stored.toStdString());
        if (parsed && !parsed->is_nil()) {
            return *parsed;
        }
    }
    auto id = Uuid::generate();
    settings.setValue(key, QString::fromStdString(id.to_string()));
    return id;
}

QString load_device_name(QSettings& settings) {
    const auto stored = settings.value(QString::fromLatin1(kSettingsDeviceName)).toString().trimmed();
    if (!stored.isEmpty()) {
        return stored;
    }
    const auto host = QHostInfo::localHostName();
    return host.isEmpty() ? QStringLiteral("This Device") : host;
}

void save_device_name(QSettings& settings, const QString& name) {
    settings.setValue(QString::fromLatin1(kSettingsDeviceName), name);
}

CoreConfig load_core_config(QSettings& settings) {
    CoreConfig config;

    config.db_path = settings.value(QStringLiteral("core/db_path"),
                                    data_path(QStringLiteral("history.db"))).toString().toStdString();
    config.staging_dir = settings.value(QStringLiteral("core/staging_dir"),
                                        data_path(QStringLiteral("staging"))).toString().toStdString();

    auto downloads = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (downloads.isEmpty()) {
        downloads = data_path(QStringLiteral("downloads"));
    }
    config.download_dir = settings.value(QStringLiteral("core/download_dir"), downloads)
                              .toString().toStdString();

    config.history_cap = read_number(settings, "core/history_cap", config.history_cap, 1, 1000000);
    config.sync_port = read_number(settings, "core/sync_port", config.sync_port, 0, kMaxPort);
    config.discovery_port =
        read_number(settings, "core/discovery_port", config.discovery_port, 0, kMaxPort);
    config.discovery_interval_ms = read_number(settings, "core/discovery_interval_ms",
                                               config.discovery_interval_ms, 100, kMaxTimeoutMs);
    config.discovery_window_ms = read_number(settings, "core/discovery_window_ms",
                                             config.discovery_window_ms, 50, kMaxTimeoutMs);
    config.connect_timeout_ms = read_number(settings, "core/connect_timeout_ms",
                                            config.connect_timeout_ms, 100, kMaxTimeoutMs);
    config.send_timeout_ms =
        read_number(settings, "core/send_timeout_ms", config.send_timeout_ms, 100, kMaxTimeoutMs);
    config.heartbeat_interval_ms = read_number(settings, "core/heartbeat_interval_ms",
                                               config.heartbeat_interval_ms, 10, kMaxTimeoutMs);
    config.heartbeat_timeout_ms = read_number(settings, "core/heartbeat_timeout_ms",
                                              config.heartbeat_timeout_ms, 50, kMaxTimeoutMs);
    config.max_queue_bytes = read_number(settings, "core/max_queue_bytes", config.max_queue_bytes,
                                         64ll * 1024, 1024ll * 1024 * 1024);
    config.max_frame_bytes = read_number(settings, "core/max_frame_bytes", config.max_frame_bytes,
                                         64ll * 1024, 64ll * 1024 * 1024);
    config.chunk_size = read_number(settings, "core/chunk_size", config.chunk_size,
                                    1024, static_cast<long long>(config.max_frame_bytes));

    const auto targets = settings.value(QStringLiteral("core/discovery_targets")).toStringList();
    for (const auto& target : targets) {
        const auto trimmed = target.trimmed();
        if (!trimmed.isEmpty()) {
            config.discovery_targets.push_back(trimmed.toStdString());
        }
    }

    return config;
}

} // namespace cliped::app
