#include <QGuiApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QSettings>
#include <QTextStream>

#include "app/cliped_core.hpp"
#include "app/file_logging.hpp"
#include "app/settings.hpp"
#include "core/logging.hpp"
#include "crypto/hash.hpp"
#include "platform/qt/qt_clipboard_backend.hpp"
#include "storage/clipboard_store.hpp"

#include <algorithm>
#include <set>
#include <type_traits>

namespace {

QString describe(const cliped::ClipboardEntry& entry) {
    QString content = QString::fromStdString(entry.content).simplified();
    if (entry.content_type == cliped::ContentType::Image) {
        content = QStringLiteral("<image>");
    } else if (content.size() > 60) {
        content = content.left(57) + QStringLiteral("...");
    }
    return QStringLiteral("%1  %2  %3")
        .arg(QString::fromStdString(entry.id),
             QString::fromLatin1(cliped::content_type_to_string(entry.content_type).data()),
             content);
}

int run_store_command(const QString& command, const cliped::CoreConfig& config,
                      const cliped::Uuid& device_id, int limit) {
    QTextStream out(stdout);
    QTextStream err(stderr);

    auto opened = cliped::storage::ClipboardStore::open(config.db_path, device_id, config.history_cap);
    if (opened.is_err()) {
        err << "cliped: " << QString::fromStdString(opened.unwrap_err().message) << Qt::endl;
        return 1;
    }
    auto& store = *opened.unwrap();

    if (command == QStringLiteral("count")) {
        auto count = store.count();
        if (count.is_err()) {
            err << "cliped: " << QString::fromStdString(count.unwrap_err().message) << Qt::endl;
            return 1;
        }
        out << count.unwrap() << Qt::endl;
        return 0;
    }

    if (command == QStringLiteral("clear")) {
        auto cleared = store.clear();
        if (cleared.is_err()) {
            err << "cliped: " << QString::fromStdString(cleared.unwrap_err().message) << Qt::endl;
            return 1;
        }
        out << "removed " << cleared.unwrap().size() << " entries" << Qt::endl;
        return 0;
    }

    auto page = store.page(0, limit);
    if (page.is_err()) {
        err << "cliped: " << QString::fromStdString(page.unwrap_err().message) << Qt::endl;
        return 1;
    }
    for (const auto& entry : page.unwrap()) {
        out << describe(entry) << Qt::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QGuiApplication app(argc, argv);

    app.setApplicationName("cliped");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("cliped");
    app.setOrganizationDomain("cliped.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Clipboard history synced across your devices"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override the history database path."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption nameOption(
        QStringList{QStringLiteral("name")},
        QStringLiteral("Set and save this device's name."),
        QStringLiteral("name"));
    parser.addOption(nameOption);

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("port")},
        QStringLiteral("TCP port for peer connections (0 = any)."),
        QStringLiteral("port"));
    parser.addOption(portOption);

    const QCommandLineOption discoveryPortOption(
        QStringList{QStringLiteral("discovery-port")},
        QStringLiteral("UDP discovery port (0 disables discovery)."),
        QStringLiteral("port"));
    parser.addOption(discoveryPortOption);

    const QCommandLineOption capOption(
        QStringList{QStringLiteral("cap")},
        QStringLiteral("Number of history entries to keep."),
        QStringLiteral("entries"));
    parser.addOption(capOption);

    const QCommandLineOption limitOption(
        QStringList{QStringLiteral("limit")},
        QStringLiteral("Entries to print for 'history' (default 20)."),
        QStringLiteral("entries"),
        QStringLiteral("20"));
    parser.addOption(limitOption);

    const QCommandLineOption acceptOption(
        QStringList{QStringLiteral("accept")},
        QStringLiteral("Accept connection requests from this device id (repeatable)."),
        QStringLiteral("device-id"));
    parser.addOption(acceptOption);

    const QCommandLineOption connectOption(
        QStringList{QStringLiteral("connect")},
        QStringLiteral("Request a connection to the device at host[:discovery-port] (repeatable)."),
        QStringLiteral("host:port"));
    parser.addOption(connectOption);

    const QCommandLineOption noMonitorOption(
        QStringList{QStringLiteral("no-monitor")},
        QStringLiteral("Start with clipboard monitoring off."));
    parser.addOption(noMonitorOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets CLIPED_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Optional: 'history', 'count' or 'clear'."));
    parser.process(app);

    const bool debugSync = parser.isSet(debugSyncOption);
    if (debugSync) {
        cliped::enable_debug_logging();
    }

    QTextStream err(stderr);
    auto sodium = cliped::crypto::init();
    if (sodium.is_err()) {
        err << "cliped: " << QString::fromStdString(sodium.unwrap_err().message) << Qt::endl;
        return 1;
    }

    QSettings settings;
    auto config = cliped::app::load_core_config(settings);
    if (parser.isSet(dbPathOption)) {
        config.db_path = parser.value(dbPathOption).toStdString();
    }

    const auto readNumber = [&](const QCommandLineOption& option, int max, auto& target) -> bool {
        if (!parser.isSet(option)) return true;
        bool ok = false;
        const int value = parser.value(option).toInt(&ok);
        if (!ok || value < 0 || value > max) {
            err << "cliped: invalid value for --" << option.names().first() << Qt::endl;
            return false;
        }
        target = static_cast<std::remove_reference_t<decltype(target)>>(value);
        return true;
    };
    if (!readNumber(portOption, 65535, config.sync_port) ||
        !readNumber(discoveryPortOption, 65535, config.discovery_port) ||
        !readNumber(capOption, 1000000, config.history_cap)) {
        return 2;
    }
    if (config.history_cap < 1) {
        err << "cliped: --cap must be at least 1" << Qt::endl;
        return 2;
    }

    const auto deviceId = cliped::app::get_or_create_device_id(settings);
    if (parser.isSet(nameOption)) {
        const auto name = QString::fromStdString(
            cliped::normalize_device_name(parser.value(nameOption).toStdString()));
        if (name.isEmpty()) {
            err << "cliped: --name must not be blank" << Qt::endl;
            return 2;
        }
        cliped::app::save_device_name(settings, name);
    }

    const auto positional = parser.positionalArguments();
    if (!positional.isEmpty()) {
        const auto& command = positional.first();
        if (command != QStringLiteral("history") && command != QStringLiteral("count") &&
            command != QStringLiteral("clear")) {
            err << "cliped: unknown command '" << command << "'" << Qt::endl;
            return 2;
        }
        return run_store_command(command, config, deviceId,
                                 std::max(parser.value(limitOption).toInt(), 1));
    }

    cliped::app::install_file_logging();
    qInfo() << "cliped: logging to" << cliped::app::default_log_file_path();
    if (debugSync) {
        qInfo() << "cliped: sync debug enabled";
    }

    cliped::Device local;
    local.id = deviceId;
    local.name = cliped::app::load_device_name(settings).toStdString();
    local.last_seen = cliped::Timestamp::now();

    auto created = cliped::app::ClipedCore::create(config, local);
    if (created.is_err()) {
        qCritical() << "cliped: cannot start:" << QString::fromStdString(created.unwrap_err().message);
        return 1;
    }
    auto core = std::move(created).unwrap();
    core->attach_settings(&settings);

    cliped::platform::QtClipboardBackend clipboard;
    core->attach_clipboard(&clipboard);
    core->set_monitoring_enabled(!parser.isSet(noMonitorOption));

    std::set<cliped::Uuid> preapproved;
    for (const auto& value : parser.values(acceptOption)) {
        if (auto id = cliped::Uuid::parse(value.toStdString())) {
            preapproved.insert(*id);
        } else {
            qWarning() << "cliped: ignoring invalid --accept id" << value;
        }
    }

    QObject::connect(core.get(), &cliped::app::ClipedCore::connectionRequestReceived,
                     core.get(), [&core, &preapproved](const cliped::Device& device) {
                         if (preapproved.count(device.id) == 0) {
                             qInfo() << "cliped: connection request from" << QString::fromStdString(device.name)
                                     << cliped::qstr(device.id)
                                     << "(restart with --accept to approve)";
                             return;
                         }
                         auto accepted = core->accept_connection(device.id);
                         if (accepted.is_err()) {
                             qWarning() << "cliped: accept failed:"
                                        << QString::fromStdString(accepted.unwrap_err().message);
                         }
                     });
    QObject::connect(core.get(), &cliped::app::ClipedCore::connectionAccepted,
                     [](const cliped::Device& device) {
                         qInfo() << "cliped: connected to" << QString::fromStdString(device.name);
                     });
    QObject::connect(core.get(), &cliped::app::ClipedCore::deviceDisconnected,
                     [](const cliped::Device& device, const QString& reason) {
                         qInfo() << "cliped: disconnected from" << QString::fromStdString(device.name)
                                 << "reason:" << reason;
                     });
    QObject::connect(core.get(), &cliped::app::ClipedCore::transferFailed,
                     [](const QString& name, const QString& reason) {
                         qWarning() << "cliped: transfer of" << name << "failed:" << reason;
                     });
    QObject::connect(core.get(), &cliped::app::ClipedCore::syncFailed,
                     [](const QString& entryId, const cliped::Uuid& peer, const QString& reason) {
                         qWarning() << "cliped: entry" << entryId << "not synced to" << cliped::qstr(peer)
                                    << "reason:" << reason;
                     });
    QObject::connect(core.get(), &cliped::app::ClipedCore::connectionRequestFailed,
                     [](const cliped::Device& device, const QString& reason) {
                         qWarning() << "cliped: connection request to" << QString::fromStdString(device.name)
                                    << "failed:" << reason;
                     });

    auto started = core->start();
    if (started.is_err()) {
        qCritical() << "cliped: cannot listen:" << QString::fromStdString(started.unwrap_err().message);
        return 1;
    }
    qInfo() << "cliped: device" << cliped::qstr(deviceId) << "listening on port" << started.unwrap();

    for (const auto& target : parser.values(connectOption)) {
        auto requested = core->connect_to_address(target.toStdString());
        if (requested.is_err()) {
            qWarning() << "cliped: --connect" << target << "ignored:"
                       << QString::fromStdString(requested.unwrap_err().message);
        }
    }

    const int rc = app.exec();
    core->stop();
    return rc;
}
