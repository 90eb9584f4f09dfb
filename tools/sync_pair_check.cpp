#include <QCoreApplication>
#include <QEventLoop>
#include <QTemporaryDir>
#include <QTimer>

#include "app/cliped_core.hpp"
#include "core/logging.hpp"
#include "crypto/hash.hpp"

namespace {

std::unique_ptr<cliped::app::ClipedCore> make_core(const QTemporaryDir& dir, const char* name) {
    cliped::CoreConfig config;
    config.db_path = dir.filePath(QStringLiteral("%1.db").arg(QLatin1String(name))).toStdString();
    config.staging_dir = dir.filePath(QStringLiteral("%1-staging").arg(QLatin1String(name))).toStdString();
    config.download_dir = dir.filePath(QStringLiteral("%1-downloads").arg(QLatin1String(name))).toStdString();
    config.sync_port = 0;
    config.discovery_port = 0;

    cliped::Device local;
    local.id = cliped::Uuid::generate();
    local.name = name;
    auto created = cliped::app::ClipedCore::create(config, local);
    if (created.is_err()) {
        qCritical().noquote() << name << "error:" << QString::fromStdString(created.unwrap_err().message);
        return nullptr;
    }
    return std::move(created).unwrap();
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    qputenv("CLIPED_DEBUG_SYNC", "1");
    if (cliped::crypto::init().is_err()) {
        return 1;
    }

    QTemporaryDir dir;
    if (!dir.isValid()) {
        return 1;
    }

    auto a = make_core(dir, "A");
    auto b = make_core(dir, "B");
    if (!a || !b) {
        return 1;
    }

    QObject::connect(a.get(), &cliped::app::ClipedCore::error, &app, [](const QString &msg) {
        qCritical().noquote() << "A error:" << msg;
    });
    QObject::connect(b.get(), &cliped::app::ClipedCore::error, &app, [](const QString &msg) {
        qCritical().noquote() << "B error:" << msg;
    });

    if (a->start().is_err() || b->start().is_err()) {
        return 1;
    }

    // B approves whatever asks; the point is the full round trip.
    QObject::connect(b.get(), &cliped::app::ClipedCore::connectionRequestReceived, &app,
                     [&](const cliped::Device &device) {
                         auto accepted = b->accept_connection(device.id);
                         if (accepted.is_err()) {
                             qCritical().noquote() << "B accept failed:"
                                                   << QString::fromStdString(accepted.unwrap_err().message);
                         }
                     });

    bool entryArrived = false;
    QObject::connect(a.get(), &cliped::app::ClipedCore::connectionAccepted, &app, [&](const cliped::Device &) {
        auto added = a->add_clipboard_item(cliped::create_text_entry("sync pair check", a->get_local_device().id));
        if (added.is_err()) {
            qCritical().noquote() << "A append failed:" << QString::fromStdString(added.unwrap_err().message);
        }
    });
    QObject::connect(b.get(), &cliped::app::ClipedCore::clipboardUpdated, &app,
                     [&](const cliped::ClipboardEntry &entry) {
                         entryArrived = entryArrived || entry.content == "sync pair check";
                     });

    auto target = b->get_local_device();
    target.address = "127.0.0.1";
    target.status = cliped::DeviceStatus::Discovered;
    if (a->send_connection_request_to_device(target).is_err()) {
        return 1;
    }

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    timeout.setInterval(5000);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);

    QTimer poll;
    poll.setInterval(20);
    QObject::connect(&poll, &QTimer::timeout, &loop, [&]() {
        if (entryArrived) {
            loop.quit();
        }
    });

    timeout.start();
    poll.start();
    loop.exec();

    if (!entryArrived) {
        return 2;
    }
    return 0;
}
