#include <catch2/catch_test_macros.hpp>

#include "app/clipboard_backend.hpp"
#include "app/cliped_core.hpp"
#include "crypto/hash.hpp"
#include "network/device_registry.hpp"
#include "network/handshake.hpp"
#include "network/protocol.hpp"
#include "storage/clipboard_store.hpp"
#include "test_support.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSignalSpy>
#include <QTcpSocket>
#include <QTemporaryDir>

#include <functional>
#include <set>
#include <utility>
#include <vector>

using namespace cliped;
using cliped::app::ClipedCore;
using cliped::test::make_device;
using cliped::test::spinFor;
using cliped::test::spinUntil;

namespace {

constexpr int kWaitMs = 5000;

class FakeClipboard : public app::ClipboardBackend {
public:
    QString text() const override { return text_; }
    void set_text(const QString& text) override {
        text_ = text;
        emit textChanged(text);
    }

private:
    QString text_;
};

struct Node {
    QTemporaryDir dir;
    std::unique_ptr<ClipedCore> core;
    Device local;

    explicit Node(const std::string& name, const std::function<void(CoreConfig&)>& adjust = {}) {
        REQUIRE(dir.isValid());
        CoreConfig config;
        config.db_path = dir.filePath(QStringLiteral("history.db")).toStdString();
        config.staging_dir = dir.filePath(QStringLiteral("staging")).toStdString();
        config.download_dir = dir.filePath(QStringLiteral("downloads")).toStdString();
        config.sync_port = 0;
        config.discovery_port = 0;
        config.chunk_size = 4096;
        config.heartbeat_interval_ms = 200;
        config.heartbeat_timeout_ms = 1500;
        if (adjust) adjust(config);

        local = make_device(name, "127.0.0.1", 0);
        core = ClipedCore::create(config, local).unwrap();
    }

    bool start() {
        auto started = core->start();
        if (started.is_err()) return false;
        local = core->get_local_device();
        return true;
    }

    [[nodiscard]] Device as_seen_by_peer() const {
        auto device = local;
        device.address = "127.0.0.1";
        device.status = DeviceStatus::Discovered;
        return device;
    }

    [[nodiscard]] std::optional<DeviceStatus> status_of(const Node& other) const {
        auto found = core->registry().find(other.local.id);
        if (!found) return std::nullopt;
        return found->status;
    }

    [[nodiscard]] bool connected_to(const Node& other) const {
        return status_of(other) == DeviceStatus::Connected;
    }

    [[nodiscard]] int history_count() const {
        return core->get_clipboard_history_count().unwrap();
    }
};

#define START_OR_SKIP(node) \
    if (!(node).start()) { SKIP("TCP listen unavailable"); }

// a asks, b accepts.
void connect_pair(Node& a, Node& b) {
    REQUIRE(a.core->send_connection_request_to_device(b.as_seen_by_peer()).is_ok());
    REQUIRE(spinUntil([&] { return b.status_of(a) == DeviceStatus::PendingIncoming; }, kWaitMs));
    REQUIRE(b.core->accept_connection(a.local.id).is_ok());
    REQUIRE(spinUntil([&] { return a.connected_to(b) && b.connected_to(a); }, kWaitMs));
}

// A peer driven frame by frame over a plain socket. It never reads what
// it is sent.
struct RawPeer {
    QTcpSocket socket;
    Uuid id = Uuid::generate();

    // Connect to `host` and have it accept us.
    bool join(Node& host) {
        socket.connectToHost(QHostAddress::LocalHost, host.local.port);
        if (!socket.waitForConnected(kWaitMs)) return false;
        socket.setReadBufferSize(1024);

        network::PeerHello hello;
        hello.device_id = id;
        hello.name = QStringLiteral("Raw");
        hello.port = 1;
        if (!send(network::MessageType::ConnectionRequest, network::encode_peer_hello(hello))) {
            return false;
        }

        const bool pending = spinUntil([&] {
            auto device = host.core->registry().find(id);
            return device && device->status == DeviceStatus::PendingIncoming;
        }, kWaitMs);
        return pending && host.core->accept_connection(id).is_ok();
    }

    bool send(network::MessageType type, const QByteArray& payload) {
        socket.write(network::encode_frame(type, payload));
        return spinUntil([&] { return socket.bytesToWrite() == 0; }, kWaitMs);
    }
};

QString staging_of(const Node& node) {
    return node.dir.filePath(QStringLiteral("staging"));
}

QStringList staged_files(const Node& node) {
    return QDir(staging_of(node)).entryList(QDir::Files);
}

} // namespace

TEST_CASE("Sync: request, accept and exchange entries", "[integration][sync]") {
    Node a("Alpha");
    Node b("Beta");
    START_OR_SKIP(a);
    START_OR_SKIP(b);

    QSignalSpy requests(b.core.get(), &ClipedCore::connectionRequestReceived);
    QSignalSpy accepted(a.core.get(), &ClipedCore::connectionAccepted);

    REQUIRE(a.core->send_connection_request_to_device(b.as_seen_by_peer()).is_ok());
    REQUIRE(a.status_of(b) == DeviceStatus::PendingOutgoing);

    REQUIRE(spinUntil([&] { return requests.count() == 1; }, kWaitMs));
    const auto pending = b.core->get_pending_connections();
    REQUIRE(pending.size() == 1);
    REQUIRE(pending[0].id == a.local.id);
    REQUIRE(pending[0].name == "Alpha");

    // Nothing connects until the user says so.
    spinFor(200);
    REQUIRE(a.status_of(b) == DeviceStatus::PendingOutgoing);

    REQUIRE(b.core->accept_connection(a.local.id).is_ok());
    REQUIRE(spinUntil([&] { return accepted.count() == 1 && a.connected_to(b); }, kWaitMs));
    REQUIRE(b.connected_to(a));
    REQUIRE(b.core->get_pending_connections().empty());

    SECTION("Entries flow both ways") {
        REQUIRE(a.core->add_clipboard_item(create_text_entry("from alpha", a.local.id)).is_ok());
        REQUIRE(spinUntil([&] { return b.history_count() == 1; }, kWaitMs));
        REQUIRE(b.core->get_clipboard_history_paginated(0, 1).unwrap()[0].content == "from alpha");

        REQUIRE(b.core->add_clipboard_item(create_text_entry("from beta", b.local.id)).is_ok());
        REQUIRE(spinUntil([&] { return a.history_count() == 2; }, kWaitMs));
        REQUIRE(a.core->get_clipboard_history_paginated(0, 1).unwrap()[0].content == "from beta");

        // Received entries are not echoed back.
        spinFor(300);
        REQUIRE(a.history_count() == 2);
        REQUIRE(b.history_count() == 2);
    }

    SECTION("Copying the same text on both sides keeps one entry") {
        REQUIRE(a.core->add_clipboard_item(create_text_entry("same", a.local.id)).is_ok());
        REQUIRE(b.core->add_clipboard_item(create_text_entry("same", b.local.id)).is_ok());
        spinFor(500);
        REQUIRE(a.history_count() == 1);
        REQUIRE(b.history_count() == 1);
    }

    SECTION("Deletions stay local") {
        auto entry = a.core->add_clipboard_item(create_text_entry("keep remote", a.local.id)).unwrap();
        REQUIRE(spinUntil([&] { return b.history_count() == 1; }, kWaitMs));
        REQUIRE(a.core->delete_clipboard_item(entry.id).is_ok());
        spinFor(300);
        REQUIRE(b.history_count() == 1);
    }

    SECTION("Paused sync neither sends nor applies") {
        a.core->set_sync_enabled(false);
        REQUIRE(a.core->add_clipboard_item(create_text_entry("private", a.local.id)).is_ok());
        REQUIRE(b.core->add_clipboard_item(create_text_entry("ignored", b.local.id)).is_ok());
        spinFor(500);
        REQUIRE(b.history_count() == 1);
        REQUIRE(a.history_count() == 1);
        REQUIRE(a.connected_to(b));
    }

    SECTION("Remote text lands on the local clipboard once") {
        FakeClipboard clipboard;
        b.core->attach_clipboard(&clipboard);

        REQUIRE(a.core->add_clipboard_item(create_text_entry("mirrored", a.local.id)).is_ok());
        REQUIRE(spinUntil([&] { return clipboard.text() == QStringLiteral("mirrored"); }, kWaitMs));
        spinFor(300);
        REQUIRE(b.history_count() == 1);
        REQUIRE(a.history_count() == 1);
    }

    SECTION("Remove disconnects both sides") {
        QSignalSpy disconnected(b.core.get(), &ClipedCore::deviceDisconnected);
        REQUIRE(a.core->remove_device(b.local.id).is_ok());
        REQUIRE_FALSE(a.status_of(b).has_value());
        REQUIRE(spinUntil([&] { return disconnected.count() >= 1; }, kWaitMs));
        REQUIRE_FALSE(b.status_of(a).has_value());
        REQUIRE(b.core->get_connected_devices().empty());
    }

    SECTION("Stopping one side disconnects the other") {
        QSignalSpy disconnected(b.core.get(), &ClipedCore::deviceDisconnected);
        a.core->stop();
        REQUIRE(spinUntil([&] { return disconnected.count() >= 1; }, kWaitMs));
        const auto device = disconnected.at(0).at(0).value<Device>();
        REQUIRE(device.id == a.local.id);
        REQUIRE(device.status == DeviceStatus::Disconnected);
        REQUIRE(b.core->get_connected_devices().empty());
    }
}

TEST_CASE("Sync: deny removes the request on both sides", "[integration][sync]") {
    Node a("Alpha");
    Node b("Beta");
    START_OR_SKIP(a);
    START_OR_SKIP(b);

    QSignalSpy denied(a.core.get(), &ClipedCore::connectionDenied);

    REQUIRE(a.core->send_connection_request_to_device(b.as_seen_by_peer()).is_ok());
    REQUIRE(spinUntil([&] { return b.status_of(a) == DeviceStatus::PendingIncoming; }, kWaitMs));
    REQUIRE(b.core->deny_connection(a.local.id).is_ok());
    REQUIRE_FALSE(b.status_of(a).has_value());

    REQUIRE(spinUntil([&] { return denied.count() == 1; }, kWaitMs));
    REQUIRE_FALSE(a.status_of(b).has_value());
    REQUIRE(a.core->get_connected_devices().empty());

    SECTION("Accepting a denied request fails") {
        auto again = b.core->accept_connection(a.local.id);
        REQUIRE(again.is_err());
        REQUIRE(again.unwrap_err().is(ErrorCode::NotFound));
    }
}

TEST_CASE("Sync: crossing requests connect without a prompt", "[integration][sync]") {
    Node a("Alpha");
    Node b("Beta");
    START_OR_SKIP(a);
    START_OR_SKIP(b);

    QSignalSpy a_requests(a.core.get(), &ClipedCore::connectionRequestReceived);
    QSignalSpy b_requests(b.core.get(), &ClipedCore::connectionRequestReceived);

    REQUIRE(a.core->send_connection_request_to_device(b.as_seen_by_peer()).is_ok());
    REQUIRE(b.core->send_connection_request_to_device(a.as_seen_by_peer()).is_ok());

    REQUIRE(spinUntil([&] { return a.connected_to(b) && b.connected_to(a); }, kWaitMs));

    // Let the duplicate channel settle, then check traffic still flows.
    spinFor(300);
    REQUIRE(a.connected_to(b));
    REQUIRE(b.connected_to(a));
    REQUIRE(a.core->handshake().connected_peers().size() == 1);
    REQUIRE(b.core->handshake().connected_peers().size() == 1);

    REQUIRE(a.core->add_clipboard_item(create_text_entry("after crossing", a.local.id)).is_ok());
    REQUIRE(spinUntil([&] { return b.history_count() == 1; }, kWaitMs));
}

TEST_CASE("Sync: requests to unreachable devices fail", "[integration][sync]") {
    Node a("Alpha");
    START_OR_SKIP(a);

    QSignalSpy failed(a.core.get(), &ClipedCore::connectionRequestFailed);

    // Nothing listens on port 1.
    auto ghost = make_device("Ghost", "127.0.0.1", 1);
    REQUIRE(a.core->send_connection_request_to_device(ghost).is_ok());
    REQUIRE(spinUntil([&] { return failed.count() == 1; }, kWaitMs));
    REQUIRE(a.core->get_connected_devices().empty());

    SECTION("Accept without a request is an error") {
        auto result = a.core->accept_connection(Uuid::generate());
        REQUIRE(result.is_err());
    }
}

TEST_CASE("Sync: files are verified before they appear", "[integration][sync]") {
    Node a("Alpha");
    Node b("Beta");
    START_OR_SKIP(a);
    START_OR_SKIP(b);
    connect_pair(a, b);

    QByteArray content;
    for (int i = 0; i < 40000; ++i) {
        content.append(static_cast<char>('a' + (i % 26)));
    }
    const auto source = a.dir.filePath(QStringLiteral("report.txt"));
    {
        QFile file(source);
        REQUIRE(file.open(QIODevice::WriteOnly));
        REQUIRE(file.write(content) == content.size());
    }

    auto added = a.core->add_file_to_clipboard(source.toStdString());
    REQUIRE(added.is_ok());
    const auto entry = added.unwrap();
    REQUIRE(entry.content == "File: report.txt");

    REQUIRE(spinUntil([&] { return b.history_count() == 1; }, kWaitMs));
    const auto received = b.core->get_clipboard_history_paginated(0, 1).unwrap()[0];
    REQUIRE(received.id == entry.id);
    REQUIRE(received.file.has_value());
    REQUIRE(received.file->size == static_cast<uint64_t>(content.size()));

    const auto local_path = received.file->local_path;
    REQUIRE(QString::fromStdString(local_path).startsWith(b.dir.filePath(QStringLiteral("downloads"))));
    REQUIRE(b.core->get_file_content(local_path).unwrap() == content);

    // Nothing is left behind in staging.
    REQUIRE(QDir(b.dir.filePath(QStringLiteral("staging"))).entryList(QDir::Files).isEmpty());

    SECTION("Saving a copy picks a fresh name") {
        auto saved = b.core->save_received_file(content, "report.txt");
        REQUIRE(saved.is_ok());
        REQUIRE(QFileInfo(QString::fromStdString(saved.unwrap())).fileName() ==
                QStringLiteral("report (1).txt"));
    }
}

TEST_CASE("Sync: entries larger than one frame arrive in chunks", "[integration][sync]") {
    Node a("Alpha");
    Node b("Beta");
    START_OR_SKIP(a);
    START_OR_SKIP(b);
    connect_pair(a, b);

    int failed = 0;
    QObject::connect(a.core.get(), &ClipedCore::syncFailed,
                     [&](const QString&, const Uuid&, const QString&) { ++failed; });
    constexpr int kLargeWaitMs = 20000;

    SECTION("Two megabytes of text") {
        std::string content;
        content.reserve(2 * 1024 * 1024);
        for (int i = 0; content.size() < 2u * 1024 * 1024; ++i) {
            content += "line " + std::to_string(i) + " of a long paste\n";
        }
        REQUIRE(content.size() > a.core->config().max_frame_bytes);

        FakeClipboard clipboard;
        b.core->attach_clipboard(&clipboard);

        const auto entry = a.core->add_clipboard_item(create_text_entry(content, a.local.id)).unwrap();
        REQUIRE(spinUntil([&] { return b.history_count() == 1; }, kLargeWaitMs));

        const auto received = b.core->get_clipboard_history_paginated(0, 1).unwrap()[0];
        REQUIRE(received.id == entry.id);
        REQUIRE(received.content == content);
        REQUIRE(received.origin_device == a.local.id);
        REQUIRE_FALSE(received.file.has_value());
        REQUIRE(spinUntil([&] { return clipboard.text() == QString::fromStdString(content); }, kWaitMs));
    }

    SECTION("A large image") {
        std::string data_url = "data:image/png;base64,";
        while (data_url.size() < 1536 * 1024) {
            data_url += "iVBORw0KGgoAAAANSUhEUgAAAAEAAAABCAYAAAAfFcSJAAAADUlEQVR42mNk";
        }

        const auto entry = a.core->add_clipboard_item(create_image_entry(data_url, a.local.id)).unwrap();
        REQUIRE(spinUntil([&] { return b.history_count() == 1; }, kLargeWaitMs));

        const auto received = b.core->get_clipboard_history_paginated(0, 1).unwrap()[0];
        REQUIRE(received.id == entry.id);
        REQUIRE(received.content_type == ContentType::Image);
        REQUIRE(received.content == data_url);
    }

    REQUIRE(failed == 0);
    REQUIRE(staged_files(b).isEmpty());
    REQUIRE(a.connected_to(b));

    // Small entries still go in one frame afterwards.
    REQUIRE(a.core->add_clipboard_item(create_text_entry("small again", a.local.id)).is_ok());
    REQUIRE(spinUntil([&] { return b.history_count() == 2; }, kWaitMs));
}

TEST_CASE("Sync: an entry that cannot be sent is reported", "[integration][sync]") {
    Node a("Alpha");
    Node b("Beta");
    START_OR_SKIP(a);
    START_OR_SKIP(b);

    const auto source = a.dir.filePath(QStringLiteral("gone.txt"));
    {
        QFile file(source);
        REQUIRE(file.open(QIODevice::WriteOnly));
        REQUIRE(file.write("short lived") == 11);
    }
    const auto entry = a.core->add_file_to_clipboard(source.toStdString()).unwrap();
    REQUIRE(QFile::remove(source));

    connect_pair(a, b);
    std::vector<std::pair<QString, Uuid>> failures;
    QObject::connect(a.core.get(), &ClipedCore::syncFailed,
                     [&](const QString& entry_id, const Uuid& peer, const QString&) {
                         failures.emplace_back(entry_id, peer);
                     });

    // The replay reaches the file entry whose source vanished.
    REQUIRE(a.core->set_sync_mode(b.local.id, SyncMode::Total).is_ok());
    REQUIRE(failures.size() == 1);
    REQUIRE(failures[0].first == QString::fromStdString(entry.id));
    REQUIRE(failures[0].second == b.local.id);
    REQUIRE(a.connected_to(b));
}

TEST_CASE("Sync: per-device modes", "[integration][sync]") {
    Node a("Alpha");
    Node b("Beta");
    START_OR_SKIP(a);
    START_OR_SKIP(b);

    std::set<std::string> earlier;
    for (int i = 0; i < 3; ++i) {
        earlier.insert(a.core->add_clipboard_item(
            create_text_entry("before connecting " + std::to_string(i), a.local.id)).unwrap().id);
    }
    connect_pair(a, b);
    REQUIRE(a.core->registry().find(b.local.id)->sync_mode == SyncMode::Partial);

    SECTION("Partial sends only what is new") {
        REQUIRE(a.core->add_clipboard_item(create_text_entry("new", a.local.id)).is_ok());
        REQUIRE(spinUntil([&] { return b.history_count() == 1; }, kWaitMs));
        spinFor(300);
        REQUIRE(b.history_count() == 1);
    }

    SECTION("Total sends the history once") {
        REQUIRE(a.core->set_sync_mode(b.local.id, SyncMode::Total).is_ok());
        REQUIRE(spinUntil([&] { return b.history_count() == 3; }, kWaitMs));

        std::set<std::string> received;
        for (const auto& entry : b.core->get_clipboard_history_paginated(0, 10).unwrap()) {
            received.insert(entry.id);
        }
        REQUIRE(received == earlier);

        // Choosing Total again replays nothing new, and new entries still flow.
        REQUIRE(a.core->set_sync_mode(b.local.id, SyncMode::Total).is_ok());
        REQUIRE(a.core->add_clipboard_item(create_text_entry("after total", a.local.id)).is_ok());
        REQUIRE(spinUntil([&] { return b.history_count() == 4; }, kWaitMs));
    }

    SECTION("Disabled neither sends nor applies") {
        REQUIRE(a.core->set_sync_mode(b.local.id, SyncMode::Disabled).is_ok());
        REQUIRE(a.core->add_clipboard_item(create_text_entry("kept here", a.local.id)).is_ok());
        REQUIRE(b.core->add_clipboard_item(create_text_entry("not wanted", b.local.id)).is_ok());
        spinFor(500);
        REQUIRE(b.history_count() == 1);
        REQUIRE(a.history_count() == 4);
        REQUIRE(a.connected_to(b));

        // Back to Partial: new entries flow again.
        REQUIRE(a.core->set_sync_mode(b.local.id, SyncMode::Partial).is_ok());
        REQUIRE(a.core->add_clipboard_item(create_text_entry("welcome back", a.local.id)).is_ok());
        REQUIRE(spinUntil([&] { return b.history_count() == 2; }, kWaitMs));
    }

    SECTION("Only connected devices have a mode") {
        REQUIRE(a.core->set_sync_mode(Uuid::generate(), SyncMode::Total).unwrap_err().is(ErrorCode::NotFound));
    }
}

TEST_CASE("Sync: a peer that stops reading loses only its own channel", "[integration][sync]") {
    const auto roomy = [](CoreConfig& config) { config.history_cap = 1000; };
    const auto tight = [&roomy](CoreConfig& config) {
        roomy(config);
        config.max_queue_bytes = 256 * 1024;
        config.send_timeout_ms = 500;
        // The raw peer never answers pings; only backpressure may close it.
        config.heartbeat_timeout_ms = 0;
    };
    Node a("Alpha", tight);
    Node b("Beta", roomy);
    START_OR_SKIP(a);
    START_OR_SKIP(b);
    connect_pair(a, b);

    RawPeer stalled;
    REQUIRE(stalled.join(a));
    REQUIRE(a.core->handshake().connected_peers().size() == 2);

    QSignalSpy disconnected(a.core.get(), &ClipedCore::deviceDisconnected);
    const auto stalled_gone = [&] { return !a.core->registry().find(stalled.id).has_value(); };

    const std::string filler(64 * 1024, 'x');
    int sent = 0;
    while (sent < 300 && !stalled_gone()) {
        auto entry = create_text_entry(std::to_string(sent) + filler, a.local.id);
        REQUIRE(a.core->add_clipboard_item(entry).is_ok());
        ++sent;
        REQUIRE(spinUntil([&] { return b.history_count() == sent; }, kWaitMs));
    }

    REQUIRE(spinUntil(stalled_gone, kWaitMs));
    REQUIRE(disconnected.count() == 1);
    REQUIRE(disconnected.at(0).at(0).value<Device>().id == stalled.id);

    // Everything was recorded locally and the healthy peer kept up.
    REQUIRE(a.history_count() == sent);
    REQUIRE(a.connected_to(b));
    REQUIRE(b.connected_to(a));

    REQUIRE(a.core->add_clipboard_item(create_text_entry("still flowing", a.local.id)).is_ok());
    REQUIRE(spinUntil([&] { return b.history_count() == sent + 1; }, kWaitMs));
}

TEST_CASE("Sync: a transfer cut off midway leaves nothing behind", "[integration][sync]") {
    Node b("Beta");
    START_OR_SKIP(b);

    RawPeer sender;
    REQUIRE(sender.join(b));

    const QByteArray content(100000, 'k');
    FileMetadata meta;
    meta.name = "partial.bin";
    meta.size = static_cast<uint64_t>(content.size());
    meta.hash = crypto::to_hex(crypto::hash(std::string_view(content.constData(), content.size())));

    network::FileOffer offer;
    offer.transfer_id = Uuid::generate();
    offer.entry = create_file_entry(meta, sender.id);
    offer.chunk_size = 4096;
    REQUIRE(sender.send(network::MessageType::FileOffer, network::encode_file_offer(offer)));
    REQUIRE(sender.send(network::MessageType::FileChunk,
                        network::encode_file_chunk(network::FileChunk{offer.transfer_id, 0, content.left(4096)})));

    const auto part = QDir(staging_of(b)).filePath(
        QString::fromStdString(offer.transfer_id.to_string()) + QStringLiteral(".part"));
    REQUIRE(spinUntil([&] { return QFileInfo(part).size() == 4096; }, kWaitMs));

    QSignalSpy disconnected(b.core.get(), &ClipedCore::deviceDisconnected);
    sender.socket.abort();

    REQUIRE(spinUntil([&] { return disconnected.count() == 1; }, kWaitMs));
    REQUIRE(spinUntil([&] { return !QFile::exists(part); }, kWaitMs));
    REQUIRE(staged_files(b).isEmpty());
    REQUIRE(b.history_count() == 0);
    REQUIRE(QDir(b.dir.filePath(QStringLiteral("downloads"))).entryList(QDir::Files).isEmpty());
}
