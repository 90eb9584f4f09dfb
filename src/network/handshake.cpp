#include "network/handshake.hpp"
#include "network/device_registry.hpp"
#include "network/handshake_policy.hpp"
#include "core/logging.hpp"

#include <algorithm>

namespace cliped::network {

namespace {

std::string address_string(const QHostAddress& address) {
    bool is_v4 = false;
    const auto v4 = address.toIPv4Address(&is_v4);
    return is_v4 ? QHostAddress(v4).toString().toStdString() : address.toString().toStdString();
}

Error not_found(const Uuid& id) {
    return Error{ErrorCode::NotFound, "unknown device " + id.to_string()};
}

} // namespace

HandshakeService::HandshakeService(DeviceRegistry& registry, ConnectionOptions options, QObject* parent)
    : QObject(parent)
    , registry_(registry)
    , options_(options)
    , server_(std::make_unique<TransportServer>(this))
{
    connect(server_.get(), &TransportServer::newConnection,
            this, &HandshakeService::onNewConnection);
    connect(&registry_, &DeviceRegistry::deviceRemoved,
            this, &HandshakeService::onRegistryDeviceRemoved);
}

HandshakeService::~HandshakeService() {
    QObject::disconnect(&registry_, nullptr, this, nullptr);
    for (auto& conn : connections_) {
        QObject::disconnect(conn.get(), nullptr, this, nullptr);
        conn->close(QStringLiteral("shutdown"), true);
    }
}

Result<uint16_t, Error> HandshakeService::start(uint16_t port) {
    if (server_->isListening()) {
        return Result<uint16_t, Error>::ok(server_->port());
    }
    auto listening = server_->listen(port);
    if (listening.is_err()) {
        qCWarning(clipedSyncLog) << "SYNC: listen failed:"
                                 << QString::fromStdString(listening.unwrap_err().message);
        return listening;
    }
    registry_.set_local_port(listening.unwrap());
    qCInfo(clipedSyncLog) << "SYNC: listening on port" << listening.unwrap();
    return listening;
}

void HandshakeService::stop() {
    server_->close();

    std::vector<Connection*> all;
    all.reserve(connections_.size());
    for (auto& conn : connections_) all.push_back(conn.get());
    for (auto* conn : all) retire(conn, true);

    for (const auto& device : registry_.list_connected()) {
        auto dropped = registry_.mark_disconnected(device.id);
        if (dropped.is_ok()) {
            emit channelClosed(device.id);
            emit deviceDisconnected(dropped.unwrap(), QStringLiteral("stopped"));
        }
    }
}

uint16_t HandshakeService::port() const {
    return server_->isListening() ? server_->port() : 0;
}

// ============================================================================
// User operations
// ============================================================================

Result<Device, Error> HandshakeService::send_connection_request(const Uuid& device_id) {
    auto moved = registry_.begin_outgoing(device_id);
    if (moved.is_err()) {
        return moved;
    }
    const auto& device = moved.unwrap();

    if (auto* old = channelFor(device_id)) {
        retire(old, false);
    }
    auto* conn = newConnection();
    conn->setPeerId(device_id);
    channels_[device_id] = conn;

    qCInfo(clipedSyncLog) << "SYNC: requesting connection device_id=" << qstr(device_id)
                          << "endpoint=" << QString::fromStdString(device.address)
                          << "port=" << device.port;
    conn->connectToPeer(QHostAddress(QString::fromStdString(device.address)), device.port);
    return moved;
}

Result<Device, Error> HandshakeService::accept(const Uuid& device_id) {
    auto accepted = registry_.accept(device_id);
    if (accepted.is_err()) {
        return accepted;
    }

    auto* conn = channelFor(device_id);
    if (conn && conn->isConnected()) {
        auto sent = conn->send(MessageType::ConnectionAccept, localHello());
        if (sent.is_err()) {
            // send() closed the channel; the disconnect path takes it from here.
            qCWarning(clipedSyncLog) << "SYNC: accept not delivered device_id=" << qstr(device_id)
                                     << QString::fromStdString(sent.unwrap_err().message);
        }
    } else {
        dialBack(accepted.unwrap());
    }

    qCInfo(clipedSyncLog) << "SYNC: accepted device_id=" << qstr(device_id);
    return accepted;
}

Result<Device, Error> HandshakeService::deny(const Uuid& device_id) {
    const auto found = registry_.find(device_id);
    if (!found) {
        return Result<Device, Error>::err(not_found(device_id));
    }
    if (found->status == DeviceStatus::PendingIncoming) {
        if (auto* conn = channelFor(device_id); conn && conn->isConnected()) {
            sendHello(conn, MessageType::ConnectionDeny);
        }
    }
    // Fails with InvalidState for any other status; the registry drops the
    // channel through deviceRemoved on success.
    return registry_.deny(device_id);
}

Result<Device, Error> HandshakeService::remove(const Uuid& device_id) {
    const auto found = registry_.find(device_id);
    if (!found) {
        return Result<Device, Error>::err(not_found(device_id));
    }

    if (auto* conn = channelFor(device_id); conn && conn->isConnected()) {
        sendHello(conn, MessageType::ConnectionRemove);
    }
    if (found->status == DeviceStatus::Connected) {
        emit channelClosed(device_id);
    }
    return registry_.remove(device_id);
}

Result<void, Error> HandshakeService::send_to(const Uuid& device_id,
                                              MessageType type,
                                              const QByteArray& payload) {
    const auto found = registry_.find(device_id);
    auto* conn = channelFor(device_id);
    if (!found || found->status != DeviceStatus::Connected || !conn) {
        return Result<void, Error>::err(
            Error{ErrorCode::NetworkUnreachable, "no channel to " + device_id.to_string()});
    }
    return conn->send(type, payload);
}

std::vector<Uuid> HandshakeService::connected_peers() const {
    std::vector<Uuid> peers;
    for (const auto& device : registry_.list_connected()) {
        auto* conn = channelFor(device.id);
        if (conn && conn->isConnected()) {
            peers.push_back(device.id);
        }
    }
    return peers;
}

uint64_t HandshakeService::queued_bytes(const Uuid& device_id) const {
    auto* conn = channelFor(device_id);
    return conn ? conn->queuedBytes() : 0;
}

// ============================================================================
// Channel plumbing
// ============================================================================

Connection* HandshakeService::newConnection() {
    auto owned = std::make_unique<Connection>(options_, this);
    auto* conn = owned.get();
    connections_.push_back(std::move(owned));

    connect(conn, &Connection::connected, this, [this, conn]() {
        onChannelConnected(conn);
    });
    connect(conn, &Connection::disconnected, this, [this, conn](const QString& reason) {
        onChannelDisconnected(conn, reason);
    });
    connect(conn, &Connection::messageReceived, this,
            [this, conn](MessageType type, const QByteArray& payload) {
                onChannelMessage(conn, type, payload);
            });
    connect(conn, &Connection::writable, this, [this, conn]() {
        const auto& peer = conn->peerId();
        if (!peer.is_nil() && channelFor(peer) == conn) {
            emit channelWritable(peer);
        }
    });
    return conn;
}

void HandshakeService::onNewConnection(QTcpSocket* socket) {
    auto* conn = newConnection();
    conn->acceptConnection(socket);
    if (sync_debug_enabled()) {
        qCInfo(clipedSyncLog) << "SYNC: incoming connection from" << conn->peerAddress().toString()
                              << "port=" << conn->peerPort();
    }
}

void HandshakeService::onRegistryDeviceRemoved(const Device& device) {
    if (auto* conn = channelFor(device.id)) {
        retire(conn, true);
    }
}

Connection* HandshakeService::channelFor(const Uuid& peer) const {
    auto it = channels_.find(peer);
    return it == channels_.end() ? nullptr : it->second;
}

Uuid HandshakeService::initiatorOf(const Connection* conn) const {
    return conn->isInitiator() ? registry_.local_device().id : conn->peerId();
}

QByteArray HandshakeService::localHello() const {
    const auto local = registry_.local_device();
    PeerHello hello;
    hello.device_id = local.id;
    hello.name = QString::fromStdString(local.name);
    hello.port = local.port;
    return encode_peer_hello(hello);
}

void HandshakeService::sendHello(Connection* conn, MessageType type) {
    auto sent = conn->send(type, localHello());
    if (sent.is_err()) {
        // send() closed the channel; the disconnect path takes it from here.
        qCWarning(clipedSyncLog) << "SYNC:" << message_type_name(type) << "not delivered device_id="
                                 << qstr(conn->peerId())
                                 << QString::fromStdString(sent.unwrap_err().message);
    }
}

void HandshakeService::retire(Connection* conn, bool graceful) {
    auto owned = std::find_if(connections_.begin(), connections_.end(),
                              [conn](const auto& c) { return c.get() == conn; });
    if (owned == connections_.end()) {
        return;
    }

    QObject::disconnect(conn, nullptr, this, nullptr);
    for (auto it = channels_.begin(); it != channels_.end();) {
        it = (it->second == conn) ? channels_.erase(it) : std::next(it);
    }

    owned->release();
    connections_.erase(owned);

    if (graceful) {
        conn->closeGracefully();
    } else {
        conn->close(QStringLiteral("retired"), true);
    }
    conn->deleteLater();
}

void HandshakeService::adopt(const Uuid& peer, Connection* conn) {
    conn->setPeerId(peer);
    auto* existing = channelFor(peer);
    if (existing == nullptr || existing == conn) {
        channels_[peer] = conn;
        return;
    }

    if (should_replace_channel(initiatorOf(existing), initiatorOf(conn))) {
        if (sync_debug_enabled()) {
            qCInfo(clipedSyncLog) << "SYNC: duplicate channel, keeping newer device_id=" << qstr(peer);
        }
        channels_[peer] = conn;
        retire(existing, false);
    } else {
        if (sync_debug_enabled()) {
            qCInfo(clipedSyncLog) << "SYNC: duplicate channel, keeping existing device_id=" << qstr(peer);
        }
        retire(conn, false);
    }
}

void HandshakeService::dialBack(const Device& device) {
    if (auto* old = channelFor(device.id)) {
        retire(old, false);
    }
    auto* conn = newConnection();
    conn->setPeerId(device.id);
    channels_[device.id] = conn;
    conn->connectToPeer(QHostAddress(QString::fromStdString(device.address)), device.port);
}

void HandshakeService::onChannelConnected(Connection* conn) {
    const auto peer = conn->peerId();
    const auto found = registry_.find(peer);
    if (!found || channelFor(peer) != conn) {
        retire(conn, false);
        return;
    }

    Result<void, Error> sent = Result<void, Error>::ok();
    if (found->status == DeviceStatus::PendingOutgoing) {
        sent = conn->send(MessageType::ConnectionRequest, localHello());
    } else if (found->status == DeviceStatus::Connected) {
        // Dial-back after accepting a request whose channel had closed.
        sent = conn->send(MessageType::ConnectionAccept, localHello());
    } else {
        retire(conn, false);
        return;
    }
    if (sent.is_err()) {
        qCWarning(clipedSyncLog) << "SYNC: handshake send failed device_id=" << qstr(peer)
                                 << QString::fromStdString(sent.unwrap_err().message);
    }
}

void HandshakeService::onChannelDisconnected(Connection* conn, const QString& reason) {
    const auto peer = conn->peerId();
    const bool chosen = !peer.is_nil() && channelFor(peer) == conn;
    const bool established = conn->wasEstablished();
    retire(conn, false);

    if (!chosen) {
        return;
    }
    const auto found = registry_.find(peer);
    if (!found) {
        return;
    }

    switch (found->status) {
        case DeviceStatus::Connected: {
            emit channelClosed(peer);
            auto dropped = registry_.mark_disconnected(peer);
            if (dropped.is_ok()) {
                qCInfo(clipedSyncLog) << "SYNC: device disconnected device_id=" << qstr(peer)
                                      << "reason=" << reason;
                emit deviceDisconnected(dropped.unwrap(), reason);
            }
            break;
        }
        case DeviceStatus::PendingOutgoing:
            if (!established) {
                qCWarning(clipedSyncLog) << "SYNC: connection request failed device_id=" << qstr(peer)
                                         << "reason=" << reason;
                emit requestFailed(*found, reason);
            } else if (sync_debug_enabled()) {
                qCInfo(clipedSyncLog) << "SYNC: pending channel closed device_id=" << qstr(peer);
            }
            break;
        case DeviceStatus::PendingIncoming:
            // accept() dials back.
            if (sync_debug_enabled()) {
                qCInfo(clipedSyncLog) << "SYNC: requester channel closed device_id=" << qstr(peer);
            }
            break;
        case DeviceStatus::Discovered:
        case DeviceStatus::Disconnected:
            break;
    }
}

// ============================================================================
// Inbound messages
// ============================================================================

void HandshakeService::onChannelMessage(Connection* conn, MessageType type, const QByteArray& payload) {
    switch (type) {
        case MessageType::ConnectionRequest:
            handleRequest(conn, payload);
            return;
        case MessageType::ConnectionAccept:
            handleAccept(conn, payload);
            return;
        case MessageType::ConnectionDeny:
            handleDeny(conn);
            return;
        case MessageType::ConnectionRemove:
            handleRemove(conn);
            return;
        default:
            break;
    }

    if (!is_known_message_type(static_cast<uint8_t>(type))) {
        qCWarning(clipedSyncLog) << "SYNC: unknown message type" << static_cast<int>(type)
                                 << "from" << conn->peerAddress().toString();
        return;
    }

    const auto peer = conn->peerId();
    const auto found = peer.is_nil() ? std::nullopt : registry_.find(peer);
    if (!found || found->status != DeviceStatus::Connected || channelFor(peer) != conn) {
        qCWarning(clipedSyncLog) << "SYNC: dropped" << message_type_name(type)
                                 << "from unconnected peer" << conn->peerAddress().toString();
        return;
    }

    registry_.touch(peer);
    emit peerMessage(peer, type, payload);
}

void HandshakeService::handleRequest(Connection* conn, const QByteArray& payload) {
    auto decoded = decode_peer_hello(payload);
    if (decoded.is_err()) {
        qCWarning(clipedSyncLog) << "SYNC: malformed ConnectionRequest from" << conn->peerAddress().toString()
                                 << QString::fromStdString(decoded.unwrap_err().message);
        retire(conn, false);
        return;
    }
    const auto hello = std::move(decoded).unwrap();
    const auto local_id = registry_.local_device().id;
    const auto known = registry_.find(hello.device_id);

    const auto decision = decide_connection_request(
        local_id, hello.device_id,
        known ? std::optional<DeviceStatus>(known->status) : std::nullopt);

    Device requester;
    requester.id = hello.device_id;
    requester.name = hello.name.toStdString();
    requester.address = address_string(conn->peerAddress());
    requester.port = hello.port;
    requester.status = DeviceStatus::PendingIncoming;
    requester.last_seen = Timestamp::now();

    switch (decision.kind) {
        case RequestDecisionKind::Reject:
            qCWarning(clipedSyncLog) << "SYNC: ConnectionRequest rejected:" << decision.reason;
            retire(conn, false);
            return;

        case RequestDecisionKind::RecordPending:
        case RequestDecisionKind::RefreshPending: {
            auto recorded = registry_.record_incoming_request(requester);
            if (recorded.is_err()) {
                qCWarning(clipedSyncLog) << "SYNC: ConnectionRequest rejected:"
                                         << QString::fromStdString(recorded.unwrap_err().message);
                retire(conn, false);
                return;
            }
            // The newest request channel is the one to answer on.
            if (auto* old = channelFor(hello.device_id); old && old != conn) {
                retire(old, false);
            }
            conn->setPeerId(hello.device_id);
            channels_[hello.device_id] = conn;

            if (decision.kind == RequestDecisionKind::RecordPending) {
                qCInfo(clipedSyncLog) << "SYNC: ConnectionRequest received device_id="
                                      << qstr(hello.device_id) << "name=" << hello.name
                                      << "endpoint=" << QString::fromStdString(requester.address);
                emit connectionRequestReceived(recorded.unwrap());
            }
            return;
        }

        case RequestDecisionKind::MutualConsent: {
            auto confirmed = registry_.confirm_outgoing(hello.device_id);
            if (confirmed.is_err()) {
                retire(conn, false);
                return;
            }
            adopt(hello.device_id, conn);
            if (auto* chosen = channelFor(hello.device_id); chosen && chosen->isConnected()) {
                sendHello(chosen, MessageType::ConnectionAccept);
            }
            qCInfo(clipedSyncLog) << "SYNC: mutual request, connected device_id=" << qstr(hello.device_id);
            emit connectionAccepted(confirmed.unwrap());
            return;
        }

        case RequestDecisionKind::AlreadyConnected:
            adopt(hello.device_id, conn);
            if (channelFor(hello.device_id) == conn) {
                sendHello(conn, MessageType::ConnectionAccept);
            }
            return;
    }
}

void HandshakeService::handleAccept(Connection* conn, const QByteArray& payload) {
    auto decoded = decode_peer_hello(payload);
    if (decoded.is_err()) {
        qCWarning(clipedSyncLog) << "SYNC: malformed ConnectionAccept from" << conn->peerAddress().toString()
                                 << QString::fromStdString(decoded.unwrap_err().message);
        retire(conn, false);
        return;
    }
    const auto hello = std::move(decoded).unwrap();
    const auto local_id = registry_.local_device().id;
    const auto known = registry_.find(hello.device_id);

    switch (decide_connection_accept(local_id, hello.device_id,
                                     known ? std::optional<DeviceStatus>(known->status)
                                           : std::nullopt)) {
        case AcceptDecisionKind::Reject:
            qCWarning(clipedSyncLog) << "SYNC: unexpected ConnectionAccept from" << qstr(hello.device_id);
            retire(conn, false);
            return;

        case AcceptDecisionKind::Confirm: {
            auto confirmed = registry_.confirm_outgoing(hello.device_id);
            if (confirmed.is_err()) {
                retire(conn, false);
                return;
            }
            adopt(hello.device_id, conn);
            qCInfo(clipedSyncLog) << "SYNC: connection accepted device_id=" << qstr(hello.device_id);
            emit connectionAccepted(confirmed.unwrap());
            return;
        }

        case AcceptDecisionKind::AlreadyConnected:
            adopt(hello.device_id, conn);
            return;
    }
}

void HandshakeService::handleDeny(Connection* conn) {
    const auto peer = conn->peerId();
    const auto found = peer.is_nil() ? std::nullopt : registry_.find(peer);
    if (!found || found->status != DeviceStatus::PendingOutgoing || channelFor(peer) != conn) {
        retire(conn, false);
        return;
    }

    auto dropped = registry_.remove(peer);
    if (dropped.is_ok()) {
        qCInfo(clipedSyncLog) << "SYNC: connection denied device_id=" << qstr(peer);
        emit connectionDenied(dropped.unwrap());
    }
    retire(conn, false);
}

void HandshakeService::handleRemove(Connection* conn) {
    const auto peer = conn->peerId();
    const auto found = peer.is_nil() ? std::nullopt : registry_.find(peer);
    if (!found || channelFor(peer) != conn) {
        retire(conn, false);
        return;
    }

    retire(conn, false);
    if (found->status == DeviceStatus::Connected) {
        emit channelClosed(peer);
        auto dropped = registry_.mark_disconnected(peer);
        if (dropped.is_ok()) {
            qCInfo(clipedSyncLog) << "SYNC: removed by peer device_id=" << qstr(peer);
            emit deviceDisconnected(dropped.unwrap(), QStringLiteral("removed by peer"));
        }
    } else {
        auto dropped = registry_.remove(peer);
        if (dropped.is_err()) {
            qCWarning(clipedSyncLog) << "SYNC: cannot drop removed device_id=" << qstr(peer)
                                     << QString::fromStdString(dropped.unwrap_err().message);
        }
    }
}

} // namespace cliped::network
