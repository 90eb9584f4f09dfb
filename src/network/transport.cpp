#include "network/transport.hpp"
#include "core/logging.hpp"

#include <QTimer>

#include <algorithm>

namespace cliped::network {

// ============================================================================
// Connection
// ============================================================================

Connection::Connection(ConnectionOptions options, QObject* parent)
    : QObject(parent)
    , options_(options)
    , connect_timer_(std::make_unique<QTimer>(this))
    , watchdog_timer_(std::make_unique<QTimer>(this))
    , heartbeat_timer_(std::make_unique<QTimer>(this))
{
    connect_timer_->setSingleShot(true);
    connect(connect_timer_.get(), &QTimer::timeout, this, [this]() {
        close(QStringLiteral("connect timed out"));
    });

    watchdog_timer_->setInterval(std::clamp(options_.send_timeout_ms / 4, 50, 1000));
    connect(watchdog_timer_.get(), &QTimer::timeout, this, &Connection::onWatchdogTick);

    heartbeat_timer_->setInterval(std::max(options_.heartbeat_interval_ms, 10));
    connect(heartbeat_timer_.get(), &QTimer::timeout, this, &Connection::onHeartbeatTick);
}

Connection::~Connection() {
    close(QStringLiteral("destroyed"), true);
}

void Connection::attachSocket() {
    connect(socket_.get(), &QTcpSocket::connected, this, &Connection::onSocketConnected);
    connect(socket_.get(), &QTcpSocket::disconnected, this, &Connection::onSocketDisconnected);
    connect(socket_.get(), &QTcpSocket::errorOccurred, this, &Connection::onSocketError);
    connect(socket_.get(), &QTcpSocket::readyRead, this, &Connection::onReadyRead);
    connect(socket_.get(), &QTcpSocket::bytesWritten, this, &Connection::onBytesWritten);
}

void Connection::connectToPeer(const QHostAddress& host, uint16_t port) {
    if (state_ != State::Idle) return;

    initiator_ = true;
    socket_ = std::make_unique<QTcpSocket>(this);
    attachSocket();

    setState(State::Connecting);
    connect_timer_->start(std::max(options_.connect_timeout_ms, 1));
    socket_->connectToHost(host, port);
}

void Connection::acceptConnection(QTcpSocket* socket) {
    if (state_ != State::Idle || socket == nullptr) return;

    initiator_ = false;
    socket->setParent(this);
    socket_.reset(socket);
    attachSocket();

    setState(State::Connected);
    established_ = true;
    startTimers();
    // Bytes may have arrived before we took the socket over.
    if (socket_->bytesAvailable() > 0) {
        QTimer::singleShot(0, this, &Connection::onReadyRead);
    }
}

void Connection::close(const QString& reason, bool quiet) {
    if (state_ == State::Closed || state_ == State::Idle) {
        state_ = State::Closed;
        return;
    }

    connect_timer_->stop();
    watchdog_timer_->stop();
    heartbeat_timer_->stop();
    setState(State::Closed);

    if (socket_) {
        // Detach first so the socket's own disconnected() does not re-enter.
        QObject::disconnect(socket_.get(), nullptr, this, nullptr);
        socket_->abort();
    }

    if (sync_debug_enabled()) {
        qCInfo(clipedSyncLog) << "SYNC: channel closed peer=" << qstr(peer_id_) << "reason=" << reason;
    }
    if (!quiet) {
        emit disconnected(reason);
    }
}

void Connection::closeGracefully() {
    if (state_ != State::Connected || !socket_) {
        close(QStringLiteral("closed"), true);
        return;
    }
    connect_timer_->stop();
    watchdog_timer_->stop();
    heartbeat_timer_->stop();
    setState(State::Closed);
    QObject::disconnect(socket_.get(), nullptr, this, nullptr);

    // The socket outlives this channel until its queue has drained.
    QTcpSocket* socket = socket_.release();
    socket->setParent(nullptr);
    connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
    QTimer::singleShot(std::max(options_.send_timeout_ms, 1), socket, [socket]() {
        socket->abort();
        socket->deleteLater();
    });
    socket->disconnectFromHost();
}

Result<void, Error> Connection::send(MessageType type, const QByteArray& payload) {
    if (state_ != State::Connected || !socket_) {
        return Result<void, Error>::err(Error{ErrorCode::NetworkUnreachable, "Not connected"});
    }
    if (static_cast<uint64_t>(payload.size()) > options_.max_frame_bytes) {
        return Result<void, Error>::err(Error{ErrorCode::Protocol, "Payload exceeds frame limit"});
    }

    const auto frame_size = MessageHeader::HEADER_SIZE + static_cast<uint64_t>(payload.size());
    if (queuedBytes() + frame_size > options_.max_queue_bytes) {
        qCWarning(clipedSyncLog) << "SYNC: send queue overflow peer=" << qstr(peer_id_)
                                 << "queued=" << queuedBytes();
        close(QStringLiteral("send queue overflow"));
        return Result<void, Error>::err(Error{ErrorCode::NetworkUnreachable, "Send queue overflow"});
    }
    return writeFrame(type, payload);
}

Result<void, Error> Connection::writeFrame(MessageType type, const QByteArray& payload) {
    if (queuedBytes() == 0) {
        // Stall time counts from when the queue became non-empty.
        last_write_progress_.restart();
    }
    const auto frame = encode_frame(type, payload);
    if (socket_->write(frame) != frame.size()) {
        const auto reason = socket_->errorString();
        close(reason);
        return Result<void, Error>::err(Error{ErrorCode::NetworkUnreachable, reason.toStdString()});
    }
    return Result<void, Error>::ok();
}

uint64_t Connection::queuedBytes() const {
    return socket_ ? static_cast<uint64_t>(socket_->bytesToWrite()) : 0;
}

QHostAddress Connection::peerAddress() const {
    return socket_ ? socket_->peerAddress() : QHostAddress{};
}

uint16_t Connection::peerPort() const {
    return socket_ ? socket_->peerPort() : 0;
}

void Connection::setState(State state) {
    state_ = state;
}

void Connection::startTimers() {
    last_inbound_.start();
    last_write_progress_.start();
    watchdog_timer_->start();
    if (options_.heartbeat_interval_ms > 0) {
        heartbeat_timer_->start();
    }
}

void Connection::onSocketConnected() {
    connect_timer_->stop();
    setState(State::Connected);
    established_ = true;
    startTimers();
    emit connected();
}

void Connection::onSocketDisconnected() {
    close(QStringLiteral("peer closed the connection"));
}

void Connection::onSocketError(QAbstractSocket::SocketError err) {
    if (err == QAbstractSocket::RemoteHostClosedError) {
        // disconnected() follows and carries the reason.
        return;
    }
    close(socket_ ? socket_->errorString() : QStringLiteral("socket error"));
}

void Connection::onReadyRead() {
    if (!socket_ || state_ != State::Connected) return;

    read_buffer_.append(socket_->readAll());
    last_inbound_.restart();

    while (read_buffer_.size() >= static_cast<qsizetype>(MessageHeader::HEADER_SIZE)) {
        auto header_result = deserializeHeader(read_buffer_.left(MessageHeader::HEADER_SIZE),
                                               options_.max_frame_bytes);
        if (header_result.is_err()) {
            qCWarning(clipedSyncLog) << "SYNC: bad frame from" << peerAddress().toString()
                                     << QString::fromStdString(header_result.unwrap_err().message);
            close(QStringLiteral("protocol error"));
            return;
        }

        const auto header = header_result.unwrap();
        const auto total_size = static_cast<qsizetype>(MessageHeader::HEADER_SIZE + header.length);
        if (read_buffer_.size() < total_size) {
            return;
        }

        const auto payload = read_buffer_.mid(MessageHeader::HEADER_SIZE, header.length);
        read_buffer_.remove(0, total_size);

        switch (header.type) {
            case MessageType::Ping: {
                auto ponged = send(MessageType::Pong);
                if (ponged.is_err() && sync_debug_enabled()) {
                    qCInfo(clipedSyncLog) << "SYNC: pong not sent peer=" << qstr(peer_id_)
                                          << QString::fromStdString(ponged.unwrap_err().message);
                }
                break;
            }
            case MessageType::Pong:
                break;
            default:
                emit messageReceived(header.type, payload);
                break;
        }

        // A handler may have closed us.
        if (state_ != State::Connected) return;
    }
}

void Connection::onBytesWritten(qint64 bytes) {
    if (bytes > 0) {
        last_write_progress_.restart();
    }
    if (queuedBytes() <= options_.max_queue_bytes / 4) {
        emit writable();
    }
}

void Connection::onWatchdogTick() {
    if (state_ != State::Connected) return;

    if (queuedBytes() > 0 && last_write_progress_.elapsed() > options_.send_timeout_ms) {
        qCWarning(clipedSyncLog) << "SYNC: send stalled peer=" << qstr(peer_id_)
                                 << "queued=" << queuedBytes();
        close(QStringLiteral("send stalled"));
        return;
    }
    if (options_.heartbeat_timeout_ms > 0 && last_inbound_.elapsed() > options_.heartbeat_timeout_ms) {
        qCWarning(clipedSyncLog) << "SYNC: heartbeat lost peer=" << qstr(peer_id_);
        close(QStringLiteral("heartbeat timeout"));
    }
}

void Connection::onHeartbeatTick() {
    if (state_ != State::Connected) return;
    auto pinged = send(MessageType::Ping);
    if (pinged.is_err() && sync_debug_enabled()) {
        qCInfo(clipedSyncLog) << "SYNC: ping not sent peer=" << qstr(peer_id_)
                              << QString::fromStdString(pinged.unwrap_err().message);
    }
}

// ============================================================================
// TransportServer
// ============================================================================

TransportServer::TransportServer(QObject* parent)
    : QObject(parent)
    , server_(std::make_unique<QTcpServer>(this))
{
    connect(server_.get(), &QTcpServer::newConnection,
            this, &TransportServer::onNewConnection);
}

TransportServer::~TransportServer() {
    close();
}

Result<uint16_t, Error> TransportServer::listen(uint16_t port) {
    if (!server_->listen(QHostAddress::Any, port)) {
        return Result<uint16_t, Error>::err(
            Error{ErrorCode::NetworkUnreachable, server_->errorString().toStdString()});
    }
    return Result<uint16_t, Error>::ok(server_->serverPort());
}

void TransportServer::close() {
    server_->close();
}

uint16_t TransportServer::port() const {
    return server_->serverPort();
}

bool TransportServer::isListening() const {
    return server_->isListening();
}

void TransportServer::onNewConnection() {
    while (server_->hasPendingConnections()) {
        QTcpSocket* socket = server_->nextPendingConnection();
        emit newConnection(socket);
    }
}

} // namespace cliped::network
