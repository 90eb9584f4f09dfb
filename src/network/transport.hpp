#pragma once

#include "core/types.hpp"
#include "core/result.hpp"
#include "network/protocol.hpp"

#include <QByteArray>
#include <QElapsedTimer>
#include <QHostAddress>
#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>

#include <memory>

class QTimer;

namespace cliped::network {

struct ConnectionOptions {
    int connect_timeout_ms = 5000;
    int send_timeout_ms = 15000;
    int heartbeat_interval_ms = 5000;
    int heartbeat_timeout_ms = 20000;
    uint64_t max_queue_bytes = 8ull * 1024 * 1024;
    uint32_t max_frame_bytes = 1024 * 1024;
};

/**
 * Connection - One framed TCP channel to a peer.
 *
 * Outbound frames go through the socket's write buffer, which is this
 * peer's queue: a frame that would push it past max_queue_bytes, or a
 * queue that makes no progress for send_timeout_ms, closes the channel.
 * Ping/Pong heartbeats are handled here and never surface as messages.
 * Any malformed frame closes this channel only.
 */
class Connection : public QObject {
    Q_OBJECT

public:
    enum class State {
        Idle,
        Connecting,
        Connected,
        Closed,
    };

    explicit Connection(ConnectionOptions options, QObject* parent = nullptr);
    ~Connection() override;

    /**
     * Dial a peer (as initiator). Fails via disconnected() after
     * connect_timeout_ms.
     */
    void connectToPeer(const QHostAddress& host, uint16_t port);

    /**
     * Adopt a socket from TransportServer (as responder).
     */
    void acceptConnection(QTcpSocket* socket);

    /**
     * Close the channel. Emits disconnected(reason) once, unless `quiet`.
     */
    void close(const QString& reason, bool quiet = false);

    /**
     * Stop reading, flush what is queued, then close. Never emits
     * disconnected(); used after sending a final Deny or Remove.
     */
    void closeGracefully();

    /**
     * Queue a frame. Errors when the channel is not connected, the payload
     * exceeds the frame limit or the queue would overflow (which also closes
     * the channel).
     */
    Result<void, Error> send(MessageType type, const QByteArray& payload = {});

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] bool isConnected() const { return state_ == State::Connected; }
    [[nodiscard]] bool isInitiator() const { return initiator_; }
    // False when a dial never completed.
    [[nodiscard]] bool wasEstablished() const { return established_; }
    [[nodiscard]] uint64_t queuedBytes() const;
    [[nodiscard]] const ConnectionOptions& options() const { return options_; }

    [[nodiscard]] QHostAddress peerAddress() const;
    [[nodiscard]] uint16_t peerPort() const;

    // Set by the handshake layer once the peer has identified itself.
    void setPeerId(const Uuid& id) { peer_id_ = id; }
    [[nodiscard]] const Uuid& peerId() const { return peer_id_; }

signals:
    void connected();
    void disconnected(const QString& reason);
    void messageReceived(cliped::network::MessageType type, const QByteArray& payload);
    // The write queue drained below a quarter of its limit.
    void writable();

private slots:
    void onSocketConnected();
    void onSocketDisconnected();
    void onSocketError(QAbstractSocket::SocketError error);
    void onReadyRead();
    void onBytesWritten(qint64 bytes);
    void onWatchdogTick();
    void onHeartbeatTick();

private:
    void attachSocket();
    void setState(State state);
    void startTimers();
    Result<void, Error> writeFrame(MessageType type, const QByteArray& payload);

    ConnectionOptions options_;
    State state_ = State::Idle;
    bool initiator_ = false;
    bool established_ = false;
    Uuid peer_id_;

    std::unique_ptr<QTcpSocket> socket_;
    std::unique_ptr<QTimer> connect_timer_;
    std::unique_ptr<QTimer> watchdog_timer_;
    std::unique_ptr<QTimer> heartbeat_timer_;
    QByteArray read_buffer_;

    QElapsedTimer last_write_progress_;
    QElapsedTimer last_inbound_;
};

/**
 * TransportServer - Listens for incoming connections.
 */
class TransportServer : public QObject {
    Q_OBJECT

public:
    explicit TransportServer(QObject* parent = nullptr);
    ~TransportServer() override;

    /**
     * Start listening; 0 picks a free port. Returns the bound port.
     */
    Result<uint16_t, Error> listen(uint16_t port = 0);
    void close();

    [[nodiscard]] uint16_t port() const;
    [[nodiscard]] bool isListening() const;

signals:
    void newConnection(QTcpSocket* socket);

private slots:
    void onNewConnection();

private:
    std::unique_ptr<QTcpServer> server_;
};

} // namespace cliped::network

Q_DECLARE_METATYPE(cliped::network::MessageType)
