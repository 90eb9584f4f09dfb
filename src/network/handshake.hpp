#pragma once

#include "core/device.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "network/protocol.hpp"
#include "network/transport.hpp"

#include <QObject>
#include <QString>

#include <map>
#include <memory>
#include <vector>

namespace cliped::network {

class DeviceRegistry;

/**
 * HandshakeService - User-mediated connection protocol and channel ownership.
 *
 * Owns the TCP listener and one channel per remote device. Requests never
 * auto-accept; a request crossing our own pending request counts as
 * consent on both sides. When a pair ends up with two channels, both sides
 * keep the one initiated by the lower device id and drop the other
 * quietly. A Connected channel closing for any other reason disconnects
 * the device. Traffic from Connected peers that is not part of the
 * handshake is forwarded through peerMessage().
 */
class HandshakeService : public QObject {
    Q_OBJECT

public:
    HandshakeService(DeviceRegistry& registry, ConnectionOptions options, QObject* parent = nullptr);
    ~HandshakeService() override;

    /**
     * Listen for peers (0 = any free port) and publish the port as part of
     * the local identity.
     */
    [[nodiscard]] Result<uint16_t, Error> start(uint16_t port);
    void stop();
    [[nodiscard]] uint16_t port() const;

    /**
     * Discovered -> PendingOutgoing, then dial and send ConnectionRequest.
     */
    [[nodiscard]] Result<Device, Error> send_connection_request(const Uuid& device_id);

    /**
     * PendingIncoming -> Connected, answering on the request's channel or
     * dialing back when it is gone.
     */
    [[nodiscard]] Result<Device, Error> accept(const Uuid& device_id);

    /**
     * PendingIncoming -> removed, telling the requester.
     */
    [[nodiscard]] Result<Device, Error> deny(const Uuid& device_id);

    /**
     * Drop a device in any state; a live channel gets ConnectionRemove first.
     */
    [[nodiscard]] Result<Device, Error> remove(const Uuid& device_id);

    /**
     * Send to a Connected peer's channel.
     */
    Result<void, Error> send_to(const Uuid& device_id, MessageType type, const QByteArray& payload);

    [[nodiscard]] std::vector<Uuid> connected_peers() const;
    [[nodiscard]] uint64_t queued_bytes(const Uuid& device_id) const;
    [[nodiscard]] const ConnectionOptions& options() const { return options_; }

signals:
    void connectionRequestReceived(const cliped::Device& device);
    void connectionAccepted(const cliped::Device& device);
    void connectionDenied(const cliped::Device& device);
    void requestFailed(const cliped::Device& device, const QString& reason);
    void deviceDisconnected(const cliped::Device& device, const QString& reason);

    // A Connected peer's channel went away (any reason, including remove).
    void channelClosed(const cliped::Uuid& device_id);
    void channelWritable(const cliped::Uuid& device_id);
    void peerMessage(const cliped::Uuid& device_id,
                     cliped::network::MessageType type,
                     const QByteArray& payload);

private slots:
    void onNewConnection(QTcpSocket* socket);
    void onRegistryDeviceRemoved(const cliped::Device& device);

private:
    Connection* newConnection();
    void onChannelMessage(Connection* conn, MessageType type, const QByteArray& payload);
    void onChannelConnected(Connection* conn);
    void onChannelDisconnected(Connection* conn, const QString& reason);

    void handleRequest(Connection* conn, const QByteArray& payload);
    void handleAccept(Connection* conn, const QByteArray& payload);
    void handleDeny(Connection* conn);
    void handleRemove(Connection* conn);

    /**
     * Make `conn` the channel for `peer`, or drop it if the existing one
     * wins the lower-initiator tie-break.
     */
    void adopt(const Uuid& peer, Connection* conn);
    void dialBack(const Device& device);

    /**
     * Detach `conn` from the maps and delete it later. Quiet: no
     * disconnect handling.
     */
    void retire(Connection* conn, bool graceful);

    [[nodiscard]] Connection* channelFor(const Uuid& peer) const;
    [[nodiscard]] Uuid initiatorOf(const Connection* conn) const;
    [[nodiscard]] QByteArray localHello() const;
    // Send `type` with our hello; failures are logged.
    void sendHello(Connection* conn, MessageType type);

    DeviceRegistry& registry_;
    ConnectionOptions options_;
    std::unique_ptr<TransportServer> server_;

    // Every live connection, identified or not.
    std::vector<std::unique_ptr<Connection>> connections_;
    // The chosen channel per peer.
    std::map<Uuid, Connection*> channels_;
};

} // namespace cliped::network
