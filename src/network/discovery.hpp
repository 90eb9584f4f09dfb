#pragma once

#include "core/device.hpp"
#include "core/result.hpp"
#include "network/discovery_datagram.hpp"

#include <QHostAddress>
#include <QObject>
#include <QString>

#include <map>
#include <memory>
#include <string>
#include <vector>

class QUdpSocket;
class QTimer;

namespace cliped::network {

class DeviceRegistry;

struct DiscoveryOptions {
    uint16_t port = 51847;  // 0 = any free port (tests)
    int interval_ms = 5000;
    int window_ms = 3000;
    int peer_ttl_ms = 15000;  // unheard Discovered records are dropped after this
    std::vector<std::string> targets;  // unicast "host[:port]"
    bool broadcast = true;
    bool multicast = true;
};

/**
 * DiscoveryService - Periodic UDP query/reply cycle for LAN peers.
 *
 * Queries go out from an ephemeral socket to the broadcast address, the
 * multicast group and any unicast targets. A shared listener on the
 * discovery port answers queries by unicast back to the querier's ephemeral
 * port, so several instances on one host each get their own replies.
 * Responders are handed to the registry as they arrive; the cycle result
 * is emitted when the collection window closes.
 */
class DiscoveryService : public QObject {
    Q_OBJECT

public:
    static constexpr const char* kMulticastGroup = "239.255.51.47";

    DiscoveryService(DeviceRegistry& registry, DiscoveryOptions options, QObject* parent = nullptr);
    ~DiscoveryService() override;

    /**
     * Bind the sockets and start the cycle timer. A bind failure is
     * returned and also emitted through error().
     */
    [[nodiscard]] Result<void, Error> start();
    void stop();

    /**
     * Start a cycle now (or re-query if one is running). A new cycle first
     * drops Discovered records older than peer_ttl_ms.
     */
    void discover_now();

    void set_targets(std::vector<std::string> targets);

    [[nodiscard]] bool is_running() const { return listener_ != nullptr; }
    [[nodiscard]] bool cycle_active() const { return cycle_active_; }
    [[nodiscard]] uint16_t bound_port() const;

signals:
    void cycleStarted();
    void discoveryFinished(const std::vector<cliped::Device>& responders);
    void error(const QString& message);

private slots:
    void onListenerReadyRead();
    void onQuerySocketReadyRead();
    void onCycleTick();
    void onWindowClosed();

private:
    void sendQuery();
    void handleDatagram(QUdpSocket& socket, bool answer_queries);
    [[nodiscard]] DiscoveryMessage local_message(DiscoveryKind kind) const;

    DeviceRegistry& registry_;
    DiscoveryOptions options_;

    std::unique_ptr<QUdpSocket> listener_;
    std::unique_ptr<QUdpSocket> query_socket_;
    std::unique_ptr<QTimer> cycle_timer_;
    std::unique_ptr<QTimer> window_timer_;

    bool cycle_active_ = false;
    std::map<Uuid, Device> responders_;
};

/**
 * Split "host[:port]" into an address and port, using `default_port` when
 * none is given. Returns false for an unparseable host.
 */
bool parse_discovery_target(const std::string& target,
                            uint16_t default_port,
                            QHostAddress& address,
                            uint16_t& port);

} // namespace cliped::network
