#include "network/discovery.hpp"
#include "network/device_registry.hpp"
#include "core/logging.hpp"

#include <QNetworkDatagram>
#include <QTimer>
#include <QUdpSocket>

namespace cliped::network {

bool parse_discovery_target(const std::string& target,
                            uint16_t default_port,
                            QHostAddress& address,
                            uint16_t& port) {
    auto text = QString::fromStdString(target).trimmed();
    port = default_port;

    // "[v6]:port", "v4:port" or a bare address.
    if (text.startsWith(QLatin1Char('['))) {
        const auto close = text.indexOf(QLatin1Char(']'));
        if (close < 0) return false;
        const auto rest = text.mid(close + 1);
        if (rest.startsWith(QLatin1Char(':'))) {
            bool ok = false;
            const auto value = rest.mid(1).toUInt(&ok);
            if (!ok || value == 0 || value > 65535) return false;
            port = static_cast<uint16_t>(value);
        }
        text = text.mid(1, close - 1);
    } else if (text.count(QLatin1Char(':')) == 1) {
        const auto colon = text.indexOf(QLatin1Char(':'));
        bool ok = false;
        const auto value = text.mid(colon + 1).toUInt(&ok);
        if (!ok || value == 0 || value > 65535) return false;
        port = static_cast<uint16_t>(value);
        text = text.left(colon);
    }

    if (text.compare(QStringLiteral("localhost"), Qt::CaseInsensitive) == 0) {
        address = QHostAddress(QHostAddress::LocalHost);
        return true;
    }
    return address.setAddress(text);
}

DiscoveryService::DiscoveryService(DeviceRegistry& registry, DiscoveryOptions options, QObject* parent)
    : QObject(parent)
    , registry_(registry)
    , options_(std::move(options))
    , cycle_timer_(std::make_unique<QTimer>(this))
    , window_timer_(std::make_unique<QTimer>(this))
{
    cycle_timer_->setInterval(options_.interval_ms);
    window_timer_->setSingleShot(true);
    window_timer_->setInterval(options_.window_ms);

    connect(cycle_timer_.get(), &QTimer::timeout, this, &DiscoveryService::onCycleTick);
    connect(window_timer_.get(), &QTimer::timeout, this, &DiscoveryService::onWindowClosed);
}

DiscoveryService::~DiscoveryService() {
    stop();
}

Result<void, Error> DiscoveryService::start() {
    if (listener_) {
        return Result<void, Error>::ok();
    }

    auto fail = [this](QUdpSocket& socket) {
        const auto msg = socket.errorString();
        qCWarning(clipedDiscoveryLog) << "DISCOVERY: bind failed:" << msg;
        listener_.reset();
        query_socket_.reset();
        emit error(msg);
        return Result<void, Error>::err(
            Error{ErrorCode::NetworkUnreachable, "discovery bind failed: " + msg.toStdString()});
    };

    listener_ = std::make_unique<QUdpSocket>(this);
    if (!listener_->bind(QHostAddress::AnyIPv4, options_.port,
                         QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        return fail(*listener_);
    }
    if (options_.multicast) {
        const QHostAddress group(QString::fromLatin1(kMulticastGroup));
        if (!listener_->joinMulticastGroup(group)) {
            // Unicast and broadcast still work; some interfaces refuse multicast.
            qCDebug(clipedDiscoveryLog) << "DISCOVERY: multicast join failed:"
                                        << listener_->errorString();
        }
    }

    query_socket_ = std::make_unique<QUdpSocket>(this);
    if (!query_socket_->bind(QHostAddress::AnyIPv4, 0)) {
        return fail(*query_socket_);
    }
    query_socket_->setSocketOption(QAbstractSocket::MulticastTtlOption, 1);

    connect(listener_.get(), &QUdpSocket::readyRead, this, &DiscoveryService::onListenerReadyRead);
    connect(query_socket_.get(), &QUdpSocket::readyRead, this, &DiscoveryService::onQuerySocketReadyRead);

    cycle_timer_->start();
    qCInfo(clipedDiscoveryLog) << "DISCOVERY: listening on port" << bound_port();
    return Result<void, Error>::ok();
}

void DiscoveryService::stop() {
    cycle_timer_->stop();
    window_timer_->stop();
    cycle_active_ = false;
    responders_.clear();

    if (listener_ && options_.multicast) {
        listener_->leaveMulticastGroup(QHostAddress(QString::fromLatin1(kMulticastGroup)));
    }
    listener_.reset();
    query_socket_.reset();
}

uint16_t DiscoveryService::bound_port() const {
    return listener_ ? listener_->localPort() : 0;
}

void DiscoveryService::set_targets(std::vector<std::string> targets) {
    options_.targets = std::move(targets);
}

void DiscoveryService::discover_now() {
    if (!listener_) return;

    if (!cycle_active_) {
        const auto pruned = registry_.prune_discovered(options_.peer_ttl_ms);
        if (!pruned.empty() && sync_debug_enabled()) {
            qCInfo(clipedDiscoveryLog) << "DISCOVERY: pruned stale devices=" << pruned.size();
        }
        cycle_active_ = true;
        responders_.clear();
        emit cycleStarted();
        window_timer_->start();
    }
    sendQuery();
}

void DiscoveryService::onCycleTick() {
    discover_now();
}

void DiscoveryService::onWindowClosed() {
    if (!cycle_active_) return;
    cycle_active_ = false;

    std::vector<Device> found;
    found.reserve(responders_.size());
    for (auto& [id, device] : responders_) {
        found.push_back(std::move(device));
    }
    responders_.clear();

    if (sync_debug_enabled()) {
        qCInfo(clipedDiscoveryLog) << "DISCOVERY: cycle finished responders=" << found.size();
    }
    emit discoveryFinished(found);
}

DiscoveryMessage DiscoveryService::local_message(DiscoveryKind kind) const {
    const auto local = registry_.local_device();
    DiscoveryMessage message;
    message.kind = kind;
    message.device_id = local.id;
    message.device_name = QString::fromStdString(local.name);
    message.sync_port = local.port;
    return message;
}

void DiscoveryService::sendQuery() {
    if (!query_socket_) return;

    const auto message = local_message(DiscoveryKind::Query);
    if (message.sync_port == 0) {
        // Nothing to advertise until the sync listener is up.
        return;
    }
    const auto bytes = encode_discovery_datagram(message);

    if (options_.broadcast && options_.port != 0) {
        query_socket_->writeDatagram(bytes, QHostAddress::Broadcast, options_.port);
    }
    if (options_.multicast && options_.port != 0) {
        query_socket_->writeDatagram(bytes, QHostAddress(QString::fromLatin1(kMulticastGroup)),
                                     options_.port);
    }
    for (const auto& target : options_.targets) {
        QHostAddress address;
        uint16_t port = 0;
        if (!parse_discovery_target(target, options_.port, address, port) || port == 0) {
            qCWarning(clipedDiscoveryLog) << "DISCOVERY: bad target" << QString::fromStdString(target);
            continue;
        }
        query_socket_->writeDatagram(bytes, address, port);
    }
}

void DiscoveryService::onListenerReadyRead() {
    if (listener_) handleDatagram(*listener_, true);
}

void DiscoveryService::onQuerySocketReadyRead() {
    if (query_socket_) handleDatagram(*query_socket_, false);
}

void DiscoveryService::handleDatagram(QUdpSocket& socket, bool answer_queries) {
    const auto local_id = registry_.local_device().id;

    while (socket.hasPendingDatagrams()) {
        const auto datagram = socket.receiveDatagram();
        auto decoded = decode_discovery_datagram(datagram.data());
        if (decoded.is_err()) {
            qCDebug(clipedDiscoveryLog) << "DISCOVERY: dropped datagram from"
                                        << datagram.senderAddress().toString()
                                        << QString::fromStdString(decoded.unwrap_err().message);
            continue;
        }

        const auto message = std::move(decoded).unwrap();
        if (message.device_id == local_id) {
            continue;
        }

        auto device = device_from_message(message, datagram.senderAddress());
        registry_.upsert_discovered(device);
        if (cycle_active_) {
            responders_[device.id] = device;
        }

        if (answer_queries && message.kind == DiscoveryKind::Query && query_socket_) {
            const auto reply_message = local_message(DiscoveryKind::Reply);
            if (reply_message.sync_port == 0) continue;
            query_socket_->writeDatagram(encode_discovery_datagram(reply_message),
                                         datagram.senderAddress(),
                                         static_cast<quint16>(datagram.senderPort()));
        }
    }
}

} // namespace cliped::network
