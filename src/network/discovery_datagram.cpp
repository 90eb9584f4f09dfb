#include "network/discovery_datagram.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace cliped::network {
namespace {

constexpr const char* kMsgType = "cliped-discovery";
constexpr int kMaxNameLength = 256;

QString kind_to_string(DiscoveryKind kind) {
    return kind == DiscoveryKind::Reply ? QStringLiteral("reply") : QStringLiteral("query");
}

Error protocol_error(const char* what) {
    return Error{ErrorCode::Protocol, std::string("discovery datagram: ") + what};
}

} // namespace

QByteArray encode_discovery_datagram(const DiscoveryMessage& message) {
    QJsonObject obj;
    obj["t"] = QString::fromLatin1(kMsgType);
    obj["v"] = message.version;
    obj["kind"] = kind_to_string(message.kind);
    obj["id"] = QString::fromStdString(message.device_id.to_string());
    obj["name"] = message.device_name;
    obj["port"] = static_cast<int>(message.sync_port);
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

Result<DiscoveryMessage, Error> decode_discovery_datagram(const QByteArray& datagram) {
    using R = Result<DiscoveryMessage, Error>;

    QJsonParseError parse_error{};
    const auto doc = QJsonDocument::fromJson(datagram, &parse_error);
    if (parse_error.error != QJsonParseError::NoError || !doc.isObject()) {
        return R::err(protocol_error("invalid json"));
    }

    const auto obj = doc.object();
    if (obj["t"].toString() != QString::fromLatin1(kMsgType)) {
        return R::err(protocol_error("wrong message type"));
    }
    if (!obj.contains("id") || !obj.contains("port") || !obj.contains("v") || !obj.contains("kind")) {
        return R::err(protocol_error("missing fields"));
    }

    DiscoveryMessage message;
    message.version = obj["v"].toInt();
    if (message.version != DiscoveryMessage::kVersion) {
        return R::err(protocol_error("unsupported version"));
    }

    const auto kind = obj["kind"].toString();
    if (kind == QStringLiteral("query")) {
        message.kind = DiscoveryKind::Query;
    } else if (kind == QStringLiteral("reply")) {
        message.kind = DiscoveryKind::Reply;
    } else {
        return R::err(protocol_error("unknown kind"));
    }

    auto id = Uuid::parse(obj["id"].toString().toStdString());
    if (!id || id->is_nil()) {
        return R::err(protocol_error("invalid device id"));
    }
    message.device_id = *id;

    const int port = obj["port"].toInt();
    if (port <= 0 || port > 65535) {
        return R::err(protocol_error("invalid port"));
    }
    message.sync_port = static_cast<uint16_t>(port);
    message.device_name = obj["name"].toString().left(kMaxNameLength);

    return R::ok(std::move(message));
}

Device device_from_message(const DiscoveryMessage& message, const QHostAddress& sender) {
    Device device;
    device.id = message.device_id;
    device.name = message.device_name.toStdString();

    // IPv4-mapped IPv6 senders show up on dual-stack sockets.
    bool is_v4 = false;
    const auto v4 = sender.toIPv4Address(&is_v4);
    device.address = is_v4 ? QHostAddress(v4).toString().toStdString()
                           : sender.toString().toStdString();
    device.port = message.sync_port;
    device.status = DeviceStatus::Discovered;
    device.last_seen = Timestamp::now();
    return device;
}

} // namespace cliped::network
