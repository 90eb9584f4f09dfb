#include <catch2/catch_test_macros.hpp>

#include "network/discovery_datagram.hpp"

#include <QHostAddress>
#include <QJsonDocument>
#include <QJsonObject>

using namespace cliped;
using namespace cliped::network;

TEST_CASE("Discovery datagram: query identity survives the wire", "[integration][network][discovery]") {
    DiscoveryMessage message;
    message.kind = DiscoveryKind::Query;
    message.device_id = Uuid::generate();
    message.device_name = QStringLiteral("My Device");
    message.sync_port = 47888;

    const auto decoded = decode_discovery_datagram(encode_discovery_datagram(message));
    REQUIRE(decoded.is_ok());
    const auto& back = decoded.unwrap();
    REQUIRE(back.kind == DiscoveryKind::Query);
    REQUIRE(back.device_id == message.device_id);
    REQUIRE(back.device_name == message.device_name);
    REQUIRE(back.sync_port == 47888);

    SECTION("The sender address becomes the device address") {
        const auto device = device_from_message(back, QHostAddress(QStringLiteral("::ffff:192.168.50.10")));
        REQUIRE(device.address == "192.168.50.10");
        REQUIRE(device.port == 47888);
        REQUIRE(device.status == DeviceStatus::Discovered);
        REQUIRE(device.name == "My Device");
    }
}

TEST_CASE("Discovery datagram: rejects invalid json", "[integration][network][discovery]") {
    REQUIRE(decode_discovery_datagram(QByteArray("not-json")).is_err());
}

TEST_CASE("Discovery datagram: rejects wrong message type", "[integration][network][discovery]") {
    REQUIRE(decode_discovery_datagram(QByteArray("{\"t\":\"nope\"}")).is_err());
}

TEST_CASE("Discovery datagram: rejects bad fields", "[integration][network][discovery]") {
    DiscoveryMessage message;
    message.kind = DiscoveryKind::Reply;
    message.device_id = Uuid::generate();
    message.sync_port = 1234;
    auto obj = QJsonDocument::fromJson(encode_discovery_datagram(message)).object();

    SECTION("Version") {
        obj["v"] = 2;
        REQUIRE(decode_discovery_datagram(QJsonDocument(obj).toJson()).is_err());
    }
    SECTION("Port") {
        obj["port"] = 0;
        REQUIRE(decode_discovery_datagram(QJsonDocument(obj).toJson()).is_err());
    }
    SECTION("Kind") {
        obj["kind"] = QStringLiteral("shout");
        REQUIRE(decode_discovery_datagram(QJsonDocument(obj).toJson()).is_err());
    }
    SECTION("Nil id") {
        obj["id"] = QString::fromStdString(Uuid{}.to_string());
        REQUIRE(decode_discovery_datagram(QJsonDocument(obj).toJson()).is_err());
    }
}
