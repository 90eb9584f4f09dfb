#pragma once

#include "core/device.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QString>

namespace cliped::network {

// Discovery datagram codec, kept apart from the sockets so it can be tested
// without a network.

enum class DiscoveryKind {
    Query,  // "who is there?", carries the querier's identity
    Reply,  // unicast answer to a query
};

struct DiscoveryMessage {
    static constexpr int kVersion = 1;

    DiscoveryKind kind = DiscoveryKind::Query;
    Uuid device_id;
    QString device_name;
    uint16_t sync_port = 0;
    int version = kVersion;
};

QByteArray encode_discovery_datagram(const DiscoveryMessage& message);

Result<DiscoveryMessage, Error> decode_discovery_datagram(const QByteArray& datagram);

/**
 * The registry record for a datagram's sender.
 */
Device device_from_message(const DiscoveryMessage& message, const QHostAddress& sender);

} // namespace cliped::network
