#include <catch2/catch_test_macros.hpp>

#include "network/device_registry.hpp"
#include "test_support.hpp"

#include <QTest>

using namespace cliped;
using namespace cliped::network;
using cliped::test::make_device;

namespace {

Device local_device() {
    auto local = make_device("This Laptop", "0.0.0.0", 0);
    return local;
}

} // namespace

TEST_CASE("DeviceRegistry: local identity", "[registry]") {
    DeviceRegistry registry(local_device());

    SECTION("Rename trims whitespace") {
        int changes = 0;
        QObject::connect(&registry, &DeviceRegistry::localDeviceChanged,
                         [&](const Device&) { ++changes; });

        auto renamed = registry.rename("  Desk PC \t");
        REQUIRE(renamed.is_ok());
        REQUIRE(renamed.unwrap().name == "Desk PC");
        REQUIRE(registry.local_device().name == "Desk PC");
        REQUIRE(changes == 1);
    }

    SECTION("Blank names are rejected and the old name kept") {
        auto renamed = registry.rename("   ");
        REQUIRE(renamed.is_err());
        REQUIRE(renamed.unwrap_err().is(ErrorCode::InvalidName));
        REQUIRE(registry.local_device().name == "This Laptop");
    }

    SECTION("Local port") {
        registry.set_local_port(45123);
        REQUIRE(registry.local_device().port == 45123);
    }
}

TEST_CASE("DeviceRegistry: discovery upserts", "[registry]") {
    const auto local = local_device();
    DeviceRegistry registry(local);
    auto peer = make_device("Phone", "192.168.1.20", 41000);

    registry.upsert_discovered(peer);
    REQUIRE(registry.list_discovered().size() == 1);

    SECTION("A discovered record follows the responder") {
        peer.name = "Renamed Phone";
        peer.address = "192.168.1.21";
        registry.upsert_discovered(peer);
        auto found = registry.find(peer.id);
        REQUIRE(found.has_value());
        REQUIRE(found->name == "Renamed Phone");
        REQUIRE(found->address == "192.168.1.21");
        REQUIRE(registry.list_discovered().size() == 1);
    }

    SECTION("Upserting never changes status") {
        REQUIRE(registry.begin_outgoing(peer.id).is_ok());
        peer.name = "Other";
        registry.upsert_discovered(peer);
        auto found = registry.find(peer.id);
        REQUIRE(found->status == DeviceStatus::PendingOutgoing);
        REQUIRE(found->name == "Phone");
    }

    SECTION("The local device is never recorded") {
        registry.upsert_discovered(local);
        REQUIRE_FALSE(registry.find(local.id).has_value());
    }
}

TEST_CASE("DeviceRegistry: handshake transitions", "[registry]") {
    DeviceRegistry registry(local_device());
    const auto peer = make_device("Tablet");

    SECTION("Outgoing request confirmed") {
        registry.upsert_discovered(peer);
        REQUIRE(registry.begin_outgoing(peer.id).unwrap().status == DeviceStatus::PendingOutgoing);
        REQUIRE(registry.list_pending_outgoing().size() == 1);

        auto again = registry.begin_outgoing(peer.id);
        REQUIRE(again.is_err());
        REQUIRE(again.unwrap_err().is(ErrorCode::InvalidState));

        REQUIRE(registry.confirm_outgoing(peer.id).unwrap().status == DeviceStatus::Connected);
        REQUIRE(registry.list_connected().size() == 1);
        REQUIRE(registry.list_pending_outgoing().empty());
    }

    SECTION("Incoming request accepted") {
        REQUIRE(registry.record_incoming_request(peer).is_ok());
        REQUIRE(registry.list_pending_incoming().size() == 1);
        REQUIRE(registry.accept(peer.id).unwrap().status == DeviceStatus::Connected);

        // A second accept is not a silent success.
        auto twice = registry.accept(peer.id);
        REQUIRE(twice.is_err());
        REQUIRE(twice.unwrap_err().is(ErrorCode::InvalidState));
    }

    SECTION("Incoming request denied") {
        Device removed;
        QObject::connect(&registry, &DeviceRegistry::deviceRemoved,
                         [&](const Device& device) { removed = device; });

        REQUIRE(registry.record_incoming_request(peer).is_ok());
        REQUIRE(registry.deny(peer.id).is_ok());
        REQUIRE_FALSE(registry.find(peer.id).has_value());
        REQUIRE(removed.id == peer.id);
    }

    SECTION("Repeated requests refresh the pending record") {
        REQUIRE(registry.record_incoming_request(peer).is_ok());
        auto renamed = peer;
        renamed.name = "Tablet 2";
        REQUIRE(registry.record_incoming_request(renamed).is_ok());
        REQUIRE(registry.list_pending_incoming().size() == 1);
        REQUIRE(registry.find(peer.id)->name == "Tablet 2");
    }

    SECTION("A request from a connected peer is not recorded") {
        REQUIRE(registry.record_incoming_request(peer).is_ok());
        REQUIRE(registry.accept(peer.id).is_ok());
        auto result = registry.record_incoming_request(peer);
        REQUIRE(result.is_err());
        REQUIRE(registry.find(peer.id)->status == DeviceStatus::Connected);
    }

    SECTION("Accept and deny need a pending incoming request") {
        registry.upsert_discovered(peer);
        REQUIRE(registry.accept(peer.id).unwrap_err().is(ErrorCode::InvalidState));
        REQUIRE(registry.deny(peer.id).unwrap_err().is(ErrorCode::InvalidState));
        REQUIRE(registry.find(peer.id)->status == DeviceStatus::Discovered);
    }

    SECTION("Unknown devices are NotFound") {
        const auto unknown = Uuid::generate();
        REQUIRE(registry.begin_outgoing(unknown).unwrap_err().is(ErrorCode::NotFound));
        REQUIRE(registry.accept(unknown).unwrap_err().is(ErrorCode::NotFound));
        REQUIRE(registry.remove(unknown).unwrap_err().is(ErrorCode::NotFound));
    }
}

TEST_CASE("DeviceRegistry: disconnect and remove", "[registry]") {
    DeviceRegistry registry(local_device());
    const auto peer = make_device("Desktop");
    REQUIRE(registry.record_incoming_request(peer).is_ok());
    REQUIRE(registry.accept(peer.id).is_ok());

    std::vector<Device> removed;
    QObject::connect(&registry, &DeviceRegistry::deviceRemoved,
                     [&](const Device& device) { removed.push_back(device); });

    SECTION("Disconnect drops the record with a final snapshot") {
        auto dropped = registry.mark_disconnected(peer.id);
        REQUIRE(dropped.is_ok());
        REQUIRE(dropped.unwrap().status == DeviceStatus::Disconnected);
        REQUIRE(registry.list_connected().empty());
        REQUIRE_FALSE(registry.find(peer.id).has_value());
        REQUIRE(removed.size() == 1);
        REQUIRE(removed[0].status == DeviceStatus::Disconnected);

        // Only connected devices can disconnect.
        REQUIRE(registry.mark_disconnected(peer.id).unwrap_err().is(ErrorCode::NotFound));
    }

    SECTION("Remove works from any status") {
        REQUIRE(registry.remove(peer.id).unwrap().status == DeviceStatus::Connected);
        REQUIRE(registry.list_connected().empty());
    }

    SECTION("A forgotten device can be rediscovered and requested again") {
        REQUIRE(registry.remove(peer.id).is_ok());
        registry.upsert_discovered(peer);
        REQUIRE(registry.begin_outgoing(peer.id).is_ok());
    }
}

TEST_CASE("DeviceRegistry: each device is in exactly one list", "[registry]") {
    DeviceRegistry registry(local_device());
    std::vector<Device> peers;
    for (int i = 0; i < 4; ++i) {
        peers.push_back(make_device("peer " + std::to_string(i)));
        registry.upsert_discovered(peers.back());
    }
    REQUIRE(registry.begin_outgoing(peers[1].id).is_ok());
    REQUIRE(registry.record_incoming_request(peers[2]).is_ok());
    REQUIRE(registry.begin_outgoing(peers[3].id).is_ok());
    REQUIRE(registry.confirm_outgoing(peers[3].id).is_ok());

    const auto total = registry.list_discovered().size() + registry.list_pending_outgoing().size() +
                       registry.list_pending_incoming().size() + registry.list_connected().size();
    REQUIRE(total == peers.size());
    REQUIRE(registry.list_discovered().front().id == peers[0].id);
    REQUIRE(registry.list_pending_outgoing().front().id == peers[1].id);
    REQUIRE(registry.list_pending_incoming().front().id == peers[2].id);
    REQUIRE(registry.list_connected().front().id == peers[3].id);
}

TEST_CASE("DeviceRegistry: stale discovered records are pruned", "[registry]") {
    DeviceRegistry registry(local_device());
    const auto quiet = make_device("Quiet Phone");
    const auto requesting = make_device("Requesting Tablet");
    registry.upsert_discovered(quiet);
    REQUIRE(registry.record_incoming_request(requesting).is_ok());

    std::vector<Device> removed;
    QObject::connect(&registry, &DeviceRegistry::deviceRemoved,
                     [&](const Device& device) { removed.push_back(device); });

    SECTION("Fresh records survive") {
        REQUIRE(registry.prune_discovered(60000).empty());
        REQUIRE(registry.list_discovered().size() == 1);
        REQUIRE(removed.empty());
    }

    SECTION("Only Discovered records age out") {
        QTest::qSleep(30);
        const auto dropped = registry.prune_discovered(10);
        REQUIRE(dropped.size() == 1);
        REQUIRE(dropped[0].id == quiet.id);
        REQUIRE(registry.list_discovered().empty());
        REQUIRE(registry.list_pending_incoming().size() == 1);
        REQUIRE(removed.size() == 1);
        REQUIRE(removed[0].id == quiet.id);
    }

    SECTION("A fresh sighting keeps the record") {
        QTest::qSleep(30);
        registry.upsert_discovered(quiet);
        REQUIRE(registry.prune_discovered(10).empty());
        REQUIRE(registry.find(quiet.id).has_value());
    }
}

TEST_CASE("DeviceRegistry: sync mode", "[registry]") {
    DeviceRegistry registry(local_device());
    const auto peer = make_device("Desktop");

    SECTION("New connections sync partially") {
        REQUIRE(registry.record_incoming_request(peer).is_ok());
        REQUIRE(registry.accept(peer.id).unwrap().sync_mode == SyncMode::Partial);
    }

    SECTION("Connected peers take a new mode") {
        REQUIRE(registry.record_incoming_request(peer).is_ok());
        REQUIRE(registry.accept(peer.id).is_ok());

        int changes = 0;
        QObject::connect(&registry, &DeviceRegistry::deviceChanged,
                         [&](const Device&) { ++changes; });
        REQUIRE(registry.set_sync_mode(peer.id, SyncMode::Disabled).unwrap().sync_mode ==
                SyncMode::Disabled);
        REQUIRE(registry.find(peer.id)->sync_mode == SyncMode::Disabled);
        REQUIRE(changes == 1);
    }

    SECTION("Only connected peers have a mode to change") {
        registry.upsert_discovered(peer);
        REQUIRE(registry.set_sync_mode(peer.id, SyncMode::Total).unwrap_err().is(ErrorCode::InvalidState));
        REQUIRE(registry.find(peer.id)->sync_mode == SyncMode::Partial);
        REQUIRE(registry.set_sync_mode(Uuid::generate(), SyncMode::Total)
                    .unwrap_err().is(ErrorCode::NotFound));
    }

    SECTION("Mode names") {
        REQUIRE(sync_mode_from_string("total") == SyncMode::Total);
        REQUIRE(sync_mode_from_string(sync_mode_to_string(SyncMode::Disabled)) == SyncMode::Disabled);
        REQUIRE_FALSE(sync_mode_from_string("everything").has_value());
    }
}
