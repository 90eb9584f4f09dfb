#include <catch2/catch_test_macros.hpp>

#include "app/settings.hpp"

#include <QTemporaryDir>

using namespace cliped;
using namespace cliped::app;

TEST_CASE("Settings: device identity", "[settings]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("cliped.ini"));

    Uuid first;
    {
        QSettings settings(path, QSettings::IniFormat);
        first = get_or_create_device_id(settings);
        REQUIRE_FALSE(first.is_nil());
        REQUIRE(get_or_create_device_id(settings) == first);
        save_device_name(settings, QStringLiteral("Work Laptop"));
    }

    QSettings reopened(path, QSettings::IniFormat);
    REQUIRE(get_or_create_device_id(reopened) == first);
    REQUIRE(load_device_name(reopened) == QStringLiteral("Work Laptop"));

    SECTION("A corrupt id is replaced") {
        reopened.setValue(QString::fromLatin1(kSettingsDeviceId), QStringLiteral("not-a-uuid"));
        const auto replaced = get_or_create_device_id(reopened);
        REQUIRE_FALSE(replaced.is_nil());
        REQUIRE(replaced != first);
    }
}

TEST_CASE("Settings: core config", "[settings]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("cliped.ini")), QSettings::IniFormat);

    SECTION("Defaults") {
        const auto config = load_core_config(settings);
        const CoreConfig defaults;
        REQUIRE(config.history_cap == defaults.history_cap);
        REQUIRE(config.sync_port == defaults.sync_port);
        REQUIRE_FALSE(config.db_path.empty());
        REQUIRE_FALSE(config.download_dir.empty());
        REQUIRE(config.discovery_targets.empty());
    }

    SECTION("Overrides") {
        settings.setValue(QStringLiteral("core/history_cap"), 250);
        settings.setValue(QStringLiteral("core/discovery_port"), 0);
        settings.setValue(QStringLiteral("core/db_path"), QStringLiteral("/tmp/x.db"));
        settings.setValue(QStringLiteral("core/discovery_targets"),
                          QStringList{QStringLiteral("10.0.0.5"), QStringLiteral("  "),
                                      QStringLiteral("host.lan:6000")});

        const auto config = load_core_config(settings);
        REQUIRE(config.history_cap == 250);
        REQUIRE(config.discovery_port == 0);
        REQUIRE(config.db_path == "/tmp/x.db");
        REQUIRE(config.discovery_targets == std::vector<std::string>{"10.0.0.5", "host.lan:6000"});
    }

    SECTION("Garbage numbers fall back") {
        settings.setValue(QStringLiteral("core/history_cap"), QStringLiteral("lots"));
        settings.setValue(QStringLiteral("core/chunk_size"), -5);
        const auto config = load_core_config(settings);
        REQUIRE(config.history_cap == CoreConfig{}.history_cap);
        REQUIRE(config.chunk_size == CoreConfig{}.chunk_size);
    }

    SECTION("Out of range numbers fall back instead of wrapping") {
        settings.setValue(QStringLiteral("core/sync_port"), 70000);
        settings.setValue(QStringLiteral("core/discovery_port"), 65535);
        settings.setValue(QStringLiteral("core/history_cap"), 0);
        settings.setValue(QStringLiteral("core/heartbeat_interval_ms"), 5000000000ll);
        settings.setValue(QStringLiteral("core/max_frame_bytes"), 8ll * 1024 * 1024 * 1024);

        const auto config = load_core_config(settings);
        const CoreConfig defaults;
        REQUIRE(config.sync_port == defaults.sync_port);
        REQUIRE(config.discovery_port == 65535);
        REQUIRE(config.history_cap == defaults.history_cap);
        REQUIRE(config.heartbeat_interval_ms == defaults.heartbeat_interval_ms);
        REQUIRE(config.max_frame_bytes == defaults.max_frame_bytes);
    }

    SECTION("Chunks never outgrow the frame limit") {
        settings.setValue(QStringLiteral("core/max_frame_bytes"), 128 * 1024);
        settings.setValue(QStringLiteral("core/chunk_size"), 256 * 1024);
        const auto config = load_core_config(settings);
        REQUIRE(config.max_frame_bytes == 128u * 1024);
        REQUIRE(config.chunk_size == CoreConfig{}.chunk_size);
    }
}
