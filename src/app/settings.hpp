#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <QSettings>
#include <QString>

namespace cliped::app {

inline constexpr const char* kSettingsDeviceId = "sync/device_id";
inline constexpr const char* kSettingsDeviceName = "sync/device_name";

/**
 * Read the persisted device id, generating and storing one on first run.
 */
Uuid get_or_create_device_id(QSettings& settings);

/**
 * Persisted device name, or the host name when none was saved.
 */
QString load_device_name(QSettings& settings);
void save_device_name(QSettings& settings, const QString& name);

/**
 * Load every core/* tunable. Paths default to locations under the
 * application data directory.
 */
CoreConfig load_core_config(QSettings& settings);

} // namespace cliped::app
