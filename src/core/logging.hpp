#pragma once

#include "core/types.hpp"

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(clipedStoreLog)
Q_DECLARE_LOGGING_CATEGORY(clipedSyncLog)
Q_DECLARE_LOGGING_CATEGORY(clipedDiscoveryLog)
Q_DECLARE_LOGGING_CATEGORY(clipedTransferLog)

namespace cliped {

// Verbose sync tracing, switched on by CLIPED_DEBUG_SYNC or --debug-sync.
bool sync_debug_enabled();

// Turn on the debug level of every cliped.* category.
void enable_debug_logging();

inline QString qstr(const Uuid& id) {
    return QString::fromStdString(id.to_string());
}

} // namespace cliped
