#include "core/logging.hpp"

#include <QtGlobal>

Q_LOGGING_CATEGORY(clipedStoreLog, "cliped.store", QtInfoMsg)
Q_LOGGING_CATEGORY(clipedSyncLog, "cliped.sync", QtInfoMsg)
Q_LOGGING_CATEGORY(clipedDiscoveryLog, "cliped.discovery", QtInfoMsg)
Q_LOGGING_CATEGORY(clipedTransferLog, "cliped.transfer", QtInfoMsg)

namespace cliped {

bool sync_debug_enabled() {
    return qEnvironmentVariableIsSet("CLIPED_DEBUG_SYNC");
}

void enable_debug_logging() {
    qputenv("CLIPED_DEBUG_SYNC", "1");
    QLoggingCategory::setFilterRules(QStringLiteral("cliped.*.debug=true\n"));
}

} // namespace cliped
