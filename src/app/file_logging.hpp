#pragma once

#include <QString>

namespace cliped::app {

// Installs a Qt message handler that appends every message to the log file
// and echoes it to stderr.
void install_file_logging();

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

} // namespace cliped::app
