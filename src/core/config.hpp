#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace cliped {

/**
 * CoreConfig - Tunables for every core component.
 *
 * Defaults are usable as-is; the app layer overlays QSettings and command
 * line values on top.
 */
struct CoreConfig {
    // Storage
    std::string db_path;          // empty = in-memory
    std::string staging_dir;      // partial incoming files
    std::string download_dir;     // verified incoming files
    int history_cap = 100;

    // Network
    uint16_t sync_port = 51848;       // 0 = pick any free port
    uint16_t discovery_port = 51847;  // 0 = discovery disabled
    int discovery_interval_ms = 5000;
    int discovery_window_ms = 3000;
    std::vector<std::string> discovery_targets;  // extra unicast "host[:port]"

    int connect_timeout_ms = 5000;
    int send_timeout_ms = 15000;
    int heartbeat_interval_ms = 5000;
    int heartbeat_timeout_ms = 20000;

    uint64_t max_queue_bytes = 8ull * 1024 * 1024;
    uint32_t chunk_size = 64 * 1024;
    uint32_t max_frame_bytes = 1024 * 1024;
};

} // namespace cliped
