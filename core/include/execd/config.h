#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace execd {

enum class Profile { DEV, PROD };

// Detect profile from EXECD_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: no grace delay, sessions kept until restart
// PROD: short grace delay for streaming clients, finished sessions pruned after 1h
void apply_profile_defaults(Profile p);

struct Config {
    std::string output_dir;       // EXECD_OUTPUT_DIR, default: system temp dir
    std::string shell;            // EXECD_SHELL
    int tail_interval_ms{100};    // EXECD_TAIL_INTERVAL_MS
    size_t max_record_bytes{5 * 1024 * 1024}; // EXECD_MAX_RECORD_BYTES
    int grace_ms{0};              // EXECD_GRACE_MS
    int64_t session_ttl_sec{0};   // EXECD_SESSION_TTL_SEC, 0 = keep forever
    std::string event_log;        // EXECD_EVENT_LOG, empty = disabled
    int max_conns{64};            // EXECD_MAX_CONNS
};

// Reads the EXECD_* variables. Unset or malformed values keep the defaults.
Config load_config();

int64_t getenv_i64(const char* key, int64_t defv);

} // namespace execd
