#include "execd/config.h"
#include "execd/process.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>

namespace execd {

Profile detect_profile() {
    const char* env = std::getenv("EXECD_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("EXECD_TAIL_INTERVAL_MS", "100", NO_OVERWRITE);
            setenv("EXECD_GRACE_MS",         "0",   NO_OVERWRITE);
            setenv("EXECD_SESSION_TTL_SEC",  "0",   NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("EXECD_TAIL_INTERVAL_MS", "100",  NO_OVERWRITE);
            setenv("EXECD_GRACE_MS",         "200",  NO_OVERWRITE);
            setenv("EXECD_SESSION_TTL_SEC",  "3600", NO_OVERWRITE);
            break;
    }
}

int64_t getenv_i64(const char* key, int64_t defv) {
    if (const char* e = std::getenv(key)) {
        try { return std::stoll(e); } catch (const std::exception&) { return defv; }
    }
    return defv;
}

static std::string getenv_str(const char* key, const std::string& defv) {
    const char* e = std::getenv(key);
    if (!e || !*e) return defv;
    return e;
}

Config load_config() {
    Config c;

    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    c.output_dir = getenv_str("EXECD_OUTPUT_DIR", ec ? std::string("/tmp") : tmp.string());
    c.shell = getenv_str("EXECD_SHELL", default_shell());
    c.event_log = getenv_str("EXECD_EVENT_LOG", "");

    int64_t v = getenv_i64("EXECD_TAIL_INTERVAL_MS", c.tail_interval_ms);
    if (v >= 1 && v <= 10000) c.tail_interval_ms = (int)v;

    v = getenv_i64("EXECD_MAX_RECORD_BYTES", (int64_t)c.max_record_bytes);
    if (v >= 1024) c.max_record_bytes = (size_t)v;

    v = getenv_i64("EXECD_GRACE_MS", c.grace_ms);
    if (v >= 0 && v <= 60000) c.grace_ms = (int)v;

    v = getenv_i64("EXECD_SESSION_TTL_SEC", c.session_ttl_sec);
    if (v >= 0) c.session_ttl_sec = v;

    v = getenv_i64("EXECD_MAX_CONNS", c.max_conns);
    if (v >= 1 && v <= 4096) c.max_conns = (int)v;

    return c;
}

} // namespace execd
