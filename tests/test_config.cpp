#include "test_common.h"
#include "execd/config.h"
#include <cstdlib>

int main() {
    // Test 1: Default profile is DEV
    unsetenv("EXECD_PROFILE");
    auto p = execd::detect_profile();
    expect_true(p == execd::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection, case insensitive
    setenv("EXECD_PROFILE", "PROD", 1);
    p = execd::detect_profile();
    expect_true(p == execd::Profile::PROD, "should detect PROD case-insensitive");
    setenv("EXECD_PROFILE", "production", 1);
    expect_true(execd::detect_profile() == execd::Profile::PROD, "production alias");

    // Test 3: Apply defaults (won't override existing)
    setenv("EXECD_GRACE_MS", "42", 1);
    unsetenv("EXECD_SESSION_TTL_SEC");
    execd::apply_profile_defaults(execd::Profile::PROD);
    std::string val = std::getenv("EXECD_GRACE_MS") ? std::getenv("EXECD_GRACE_MS") : "";
    expect_true(val == "42", "should NOT override pre-existing env var");
    val = std::getenv("EXECD_SESSION_TTL_SEC") ? std::getenv("EXECD_SESSION_TTL_SEC") : "";
    expect_true(val == "3600", "PROD should set SESSION_TTL_SEC=3600");

    // Test 4: load_config picks up values and rejects out-of-range ones
    setenv("EXECD_OUTPUT_DIR", "/var/tmp/execd", 1);
    setenv("EXECD_TAIL_INTERVAL_MS", "0", 1);
    setenv("EXECD_MAX_RECORD_BYTES", "65536", 1);
    setenv("EXECD_MAX_CONNS", "abc", 1);
    setenv("EXECD_EVENT_LOG", "/var/tmp/execd/events.jsonl", 1);
    auto cfg = execd::load_config();
    expect_true(cfg.output_dir == "/var/tmp/execd", "output dir from env");
    expect_eq_ll(cfg.tail_interval_ms, 100, "zero interval rejected");
    expect_eq_ll((long long)cfg.max_record_bytes, 65536, "max record bytes");
    expect_eq_ll(cfg.max_conns, 64, "malformed max conns keeps default");
    expect_eq_ll(cfg.grace_ms, 42, "grace from env");
    expect_eq_ll(cfg.session_ttl_sec, 3600, "ttl from profile default");
    expect_true(cfg.event_log == "/var/tmp/execd/events.jsonl", "event log path");
    expect_true(!cfg.shell.empty(), "shell has a default");

    // Test 5: getenv_i64
    setenv("EXECD_TEST_NUM", "-17", 1);
    expect_eq_ll(execd::getenv_i64("EXECD_TEST_NUM", 5), -17, "getenv_i64 parses");
    unsetenv("EXECD_TEST_NUM");
    expect_eq_ll(execd::getenv_i64("EXECD_TEST_NUM", 5), 5, "getenv_i64 default");

    // Test 6: Profile name
    expect_true(std::string(execd::profile_name(execd::Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(execd::profile_name(execd::Profile::PROD)) == "prod", "prod name");

    // Cleanup
    for (const char* k : {"EXECD_PROFILE", "EXECD_GRACE_MS", "EXECD_SESSION_TTL_SEC", "EXECD_OUTPUT_DIR",
                          "EXECD_TAIL_INTERVAL_MS", "EXECD_MAX_RECORD_BYTES", "EXECD_MAX_CONNS",
                          "EXECD_EVENT_LOG"}) {
        unsetenv(k);
    }

    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
