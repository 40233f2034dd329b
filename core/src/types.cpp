#include "execd/types.h"

#include <json-c/json.h>

#include <cstdio>
#include <ctime>

namespace execd {

const char* run_mode_name(RunMode m) {
    switch (m) {
        case RunMode::COMMAND:            return "command";
        case RunMode::BACKGROUND_COMMAND: return "background_command";
    }
    return "command";
}

CommandStatus status_from_kernel(const CommandKernel& k) {
    CommandStatus st;
    st.session_id = k.session_id;
    st.running = k.running;
    st.exit_code = k.exit_code;
    st.error = k.err_msg;
    st.started_at = k.started_at;
    st.finished_at = k.finished_at;
    return st;
}

std::string format_rfc3339_ms(TimePoint t) {
    using namespace std::chrono;
    auto ms = duration_cast<milliseconds>(t.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    int frac = static_cast<int>(ms % 1000);
    if (frac < 0) { frac += 1000; secs -= 1; }
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, frac);
    return buf;
}

std::string status_to_json(const CommandStatus& st) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "id", json_object_new_string(st.session_id.c_str()));
    json_object_object_add(o, "running", json_object_new_boolean(st.running ? 1 : 0));
    if (st.exit_code) {
        json_object_object_add(o, "exit_code", json_object_new_int(*st.exit_code));
    }
    if (!st.error.empty()) {
        json_object_object_add(o, "error", json_object_new_string(st.error.c_str()));
    }
    json_object_object_add(o, "started_at",
        json_object_new_string(format_rfc3339_ms(st.started_at).c_str()));
    if (st.finished_at) {
        json_object_object_add(o, "finished_at",
            json_object_new_string(format_rfc3339_ms(*st.finished_at).c_str()));
    }
    std::string out = json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
    json_object_put(o);
    return out;
}

} // namespace execd
