#include "execd/log.h"
#include "execd/types.h"

#include <iostream>

namespace execd {

JsonlLogger::JsonlLogger(const std::string& path)
    : path_(path), out_(path, std::ios::out | std::ios::app) {}

void JsonlLogger::event(const std::string& name, const std::string& session_id, json_object* payload) {
    std::string ts = format_rfc3339_ms(Clock::now());

    json_object* line = json_object_new_object();
    json_object_object_add(line, "event", json_object_new_string(name.c_str()));
    json_object_object_add(line, "payload", payload ? payload : json_object_new_object());
    json_object_object_add(line, "session_id", json_object_new_string(session_id.c_str()));
    json_object_object_add(line, "ts", json_object_new_string(ts.c_str()));

    std::lock_guard<std::mutex> lk(mu_);
    json_object_object_add(line, "seq", json_object_new_int64((int64_t)++seq_));
    if (out_.is_open()) {
        out_ << json_object_to_json_string_ext(line, JSON_C_TO_STRING_PLAIN) << "\n";
        out_.flush();
    }
    json_object_put(line);
}

void log_line(const char* tag, const std::string& message) {
    static std::mutex mu;
    std::lock_guard<std::mutex> lk(mu);
    std::cerr << tag << " " << message << "\n";
}

} // namespace execd
