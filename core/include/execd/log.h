#pragma once

#include <json-c/json.h>

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace execd {

// Session lifecycle events as JSON Lines:
//   {"event":"session_exit","payload":{...},"session_id":"...","ts":"...","seq":7}
// Thread-safe; each line is flushed as it is written.
class JsonlLogger {
public:
    explicit JsonlLogger(const std::string& path);

    bool is_open() const { return out_.is_open(); }
    const std::string& path() const { return path_; }

    // Takes ownership of payload (may be null).
    void event(const std::string& name, const std::string& session_id, json_object* payload);

private:
    std::string path_;
    std::ofstream out_;
    std::mutex mu_;
    uint64_t seq_{0};
};

// Operational diagnostics: "<tag> <message>" on stderr, one line each.
void log_line(const char* tag, const std::string& message);

} // namespace execd
