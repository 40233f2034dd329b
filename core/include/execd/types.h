#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace execd {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class RunMode {
    COMMAND,            // foreground: caller blocks and receives live records
    BACKGROUND_COMMAND, // detached: caller gets the id, polls status/output
};

const char* run_mode_name(RunMode m);

struct ExecuteRequest {
    RunMode mode{RunMode::COMMAND};
    std::string code;
    std::string cwd;
    std::string session_id;        // empty => server-generated
    std::vector<std::string> env;  // extra KEY=VALUE entries for the child
};

// Internal state record of one session. Owned by the SessionStore.
struct CommandKernel {
    std::string session_id;
    int pid{-1};
    std::string stdout_path;
    std::string stderr_path;
    std::string combined_path; // background sessions only
    bool is_background{false};
    bool running{false};
    bool interrupted{false};
    TimePoint started_at{};
    std::optional<TimePoint> finished_at;
    std::optional<int> exit_code;
    std::string err_msg;
};

// Point-in-time view of a session returned by the status API.
struct CommandStatus {
    std::string session_id;
    bool running{false};
    std::optional<int> exit_code;
    std::string error;
    TimePoint started_at{};
    std::optional<TimePoint> finished_at;
};

CommandStatus status_from_kernel(const CommandKernel& k);

// RFC 3339 UTC with millisecond precision, e.g. 2025-01-02T03:04:05.678Z
std::string format_rfc3339_ms(TimePoint t);

// Serialized status object: {"id","running","exit_code"?,"error"?,"started_at","finished_at"?}
std::string status_to_json(const CommandStatus& st);

} // namespace execd
