#pragma once

// Execution engine: runs shell commands as sessions.
//
// Foreground (RunMode::COMMAND): run() blocks until the command exits,
// tailing its stdout/stderr capture files and invoking the hooks per record.
// Background (RunMode::BACKGROUND_COMMAND): run() returns once the process is
// started; a detached monitor records the exit on the session kernel.
//
// Session state lives in the injected SessionStore; the engine never caches
// it. Status and output queries go through status.h against the same store.

#include "capture.h"
#include "config.h"
#include "errors.h"
#include "log.h"
#include "session_store.h"
#include "tailer.h"
#include "types.h"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace execd {

struct EngineOptions {
    std::filesystem::path output_dir;
    std::string shell;
    TailOptions tail;
    int grace_ms{0}; // pause after the terminal hook so a streaming transport can flush
};

EngineOptions engine_options_from_config(const Config& c);

// Foreground callbacks. Calls for one run are serialized, never concurrent.
struct ExecHooks {
    std::function<void(const std::string& session_id)> on_init;
    std::function<void(const std::string& line)> on_stdout;
    std::function<void(const std::string& line)> on_stderr;
    std::function<void(const ExecError& err)> on_error;           // spawn failure or non-zero exit
    std::function<void(const CommandStatus& status)> on_complete; // terminal event, exactly once
};

struct RunResult {
    std::string session_id;
    std::optional<CommandStatus> status; // final status; foreground only
};

class Engine {
public:
    Engine(SessionStore& store, EngineOptions opts, JsonlLogger* events = nullptr);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Validation and capture failures are reported here and leave no session
    // behind. Once a session exists, run() returns true; spawn failures and
    // exit status are recorded on the session (and passed to the hooks in
    // foreground mode).
    bool run(const ExecuteRequest& req, const ExecHooks& hooks, RunResult* out, ExecError* err = nullptr);

    // Sends SIGTERM to the session's process group. No-op for sessions that
    // finished or were already interrupted. NOT_FOUND for unknown ids.
    bool interrupt(const std::string& session_id, ExecError* err = nullptr);

    // Drops finished sessions older than ttl and deletes their capture files.
    // Running sessions are never pruned. Returns the number removed.
    size_t prune_finished(std::chrono::seconds ttl);

    // Kills every running session and waits for in-flight runs and monitors.
    // run() fails with RUNTIME_ERROR afterwards. Called by the destructor.
    void shutdown();

    SessionStore& store() { return store_; }
    const EngineOptions& options() const { return opts_; }

private:
    bool validate(const ExecuteRequest& req, ExecError* err) const;
    bool enter();
    void leave();

    CommandKernel record_spawn_failure(const std::string& session_id, const std::string& error);
    std::optional<CommandKernel> finish_session(const std::string& session_id);
    void monitor(const std::string& session_id, int pid);
    void run_foreground(const std::string& session_id, int pid, const CapturePaths& paths,
                        const ExecHooks& hooks, RunResult* out);
    void deliver_terminal(const CommandKernel& k, const ExecHooks& hooks, std::mutex& hook_mu, RunResult* out);
    void log_event(const char* name, const std::string& session_id, json_object* payload);

    SessionStore& store_;
    EngineOptions opts_;
    JsonlLogger* events_;

    std::mutex active_mu_;
    std::condition_variable active_cv_;
    int active_{0};
    bool stopping_{false};
};

} // namespace execd
