#pragma once

#include <memory>
#include <string>
#include <vector>

#include <sys/types.h>

namespace execd {

struct SpawnSpec {
    std::string shell;             // run as: <shell> -c <code>
    std::string code;
    std::string cwd;               // empty => inherit
    std::vector<std::string> env;  // KEY=VALUE entries layered over the daemon's environment
    int stdout_fd{-1};
    int stderr_fd{-1};
};

struct ExitInfo {
    bool exited{false};  // WIFEXITED
    int exit_code{-1};
    int term_signal{0};  // non-zero when killed by a signal
    std::string error;   // waitpid failure
};

// Capability over one child process. Owned by exactly one session; never
// copied. The child leads its own process group, so signals reach the whole
// subtree. Callers serialize signal_group() and reap() (the session store
// does this under its lock).
class ProcessHandle {
public:
    explicit ProcessHandle(pid_t pid) : pid_(pid) {}
    ~ProcessHandle();

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    pid_t pid() const { return pid_; }
    bool reaped() const { return reaped_; }

    // Returns false once reaped, or if kill(2) failed.
    bool signal_group(int sig);

    // Collects the exit status. Only call after wait_process_exit(pid())
    // returned true, so this never blocks.
    ExitInfo reap();

private:
    pid_t pid_;
    bool reaped_{false};
};

// Blocks until pid has exited but leaves it unreaped (zombie), so the pid
// cannot be recycled while the owner still holds a handle to it.
bool wait_process_exit(pid_t pid);

// Non-blocking variant: true once pid has exited (or cannot be waited on).
// Does not reap.
bool process_has_exited(pid_t pid);

// Forks and execs `<shell> -c <code>` with stdin on /dev/null and the given
// descriptors as stdout/stderr. Failures in the child before exec (chdir,
// exec) are reported back through a close-on-exec pipe.
// Returns nullptr on failure with *error set.
std::unique_ptr<ProcessHandle> spawn_shell(const SpawnSpec& spec, std::string* error);

// /bin/bash when present, /bin/sh otherwise.
std::string default_shell();

// Resolves a bare program name against PATH. Names containing '/' are
// returned unchanged. Empty string if not found.
std::string resolve_executable(const std::string& name);

} // namespace execd
