#include "execd/process.h"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace execd {

ProcessHandle::~ProcessHandle() {
    if (reaped_) return;
    // dropped while still owning a live child: do not leave it behind
    (void)::kill(-pid_, SIGKILL);
    (void)::kill(pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
}

bool ProcessHandle::signal_group(int sig) {
    if (reaped_) return false;
    if (::kill(-pid_, sig) == 0) return true;
    // group may not exist yet if setpgid in the child has not run
    return ::kill(pid_, sig) == 0;
}

ExitInfo ProcessHandle::reap() {
    ExitInfo ei;
    if (reaped_) {
        ei.error = "already reaped";
        return ei;
    }
    int status = 0;
    pid_t w;
    do {
        w = ::waitpid(pid_, &status, 0);
    } while (w < 0 && errno == EINTR);
    reaped_ = true;
    if (w != pid_) {
        ei.error = std::string("waitpid: ") + std::strerror(errno);
        return ei;
    }
    if (WIFEXITED(status)) {
        ei.exited = true;
        ei.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        ei.term_signal = WTERMSIG(status);
    }
    return ei;
}

bool wait_process_exit(pid_t pid) {
    siginfo_t info{};
    while (::waitid(P_PID, (id_t)pid, &info, WEXITED | WNOWAIT) != 0) {
        if (errno == EINTR) continue;
        return false;
    }
    return true;
}

bool process_has_exited(pid_t pid) {
    siginfo_t info{};
    info.si_pid = 0;
    int rc;
    do {
        rc = ::waitid(P_PID, (id_t)pid, &info, WEXITED | WNOHANG | WNOWAIT);
    } while (rc != 0 && errno == EINTR);
    if (rc != 0) return true; // ECHILD: nothing left to wait for
    return info.si_pid == pid;
}

std::string default_shell() {
    std::error_code ec;
    if (std::filesystem::exists("/bin/bash", ec)) return "/bin/bash";
    return "/bin/sh";
}

std::string resolve_executable(const std::string& name) {
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) return name;
    const char* path = std::getenv("PATH");
    std::string p = path ? path : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= p.size()) {
        size_t end = p.find(':', start);
        if (end == std::string::npos) end = p.size();
        std::string dir = p.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string cand = dir + "/" + name;
        if (::access(cand.c_str(), X_OK) == 0) return cand;
        start = end + 1;
    }
    return "";
}

namespace {

// Written by the child to the sync pipe when setup fails before exec.
struct ChildFailure {
    int stage; // 1 = chdir, 2 = exec, 3 = dup2
    int err;
};

// Closes every descriptor >= 3 except keep. Runs in the forked child, so
// only async-signal-safe calls.
void close_inherited_fds(int keep, long maxfd) {
#if defined(SYS_close_range)
    bool done = true;
    if (keep > 3 && ::syscall(SYS_close_range, 3u, (unsigned)(keep - 1), 0u) != 0) done = false;
    if (done && ::syscall(SYS_close_range, (unsigned)(keep + 1), ~0u, 0u) != 0) done = false;
    if (done) return;
#endif
    for (long fd = 3; fd < maxfd; fd++) {
        if (fd == keep) continue;
        (void)::close((int)fd);
    }
}

} // namespace

std::unique_ptr<ProcessHandle> spawn_shell(const SpawnSpec& spec, std::string* error) {
    auto set_err = [&](const std::string& e) { if (error) *error = e; };

    if (spec.code.empty()) { set_err("empty command"); return nullptr; }
    if (spec.stdout_fd < 0 || spec.stderr_fd < 0) { set_err("capture descriptors not open"); return nullptr; }

    const std::string shell = resolve_executable(spec.shell);
    if (shell.empty()) { set_err("shell not found: " + spec.shell); return nullptr; }

    // Everything the child needs is prepared here: after fork() in a
    // multithreaded process only async-signal-safe calls are allowed.
    std::vector<std::string> argv_s = {shell, "-c", spec.code};
    std::vector<char*> cargv;
    cargv.reserve(argv_s.size() + 1);
    for (auto& s : argv_s) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    std::vector<std::string> env_s;
    for (char** e = environ; e && *e; ++e) {
        std::string kv = *e;
        auto eq = kv.find('=');
        std::string key = kv.substr(0, eq);
        bool overridden = false;
        for (const auto& o : spec.env) {
            if (o.compare(0, key.size() + 1, key + "=") == 0) { overridden = true; break; }
        }
        if (!overridden) env_s.push_back(std::move(kv));
    }
    for (const auto& o : spec.env) env_s.push_back(o);
    std::vector<char*> cenv;
    cenv.reserve(env_s.size() + 1);
    for (auto& s : env_s) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);

    const char* cwd = spec.cwd.empty() ? nullptr : spec.cwd.c_str();

    // upper bound for the fallback close loop when close_range is unavailable
    struct rlimit nofile{};
    long maxfd = ::sysconf(_SC_OPEN_MAX);
    if (::getrlimit(RLIMIT_NOFILE, &nofile) == 0) {
        maxfd = nofile.rlim_cur == RLIM_INFINITY ? (1L << 20) : (long)nofile.rlim_cur;
    }
    if (maxfd < 256) maxfd = 256;

    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) { set_err(std::string("open /dev/null: ") + std::strerror(errno)); return nullptr; }

    int sync_pipe[2];
    if (::pipe2(sync_pipe, O_CLOEXEC) != 0) {
        set_err(std::string("pipe2: ") + std::strerror(errno));
        ::close(devnull);
        return nullptr;
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        set_err(std::string("fork failed: ") + std::strerror(errno));
        ::close(devnull);
        ::close(sync_pipe[0]);
        ::close(sync_pipe[1]);
        return nullptr;
    }

    if (pid == 0) {
        // child
        auto report = [&](int stage) {
            ChildFailure f{stage, errno};
            (void)!::write(sync_pipe[1], &f, sizeof(f));
            ::_exit(127);
        };

        // own process group so an interrupt reaches the whole subtree
        (void)::setpgid(0, 0);

        if (::dup2(devnull, STDIN_FILENO) < 0) report(3);
        if (::dup2(spec.stdout_fd, STDOUT_FILENO) < 0) report(3);
        if (::dup2(spec.stderr_fd, STDERR_FILENO) < 0) report(3);

        close_inherited_fds(sync_pipe[1], maxfd);

        // the daemon ignores SIGPIPE; commands expect the default
        ::signal(SIGPIPE, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        (void)::sigprocmask(SIG_SETMASK, &none, nullptr);

        if (cwd && ::chdir(cwd) != 0) report(1);

        ::execve(cargv[0], cargv.data(), cenv.data());
        report(2);
    }

    // parent
    (void)::setpgid(pid, pid);
    ::close(devnull);
    ::close(sync_pipe[1]);

    ChildFailure f{0, 0};
    ssize_t n;
    do {
        n = ::read(sync_pipe[0], &f, sizeof(f));
    } while (n < 0 && errno == EINTR);
    ::close(sync_pipe[0]);

    if (n == (ssize_t)sizeof(f)) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        switch (f.stage) {
            case 1: set_err("chdir " + spec.cwd + ": " + std::strerror(f.err)); break;
            case 2: set_err("exec " + shell + ": " + std::strerror(f.err)); break;
            default: set_err(std::string("dup2: ") + std::strerror(f.err)); break;
        }
        return nullptr;
    }

    // EOF on the close-on-exec pipe: exec succeeded
    return std::make_unique<ProcessHandle>(pid);
}

} // namespace execd
