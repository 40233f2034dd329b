#include "execd/engine.h"
#include "execd/ids.h"
#include "execd/process.h"

#include <atomic>
#include <csignal>
#include <system_error>
#include <thread>

#include <unistd.h>

namespace execd {

EngineOptions engine_options_from_config(const Config& c) {
    EngineOptions o;
    o.output_dir = c.output_dir;
    o.shell = c.shell;
    o.tail.poll_interval_ms = c.tail_interval_ms;
    o.tail.max_record_bytes = c.max_record_bytes;
    o.grace_ms = c.grace_ms;
    return o;
}

Engine::Engine(SessionStore& store, EngineOptions opts, JsonlLogger* events)
    : store_(store), opts_(std::move(opts)), events_(events) {
    if (opts_.shell.empty()) opts_.shell = default_shell();
    if (opts_.output_dir.empty()) {
        std::error_code ec;
        opts_.output_dir = std::filesystem::temp_directory_path(ec);
        if (ec) opts_.output_dir = "/tmp";
    }
}

Engine::~Engine() {
    shutdown();
}

bool Engine::enter() {
    std::lock_guard<std::mutex> lk(active_mu_);
    if (stopping_) return false;
    active_++;
    return true;
}

void Engine::leave() {
    std::lock_guard<std::mutex> lk(active_mu_);
    active_--;
    if (active_ == 0) active_cv_.notify_all();
}

namespace {

struct ActiveGuard {
    std::function<void()> release;
    ~ActiveGuard() { if (release) release(); }
};

} // namespace

void Engine::log_event(const char* name, const std::string& session_id, json_object* payload) {
    if (events_) {
        events_->event(name, session_id, payload);
    } else if (payload) {
        json_object_put(payload);
    }
}

bool Engine::validate(const ExecuteRequest& req, ExecError* err) const {
    if (req.code.empty()) {
        return fail(err, ErrorCode::INVALID_REQUEST, "command is empty");
    }
    if (req.code.find('\0') != std::string::npos) {
        return fail(err, ErrorCode::INVALID_REQUEST, "command contains NUL byte");
    }
    if (!req.session_id.empty() && !is_valid_session_id(req.session_id)) {
        return fail(err, ErrorCode::INVALID_REQUEST, "invalid session id: " + req.session_id);
    }
    if (!req.cwd.empty()) {
        std::error_code ec;
        if (!std::filesystem::is_directory(req.cwd, ec) || ::access(req.cwd.c_str(), X_OK) != 0) {
            return fail(err, ErrorCode::INVALID_REQUEST, "working directory is not usable: " + req.cwd);
        }
    }
    for (const auto& kv : req.env) {
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0 || kv.find('\0') != std::string::npos) {
            return fail(err, ErrorCode::INVALID_REQUEST, "invalid environment entry: " + kv);
        }
    }
    return true;
}

bool Engine::run(const ExecuteRequest& req, const ExecHooks& hooks, RunResult* out, ExecError* err) {
    if (!validate(req, err)) return false;

    std::string id = req.session_id;
    if (id.empty()) {
        id = new_session_id();
        if (id.empty()) return fail(err, ErrorCode::RUNTIME_ERROR, "cannot generate session id");
    }

    if (!enter()) return fail(err, ErrorCode::RUNTIME_ERROR, "engine is shutting down");
    ActiveGuard guard{[this] { leave(); }};

    const bool background = req.mode == RunMode::BACKGROUND_COMMAND;
    const CapturePaths paths = capture_paths(opts_.output_dir, id);

    CommandKernel k;
    k.session_id = id;
    k.is_background = background;
    k.running = true;
    k.started_at = Clock::now();
    if (background) {
        k.combined_path = paths.combined_path.string();
        k.stdout_path = k.combined_path;
        k.stderr_path = k.combined_path;
    } else {
        k.stdout_path = paths.stdout_path.string();
        k.stderr_path = paths.stderr_path.string();
    }

    // Registering first claims the id, so a duplicate never truncates the
    // files of the session that owns it.
    if (!store_.insert(k)) {
        return fail(err, ErrorCode::INVALID_REQUEST, "session already exists: " + id);
    }

    CaptureFiles files;
    std::string cap_err = open_capture(paths, background, &files);
    if (!cap_err.empty()) {
        store_.erase(id);
        remove_capture(paths);
        log_line("[engine]", "session " + id + ": output capture failed: " + cap_err);
        return fail(err, ErrorCode::RUNTIME_ERROR, "output capture: " + cap_err);
    }

    if (out) {
        out->session_id = id;
        out->status.reset();
    }
    if (hooks.on_init) hooks.on_init(id);

    SpawnSpec spec;
    spec.shell = opts_.shell;
    spec.code = req.code;
    spec.cwd = req.cwd;
    spec.env = req.env;
    spec.stdout_fd = files.stdout_fd();
    spec.stderr_fd = files.stderr_fd();

    std::string spawn_err;
    std::unique_ptr<ProcessHandle> proc = spawn_shell(spec, &spawn_err);
    files.close();

    if (!proc) {
        CommandKernel failed = record_spawn_failure(id, spawn_err);
        if (!background) {
            std::mutex hook_mu;
            deliver_terminal(failed, hooks, hook_mu, out);
        }
        return true;
    }

    const int pid = proc->pid();
    store_.update(id, [&](CommandKernel& kk, std::unique_ptr<ProcessHandle>& slot) {
        kk.pid = pid;
        slot = std::move(proc);
        // interrupt() arrived before the process existed
        if (kk.interrupted) slot->signal_group(SIGTERM);
    });

    {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "mode", json_object_new_string(run_mode_name(req.mode)));
        json_object_object_add(p, "cwd", json_object_new_string(req.cwd.c_str()));
        json_object_object_add(p, "pid", json_object_new_int(pid));
        log_event("session_start", id, p);
    }

    bool stopping = false;
    {
        std::lock_guard<std::mutex> lk(active_mu_);
        stopping = stopping_;
        // still inside this run's active region, so shutdown() is waiting on us
        if (background) active_++;
    }
    if (stopping) {
        // shutdown's kill sweep ran before the handle was attached
        store_.update(id, [](CommandKernel&, std::unique_ptr<ProcessHandle>& slot) {
            if (slot) slot->signal_group(SIGKILL);
        });
    }

    if (background) {
        try {
            std::thread([this, id, pid] {
                ActiveGuard g{[this] { leave(); }};
                monitor(id, pid);
            }).detach();
        } catch (const std::system_error& e) {
            leave();
            log_line("[engine]", "session " + id + ": monitor thread failed: " + e.what());
            // nobody would reap it; stop it now and record why
            store_.update(id, [&](CommandKernel& kk, std::unique_ptr<ProcessHandle>& slot) {
                if (slot) slot->signal_group(SIGKILL);
                kk.err_msg = std::string("monitor thread: ") + e.what();
            });
            monitor(id, pid);
        }
        return true;
    }

    run_foreground(id, pid, paths, hooks, out);
    return true;
}

void Engine::run_foreground(const std::string& session_id, int pid, const CapturePaths& paths,
                            const ExecHooks& hooks, RunResult* out) {
    std::mutex hook_mu;
    auto serialized = [&hook_mu](const std::function<void(const std::string&)>& fn) -> RecordFn {
        return [&hook_mu, fn](const std::string& line) {
            if (!fn) return;
            std::lock_guard<std::mutex> lk(hook_mu);
            fn(line);
        };
    };
    RecordFn on_out = serialized(hooks.on_stdout);
    RecordFn on_err = serialized(hooks.on_stderr);

    std::atomic<bool> exited{false};
    auto still_growing = [&exited, pid] {
        if (exited.load()) return false;
        if (process_has_exited(pid)) {
            exited.store(true);
            return false;
        }
        return true;
    };

    Tailer out_tail(paths.stdout_path, opts_.tail);
    Tailer err_tail(paths.stderr_path, opts_.tail);

    std::thread err_thread;
    try {
        err_thread = std::thread([&] { err_tail.run(still_growing, on_err); });
    } catch (const std::system_error& e) {
        log_line("[engine]", "session " + session_id + ": stderr tailer runs after exit: " + e.what());
    }

    out_tail.run(still_growing, on_out);
    if (err_thread.joinable()) {
        err_thread.join();
    } else {
        err_tail.run(still_growing, on_err);
    }

    // all output has been delivered; now record the exit
    (void)wait_process_exit(pid);
    auto done = finish_session(session_id);
    if (!done) {
        log_line("[engine]", "session " + session_id + ": vanished before completion");
        return;
    }
    deliver_terminal(*done, hooks, hook_mu, out);
}

void Engine::deliver_terminal(const CommandKernel& k, const ExecHooks& hooks, std::mutex& hook_mu, RunResult* out) {
    CommandStatus st = status_from_kernel(k);
    {
        std::lock_guard<std::mutex> lk(hook_mu);
        if (hooks.on_error) {
            if (!k.err_msg.empty()) {
                hooks.on_error(ExecError{ErrorCode::RUNTIME_ERROR, k.err_msg});
            } else if (k.exit_code && *k.exit_code != 0) {
                hooks.on_error(ExecError{ErrorCode::RUNTIME_ERROR,
                                         "command exited with code " + std::to_string(*k.exit_code)});
            }
        }
        if (hooks.on_complete) hooks.on_complete(st);
    }
    if (out) out->status = st;
    if (opts_.grace_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(opts_.grace_ms));
    }
}

void Engine::monitor(const std::string& session_id, int pid) {
    if (!wait_process_exit(pid)) {
        log_line("[engine]", "session " + session_id + ": waitid failed, reaping directly");
    }
    (void)finish_session(session_id);
}

CommandKernel Engine::record_spawn_failure(const std::string& session_id, const std::string& error) {
    CommandKernel snapshot;
    store_.update(session_id, [&](CommandKernel& k, std::unique_ptr<ProcessHandle>&) {
        k.running = false;
        k.finished_at = Clock::now();
        k.err_msg = error.empty() ? "spawn failed" : error;
        snapshot = k;
    });
    log_line("[engine]", "session " + session_id + ": spawn failed: " + snapshot.err_msg);

    json_object* p = json_object_new_object();
    json_object_object_add(p, "error", json_object_new_string(snapshot.err_msg.c_str()));
    log_event("session_spawn_failed", session_id, p);
    return snapshot;
}

std::optional<CommandKernel> Engine::finish_session(const std::string& session_id) {
    std::optional<CommandKernel> done;
    store_.update(session_id, [&](CommandKernel& k, std::unique_ptr<ProcessHandle>& proc) {
        ExitInfo ei;
        if (proc) {
            ei = proc->reap();
            proc.reset();
        } else {
            ei.error = "process handle missing";
        }
        k.running = false;
        k.finished_at = Clock::now();
        if (ei.exited) {
            k.exit_code = ei.exit_code;
        } else if (ei.term_signal != 0) {
            k.err_msg = "terminated by signal " + std::to_string(ei.term_signal);
        } else if (k.err_msg.empty()) {
            k.err_msg = ei.error.empty() ? "unknown exit status" : ei.error;
        }
        done = k;
    });
    if (!done) return done;

    json_object* p = json_object_new_object();
    if (done->exit_code) json_object_object_add(p, "exit_code", json_object_new_int(*done->exit_code));
    if (!done->err_msg.empty()) json_object_object_add(p, "error", json_object_new_string(done->err_msg.c_str()));
    auto dur = std::chrono::duration_cast<std::chrono::milliseconds>(*done->finished_at - done->started_at).count();
    json_object_object_add(p, "duration_ms", json_object_new_int64((int64_t)dur));
    json_object_object_add(p, "interrupted", json_object_new_boolean(done->interrupted ? 1 : 0));
    log_event("session_exit", session_id, p);
    return done;
}

bool Engine::interrupt(const std::string& session_id, ExecError* err) {
    bool sent = false;
    bool found = store_.update(session_id, [&](CommandKernel& k, std::unique_ptr<ProcessHandle>& proc) {
        if (!k.running || k.interrupted) return;
        if (!proc) {
            // not spawned yet; run() delivers the signal when it attaches the handle
            k.interrupted = true;
            return;
        }
        if (proc->signal_group(SIGTERM)) {
            k.interrupted = true;
            sent = true;
        }
    });
    if (!found) return fail(err, ErrorCode::NOT_FOUND, "command not found: " + session_id);
    if (sent) log_event("session_interrupt", session_id, nullptr);
    return true;
}

size_t Engine::prune_finished(std::chrono::seconds ttl) {
    const auto now = Clock::now();
    size_t removed = 0;
    for (const auto& id : store_.session_ids()) {
        auto k = store_.get(id);
        if (!k || k->running || !k->finished_at) continue;
        if (now - *k->finished_at < ttl) continue;
        if (!store_.erase(id)) continue;

        std::error_code ec;
        for (const auto* p : {&k->stdout_path, &k->stderr_path, &k->combined_path}) {
            if (!p->empty()) std::filesystem::remove(*p, ec);
        }
        removed++;
        log_event("session_pruned", id, nullptr);
    }
    return removed;
}

void Engine::shutdown() {
    {
        std::lock_guard<std::mutex> lk(active_mu_);
        stopping_ = true;
    }
    for (const auto& id : store_.session_ids()) {
        store_.update(id, [](CommandKernel& k, std::unique_ptr<ProcessHandle>& proc) {
            if (k.running && proc) proc->signal_group(SIGKILL);
        });
    }
    std::unique_lock<std::mutex> lk(active_mu_);
    active_cv_.wait(lk, [this] { return active_ == 0; });
}

} // namespace execd
