#include "command_api.h"
#include "serve_http.h"

#include "execd/json_util.h"
#include "execd/log.h"
#include "execd/status.h"

#include <json-c/json.h>

#include <chrono>

namespace execd {

static int64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

bool parse_run_request(const std::string& body, ExecuteRequest* req, ExecError* err) {
    if (!req) return fail(err, ErrorCode::RUNTIME_ERROR, "null request");
    json_util::Doc d = json_util::parse(body);
    if (!d.is_object()) {
        return fail(err, ErrorCode::INVALID_REQUEST, "error parsing request, MAYBE invalid body format");
    }

    *req = ExecuteRequest{};
    auto cmd = json_util::get_string(d, "command");
    if (!cmd || cmd->empty()) return fail(err, ErrorCode::INVALID_REQUEST, "missing command");
    req->code = *cmd;
    req->cwd = json_util::get_string(d, "cwd").value_or("");
    req->session_id = json_util::get_string(d, "session_id").value_or("");
    req->mode = json_util::get_bool(d, "background").value_or(false) ? RunMode::BACKGROUND_COMMAND
                                                                    : RunMode::COMMAND;
    auto env = json_util::get_env_entries(d, "envs");
    if (!env) return fail(err, ErrorCode::INVALID_REQUEST, "envs must be an object of strings");
    req->env = std::move(*env);
    return true;
}

static json_object* new_event(const char* type) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "type", json_object_new_string(type));
    json_object_object_add(o, "timestamp", json_object_new_int64(now_ms()));
    return o;
}

std::string init_event_json(const std::string& session_id) {
    json_object* o = new_event("init");
    json_object_object_add(o, "text", json_object_new_string(session_id.c_str()));
    return json_util::to_string_and_put(o);
}

std::string output_event_json(const char* type, const std::string& line) {
    json_object* o = new_event(type);
    json_object_object_add(o, "text", json_object_new_string_len(line.data(), (int)line.size()));
    return json_util::to_string_and_put(o);
}

std::string error_event_json(const ExecError& err) {
    json_object* o = new_event("error");
    json_object* e = json_object_new_object();
    json_object_object_add(e, "ename", json_object_new_string("CommandExecError"));
    json_object_object_add(e, "evalue", json_object_new_string(err.message.c_str()));
    json_object_object_add(o, "error", e);
    return json_util::to_string_and_put(o);
}

std::string complete_event_json(const CommandStatus& st) {
    json_object* o = new_event("execution_complete");
    json_util::Doc sd = json_util::parse(status_to_json(st));
    json_object_object_add(o, "status", json_object_get(sd.root));
    if (st.finished_at) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(*st.finished_at - st.started_at).count();
        json_object_object_add(o, "execution_time", json_object_new_int64((int64_t)ms));
    }
    return json_util::to_string_and_put(o);
}

static void respond_error(int fd, const ExecError& err) {
    send_json(fd, http_status_for(err.code), error_body(error_code_name(err.code), err.message));
}

static void handle_run(int fd, Engine& engine, const std::string& body) {
    ExecuteRequest req;
    ExecError err;
    if (!parse_run_request(body, &req, &err)) {
        respond_error(fd, err);
        return;
    }

    // The stream starts at the init hook; anything rejected before that is
    // still answered with a plain JSON error.
    bool streaming = false;
    bool client_gone = false;
    auto emit = [&](const std::string& json) {
        if (client_gone) return;
        if (!send_all(fd, sse_frame(json))) client_gone = true;
    };

    ExecHooks hooks;
    hooks.on_init = [&](const std::string& id) {
        streaming = true;
        if (!send_sse_headers(fd)) client_gone = true;
        emit(init_event_json(id));
    };
    hooks.on_stdout = [&](const std::string& line) { emit(output_event_json("stdout", line)); };
    hooks.on_stderr = [&](const std::string& line) { emit(output_event_json("stderr", line)); };
    hooks.on_error = [&](const ExecError& e) { emit(error_event_json(e)); };
    hooks.on_complete = [&](const CommandStatus& st) { emit(complete_event_json(st)); };

    RunResult result;
    if (!engine.run(req, hooks, &result, &err)) {
        if (!streaming) {
            respond_error(fd, err);
        } else {
            emit(error_event_json(err));
        }
        return;
    }
    if (client_gone) {
        log_line("[serve]", "client disconnected during session " + result.session_id);
    }
}

static void handle_status(int fd, Engine& engine, const std::string& id) {
    ExecError err;
    auto st = get_command_status(engine.store(), id, &err);
    if (!st) {
        respond_error(fd, err);
        return;
    }
    send_json(fd, 200, status_to_json(*st));
}

static void handle_logs(int fd, Engine& engine, const std::string& id, const std::string& query) {
    int64_t cursor = parse_int64_or(query_param(query, "cursor"), 0);
    SeekResult res;
    ExecError err;
    if (!seek_background_output(engine.store(), id, cursor, &res, &err)) {
        respond_error(fd, err);
        return;
    }
    send_response(fd, 200, "text/plain; charset=utf-8", res.output,
                  {{kTailCursorHeader, std::to_string(res.cursor)}});
}

static void handle_interrupt(int fd, Engine& engine, const std::string& id) {
    ExecError err;
    if (!engine.interrupt(id, &err)) {
        respond_error(fd, err);
        return;
    }
    send_json(fd, 200, "{\"ok\":true}");
}

static void missing_id(int fd) {
    send_json(fd, 400, error_body("MISSING_QUERY", "missing command execution id"));
}

void handle_connection(int fd, Engine& engine) {
    std::string head, body;
    if (!read_http_request(fd, head, body)) return;

    RequestLine rl = parse_request_line(head);
    const std::string& path = rl.path;

    if (path == "/ping") {
        if (rl.method != "GET") { send_json(fd, 405, error_body("INVALID_REQUEST", "method not allowed")); return; }
        send_json(fd, 200, "{\"ok\":true}");
        return;
    }

    if (path == "/command") {
        if (rl.method == "POST") { handle_run(fd, engine, body); return; }
        if (rl.method == "DELETE") {
            std::string id = query_param(rl.query, "id");
            if (id.empty()) { missing_id(fd); return; }
            handle_interrupt(fd, engine, id);
            return;
        }
        send_json(fd, 405, error_body("INVALID_REQUEST", "method not allowed"));
        return;
    }

    const std::string status_prefix = "/command/status/";
    if (rl.method == "GET" && path.rfind(status_prefix, 0) == 0) {
        std::string id = path.substr(status_prefix.size());
        if (id.empty()) { missing_id(fd); return; }
        handle_status(fd, engine, id);
        return;
    }

    const std::string cmd_prefix = "/command/";
    const std::string logs_suffix = "/logs";
    if (rl.method == "GET" && path.rfind(cmd_prefix, 0) == 0 &&
        path.size() >= cmd_prefix.size() + logs_suffix.size() &&
        path.compare(path.size() - logs_suffix.size(), logs_suffix.size(), logs_suffix) == 0) {
        std::string id = path.substr(cmd_prefix.size(), path.size() - cmd_prefix.size() - logs_suffix.size());
        if (id.empty()) { missing_id(fd); return; }
        handle_logs(fd, engine, id, rl.query);
        return;
    }

    send_json(fd, 404, error_body("NOT_FOUND", "no route for " + rl.method + " " + path));
}

} // namespace execd
