#include "cmd_exec.h"

#include "execd/config.h"
#include "execd/engine.h"
#include "execd/session_store.h"

#include <iostream>
#include <string>

using namespace execd;

int cmd_exec(int argc, char** argv) {
    ExecuteRequest req;
    req.mode = RunMode::COMMAND;

    int i = 2;
    for (; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--cwd" && i + 1 < argc) { req.cwd = argv[++i]; continue; }
        if (a == "--env" && i + 1 < argc) { req.env.push_back(argv[++i]); continue; }
        if (a == "--") { i++; break; }
        break;
    }
    for (; i < argc; i++) {
        if (!req.code.empty()) req.code += " ";
        req.code += argv[i];
    }
    if (req.code.empty()) {
        std::cerr << "usage: execd exec [--cwd DIR] [--env K=V]... <command>\n";
        return 2;
    }

    apply_profile_defaults(detect_profile());
    Config cfg = load_config();
    EngineOptions opts = engine_options_from_config(cfg);
    opts.grace_ms = 0;

    InMemorySessionStore store;
    Engine engine(store, opts);

    ExecHooks hooks;
    hooks.on_stdout = [](const std::string& line) { std::cout << line << "\n" << std::flush; };
    hooks.on_stderr = [](const std::string& line) { std::cerr << line << "\n" << std::flush; };
    hooks.on_error = [](const ExecError& e) { std::cerr << "[execd] " << e.message << "\n"; };

    RunResult result;
    ExecError err;
    if (!engine.run(req, hooks, &result, &err)) {
        std::cerr << "[execd] " << error_code_name(err.code) << ": " << err.message << "\n";
        return 2;
    }

    int rc = 1;
    if (result.status && result.status->exit_code) rc = *result.status->exit_code;
    remove_capture(capture_paths(opts.output_dir, result.session_id));
    return rc;
}
