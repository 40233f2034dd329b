#pragma once

// HTTP surface of the command runtime. Each handler serves one request on a
// connected socket; the caller owns and closes the descriptor.
//
//   GET    /ping                          health
//   POST   /command                       run (SSE stream of hook events)
//   GET    /command/status/{id}           status JSON
//   GET    /command/{id}/logs?cursor=N    background output since cursor
//   DELETE /command?id={id}               interrupt

#include "execd/engine.h"
#include "execd/errors.h"
#include "execd/types.h"

#include <string>

namespace execd {

// Response header carrying the next cursor of a logs request.
inline constexpr const char* kTailCursorHeader = "EXECD-COMMANDS-TAIL-CURSOR";

// Body: {"command":str,"cwd":str?,"background":bool?,"session_id":str?,"envs":{str:str}?}
bool parse_run_request(const std::string& body, ExecuteRequest* req, ExecError* err);

// SSE payloads, one JSON object per event.
std::string init_event_json(const std::string& session_id);
std::string output_event_json(const char* type, const std::string& line);
std::string error_event_json(const ExecError& err);
std::string complete_event_json(const CommandStatus& st);

// Reads one request from fd and writes the response.
void handle_connection(int fd, Engine& engine);

} // namespace execd
