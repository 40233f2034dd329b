#pragma once

// Read-only queries against the session store.

#include "errors.h"
#include "session_store.h"
#include "types.h"

#include <cstdint>
#include <optional>
#include <string>

namespace execd {

// Latest state of a session. NOT_FOUND for unknown ids.
std::optional<CommandStatus> get_command_status(const SessionStore& store,
                                                const std::string& session_id,
                                                ExecError* err = nullptr);

struct SeekResult {
    std::string output;
    int64_t cursor{0}; // pass back on the next call
};

// Returns the captured output of a background session from byte offset
// cursor up to the current end of file. A cursor at or past the end yields
// an empty result and the same cursor. Unknown sessions, foreground sessions
// and negative cursors are INVALID_REQUEST; read failures RUNTIME_ERROR.
bool seek_background_output(const SessionStore& store,
                            const std::string& session_id,
                            int64_t cursor,
                            SeekResult* out,
                            ExecError* err = nullptr);

} // namespace execd
