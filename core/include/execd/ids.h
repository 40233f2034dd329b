#pragma once

#include <string>

namespace execd {

// 32 lowercase hex chars from the kernel CSPRNG. Empty if no random
// bytes could be obtained.
std::string new_session_id();

// Session ids become file names under the output dir: [A-Za-z0-9_-]{1,128}.
bool is_valid_session_id(const std::string& id);

} // namespace execd
