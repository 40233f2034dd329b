#pragma once

// execd exec [--cwd DIR] [--env K=V]... <command>
// Runs one command in the foreground and exits with its exit code.
int cmd_exec(int argc, char** argv);
