#pragma once

// execd serve [--host H] [--port P] [--output-dir DIR]
int cmd_serve(int argc, char** argv);
