#include "cmd_exec.h"
#include "cmd_serve.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "execd <serve|exec> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "serve") return cmd_serve(argc, argv);
    if (cmd == "exec") return cmd_exec(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
