#include "cmd_run.h"
#include "cmd_sandbox.h"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "codeloop_cli <run|exec|validate|languages|template|batch|verify_log> ...\n";
        return 2;
    }
    const std::string cmd = argv[1];
    if (cmd == "run") return cmd_run(argc, argv);
    if (cmd == "exec") return cmd_exec(argc, argv);
    if (cmd == "validate") return cmd_validate(argc, argv);
    if (cmd == "languages") return cmd_languages(argc, argv);
    if (cmd == "template") return cmd_template(argc, argv);
    if (cmd == "batch") return cmd_batch(argc, argv);
    if (cmd == "verify_log") return cmd_verify_log(argc, argv);
    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
