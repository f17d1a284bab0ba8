#include "cmd_sandbox.h"
#include "runner_utils.h"

#include "codeloop/config.h"
#include "codeloop/executor.h"
#include "codeloop/json_mini.h"
#include "codeloop/log.h"
#include "codeloop/serialization.h"

#include <iostream>

using namespace codeloop;

namespace {

SandboxExecutor make_executor() {
    apply_profile_defaults(detect_profile());
    return SandboxExecutor(load_sandbox_config());
}

bool read_arg_file(const char* path, std::string* out) {
    try {
        *out = slurp(path);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return false;
    }
}

} // namespace

int cmd_exec(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: codeloop_cli exec <language> <source_file> [stdin_file]\n";
        return 2;
    }
    std::string src, input;
    if (!read_arg_file(argv[3], &src)) return 2;
    if (argc >= 5 && !read_arg_file(argv[4], &input)) return 2;

    const SandboxExecutor ex = make_executor();
    install_cancel_handlers();
    RunOptions opts;
    opts.cancel = cancel_flag();
    ExecutionResult r = ex.run(src, argv[2], input, opts);
    print_json(execution_result_to_json(r));
    return r.succeeded ? 0 : 1;
}

int cmd_validate(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: codeloop_cli validate <language> <source_file>\n";
        return 2;
    }
    std::string src;
    if (!read_arg_file(argv[3], &src)) return 2;
    const SandboxExecutor ex = make_executor();
    SyntaxCheck sc = ex.validate_syntax(src, argv[2]);
    print_json(syntax_check_to_json(sc));
    return sc.valid ? 0 : 1;
}

int cmd_languages(int, char**) {
    const SandboxExecutor ex = make_executor();
    print_json(language_info_to_json(ex.language_info()));
    return 0;
}

int cmd_template(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: codeloop_cli template <language>\n";
        return 2;
    }
    const SandboxExecutor ex = make_executor();
    auto t = ex.language_template(argv[2]);
    if (!t) {
        std::cerr << "Unsupported language '" << argv[2] << "'\n";
        return 1;
    }
    std::cout << *t;
    return 0;
}

int cmd_batch(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: codeloop_cli batch <snippets.json>   ([{code, language, input?}, ...])\n";
        return 2;
    }
    std::string raw;
    if (!read_arg_file(argv[2], &raw)) return 2;
    json_mini::Doc d = json_mini::parse(raw);
    json_object* arr = nullptr;
    if (d && json_object_is_type(d.root, json_type_array)) {
        arr = d.root;
    } else if (d && json_object_is_type(d.root, json_type_object)) {
        json_object_object_get_ex(d.root, "code_snippets", &arr);
    }
    if (!arr || !json_object_is_type(arr, json_type_array)) {
        std::cerr << "[ERROR] expected a JSON array of snippets\n";
        return 2;
    }

    const SandboxExecutor ex = make_executor();
    install_cancel_handlers();
    RunOptions opts;
    opts.cancel = cancel_flag();
    BatchResult b = ex.run_batch(batch_snippets_from_json(arr), opts);
    print_json(batch_result_to_json(b));
    return b.failed == 0 ? 0 : 1;
}

int cmd_verify_log(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: codeloop_cli verify_log <run_log.jsonl>\n";
        return 2;
    }
    std::string err;
    if (!verify_run_log(argv[2], &err)) {
        std::cout << "CHAIN: BROKEN (" << err << ")\n";
        return 1;
    }
    std::cout << "CHAIN: OK\n";
    return 0;
}
