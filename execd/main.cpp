#include "codeloop/config.h"
#include "codeloop/executor.h"
#include "codeloop/json_mini.h"
#include "codeloop/language.h"
#include "codeloop/serialization.h"

#include <json-c/json.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace codeloop;

namespace {

constexpr int kProtocolVersion = 1;

// Set by SIGTERM/SIGINT; the sandbox kills its process group and the call
// reports CANCELLED.
std::atomic<bool> g_stop{false};

void on_stop_signal(int) {
    g_stop.store(true);
}

void install_stop_handlers() {
    struct sigaction sa {};
    sa.sa_handler = on_stop_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

// Per-call options; the deadline clock starts when the call starts.
RunOptions call_options(const RunOptions& base, int deadline_ms) {
    RunOptions o = base;
    if (deadline_ms > 0) o.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(deadline_ms);
    return o;
}

// Handler result: a reply object, or a protocol error for malformed arguments.
struct Reply {
    json_object* body{nullptr};
    std::string error;
};

using ToolFn = Reply (*)(const SandboxExecutor& ex, json_object* args, const RunOptions& opts);

struct ToolSpec {
    const char* name;
    const char* description;
    std::vector<const char*> params;
    ToolFn fn;
};

Reply missing(const char* key) {
    return Reply{nullptr, std::string("missing required argument: ") + key};
}

Reply tool_execute_code(const SandboxExecutor& ex, json_object* args, const RunOptions& opts) {
    auto code = json_mini::field_string(args, "code");
    if (!code) return missing("code");
    auto lang = json_mini::field_string(args, "language");
    if (!lang) return missing("language");
    std::string input = json_mini::field_string(args, "input_data")
                            .value_or(json_mini::field_string(args, "input").value_or(""));

    std::fprintf(stderr, "[INFO] Executing %s code\n", lang->c_str());
    ExecutionResult r = ex.run(*code, *lang, input, opts);
    if (r.succeeded) {
        std::fprintf(stderr, "[INFO] Code executed successfully in %.3fs\n", r.duration_sec);
    } else {
        std::fprintf(stderr, "[WARN] Code execution failed (%s)\n", error_kind_name(r.error_kind));
    }
    return Reply{execution_result_to_json(r), ""};
}

Reply tool_batch_execute_code(const SandboxExecutor& ex, json_object* args, const RunOptions& opts) {
    json_object* arr = nullptr;
    if (!json_object_object_get_ex(args, "code_snippets", &arr) || !json_object_is_type(arr, json_type_array)) {
        return missing("code_snippets");
    }
    const auto snippets = batch_snippets_from_json(arr);
    std::fprintf(stderr, "[INFO] Batch executing %zu code snippets\n", snippets.size());
    BatchResult b = ex.run_batch(snippets, opts);
    std::fprintf(stderr, "[INFO] Batch execution completed: %d/%d successful\n", b.successful, b.total);
    return Reply{batch_result_to_json(b), ""};
}

Reply tool_validate_syntax(const SandboxExecutor& ex, json_object* args, const RunOptions& opts) {
    auto code = json_mini::field_string(args, "code");
    if (!code) return missing("code");
    auto lang = json_mini::field_string(args, "language");
    if (!lang) return missing("language");
    std::fprintf(stderr, "[INFO] Validating %s syntax\n", lang->c_str());
    return Reply{syntax_check_to_json(ex.validate_syntax(*code, *lang, opts)), ""};
}

Reply tool_get_supported_languages(const SandboxExecutor& ex, json_object*, const RunOptions&) {
    return Reply{language_info_to_json(ex.language_info()), ""};
}

Reply tool_get_language_template(const SandboxExecutor& ex, json_object* args, const RunOptions&) {
    auto lang = json_mini::field_string(args, "language");
    if (!lang) return missing("language");
    json_object* o = json_object_new_object();
    auto tmpl = ex.language_template(*lang);
    if (tmpl) {
        json_object_object_add(o, "language", json_mini::new_string(normalize_language(*lang)));
        json_object_object_add(o, "template", json_mini::new_string(*tmpl));
    } else {
        json_object_object_add(o, "error", json_mini::new_string(
            "Unsupported language '" + *lang + "'. Supported languages: " + supported_languages_csv()));
    }
    return Reply{o, ""};
}

const std::vector<ToolSpec>& tool_table() {
    static const std::vector<ToolSpec> tools = {
        {"execute_code", "Execute code in the specified programming language (python, java, javascript, cpp, c++)",
         {"code", "language", "input_data"}, &tool_execute_code},
        {"batch_execute_code", "Execute multiple code snippets, each {code, language, input}",
         {"code_snippets"}, &tool_batch_execute_code},
        {"validate_syntax", "Validate code syntax without executing (compiled languages)",
         {"code", "language"}, &tool_validate_syntax},
        {"get_supported_languages", "Supported programming languages and configuration",
         {}, &tool_get_supported_languages},
        {"get_language_template", "Starter program and usage notes for a language",
         {"language"}, &tool_get_language_template},
    };
    return tools;
}

const ToolSpec* find_tool(const std::string& name) {
    for (const auto& t : tool_table()) {
        if (name == t.name) return &t;
    }
    return nullptr;
}

std::string slurp_stdin(bool* too_big) {
    std::string result;
    result.reserve(4096);
    constexpr size_t MAX_STDIN_BYTES = 10ULL * 1024 * 1024;
    char buf[8192];
    *too_big = false;
    while (std::cin.read(buf, sizeof(buf)) || std::cin.gcount()) {
        result.append(buf, (size_t)std::cin.gcount());
        if (result.size() > MAX_STDIN_BYTES) {
            *too_big = true;
            break;
        }
    }
    return result;
}

std::string error_json(const std::string& msg) {
    return "{\"ok\":false,\"error\":" + json_mini::quote(msg) + "}";
}

[[noreturn]] void print_error_json(const std::string& msg, int exit_code) {
    std::cout << error_json(msg);
    std::cout.flush();
    std::exit(exit_code);
}

int do_list() {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "ok", json_object_new_boolean(1));
    json_object_object_add(root, "server", json_object_new_string("codeloop_execd"));
    json_object_object_add(root, "protocol", json_object_new_int(kProtocolVersion));
    json_object* arr = json_object_new_array();
    for (const auto& t : tool_table()) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "name", json_object_new_string(t.name));
        json_object_object_add(o, "description", json_object_new_string(t.description));
        json_object* params = json_object_new_array();
        for (const char* p : t.params) json_object_array_add(params, json_object_new_string(p));
        json_object_object_add(o, "params", params);
        json_object_array_add(arr, o);
    }
    json_object_object_add(root, "tools", arr);
    std::cout << json_take_string(root);
    return 0;
}

int do_run(const SandboxExecutor& ex, const std::string& tool, const RunOptions& base, int deadline_ms) {
    const ToolSpec* entry = find_tool(tool);
    if (!entry) print_error_json("unknown tool: " + tool, 4);

    bool too_big = false;
    const std::string req = slurp_stdin(&too_big);
    if (too_big) print_error_json("stdin exceeds 10MB limit", 5);

    json_mini::Doc d = json_mini::parse(req.empty() ? std::string("{}") : req);
    if (!d || !json_object_is_type(d.root, json_type_object)) {
        print_error_json("invalid JSON request on stdin", 5);
    }

    Reply r = entry->fn(ex, d.root, call_options(base, deadline_ms));
    if (!r.body) print_error_json(r.error, 5);
    std::cout << json_take_string(r.body);
    return 0;
}

// Newline-delimited requests {"tool":..., "arguments":{...}, "id":...}, one
// response line each. An empty line, EOF or SIGTERM stops the server.
int do_serve(const SandboxExecutor& ex, const RunOptions& base, int deadline_ms) {
    std::string line;
    while (!g_stop.load() && std::getline(std::cin, line)) {
        if (line.empty()) break;

        json_mini::Doc d = json_mini::parse(line);
        if (!d || !json_object_is_type(d.root, json_type_object)) {
            std::cout << error_json("invalid JSON") << "\n";
            std::cout.flush();
            continue;
        }
        const std::string tool = json_mini::field_string(d.root, "tool").value_or("");
        json_object* id = nullptr;
        json_object_object_get_ex(d.root, "id", &id);

        const ToolSpec* entry = find_tool(tool);
        json_object* args = nullptr;
        if (!json_object_object_get_ex(d.root, "arguments", &args) || !json_object_is_type(args, json_type_object)) {
            args = nullptr;
        }

        json_object* out = json_object_new_object();
        if (id) json_object_object_add(out, "id", json_object_get(id));
        if (!entry) {
            json_object_object_add(out, "ok", json_object_new_boolean(0));
            json_object_object_add(out, "error", json_mini::new_string(tool.empty() ? "missing tool" : "unknown tool: " + tool));
        } else {
            json_mini::Doc empty(json_object_new_object());
            Reply r = entry->fn(ex, args ? args : empty.root, call_options(base, deadline_ms));
            if (r.body) {
                json_object_object_add(out, "ok", json_object_new_boolean(1));
                json_object_object_add(out, "tool", json_object_new_string(entry->name));
                json_object_object_add(out, "result", r.body);
            } else {
                json_object_object_add(out, "ok", json_object_new_boolean(0));
                json_object_object_add(out, "error", json_mini::new_string(r.error));
            }
        }
        std::cout << json_take_string(out) << "\n";
        std::cout.flush();
    }
    return 0;
}

void usage() {
    std::cerr << "usage:\n"
                 "  codeloop_execd --list\n"
                 "  codeloop_execd --run <tool> [--scratch-root DIR] [--deadline-ms N]   (reads JSON arguments from stdin)\n"
                 "  codeloop_execd --serve [--scratch-root DIR] [--deadline-ms N]        (NDJSON requests on stdin)\n"
                 "--deadline-ms bounds each tool call; SIGTERM cancels the call in flight.\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        usage();
        return 2;
    }
    apply_profile_defaults(detect_profile());

    const std::string mode = argv[1];
    std::string tool;
    RunOptions opts;
    int deadline_ms = 0;
    for (int i = 2; i < argc; i++) {
        const std::string a = argv[i];
        if (a == "--scratch-root" && i + 1 < argc) {
            opts.scratch_root = argv[++i];
        } else if (a == "--deadline-ms" && i + 1 < argc) {
            char* end = nullptr;
            long v = std::strtol(argv[++i], &end, 10);
            if (!end || *end != '\0' || v <= 0 || v > 24L * 3600 * 1000) {
                usage();
                return 2;
            }
            deadline_ms = (int)v;
        } else if (mode == "--run" && tool.empty()) {
            tool = a;
        } else {
            usage();
            return 2;
        }
    }

    if (mode == "--list") return do_list();

    install_stop_handlers();
    opts.cancel = &g_stop;

    const SandboxExecutor ex(load_sandbox_config());
    if (mode == "--run") {
        if (tool.empty()) print_error_json("missing tool name", 2);
        return do_run(ex, tool, opts, deadline_ms);
    }
    if (mode == "--serve") return do_serve(ex, opts, deadline_ms);

    usage();
    return 2;
}
