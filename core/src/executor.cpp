#include "codeloop/executor.h"
#include "codeloop/language.h"
#include "codeloop/proc.h"
#include "codeloop/scratch.h"

#include <cctype>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <regex>
#include <sstream>

namespace codeloop {

namespace {

using Clock = std::chrono::steady_clock;

double seconds_since(Clock::time_point t0) {
    return std::chrono::duration<double>(Clock::now() - t0).count();
}

std::string fmt_seconds(double s) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2fs", s);
    return buf;
}

// Effective timeout for one step: the configured limit, shortened to what is
// left of the caller's deadline. Returns false when the deadline has passed.
bool step_timeout(int configured_ms, const RunOptions& opts, int* out_ms, bool* clamped) {
    *out_ms = configured_ms;
    *clamped = false;
    if (!opts.deadline) return true;
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*opts.deadline - Clock::now()).count();
    if (left <= 0) return false;
    if (configured_ms <= 0 || left < configured_ms) {
        *out_ms = (int)left;
        *clamped = true;
    }
    return true;
}

bool write_file(const std::filesystem::path& p, const std::string& body) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    if (!f) return false;
    f << body;
    f.close();
    return !f.fail();
}

std::string unsupported_message(const std::string& language) {
    return "Unsupported language: " + language + ". Supported: " + supported_languages_csv();
}

// Everything one compile/run cycle needs, materialized in a scratch dir.
struct Workspace {
    ScratchDir dir;
    std::string src;
    std::string exe;
    std::string cls;
};

bool materialize(const LanguageRuntime& rt, const std::string& source,
                 const SandboxConfig& cfg, const RunOptions& opts,
                 Workspace* ws, std::string* err) {
    const std::filesystem::path root = opts.scratch_root.empty() ? cfg.scratch_root : opts.scratch_root;
    if (!ws->dir.create(root, "codeloop_" + rt.id + "_", err)) return false;

    std::string body = source;
    std::string base = rt.default_basename;
    if (rt.id == "java") {
        body = prepare_java_source(source);
        base = java_public_class_name(body).value_or(rt.default_basename);
    }
    ws->cls = base;
    const std::filesystem::path src = ws->dir.path() / (base + rt.extension);
    ws->src = src.string();
    ws->exe = (ws->dir.path() / "program").string();
    if (!write_file(src, body)) {
        *err = "cannot write source file " + ws->src;
        return false;
    }
    return true;
}

ProcLimits compile_limits(const LanguageRuntime& rt, const SandboxConfig& cfg, int timeout_ms,
                          const RunOptions& opts) {
    ProcLimits lim;
    lim.timeout_ms = timeout_ms;
    lim.stdout_max_bytes = cfg.output_max_bytes;
    lim.rlimit_cpu_sec = 0;
    lim.rlimit_as_mb = rt.compile_as_mb;
    lim.rlimit_fsize_mb = 128;
    lim.rlimit_nofile = 1024;
    lim.rlimit_nproc = 0;
    lim.no_new_privs = cfg.no_new_privs;
    lim.cancel = opts.cancel;
    return lim;
}

ProcLimits run_limits(const LanguageRuntime& rt, const SandboxConfig& cfg, int timeout_ms,
                      const RunOptions& opts) {
    ProcLimits lim;
    lim.timeout_ms = timeout_ms;
    lim.stdout_max_bytes = cfg.output_max_bytes;
    // CPU seconds backstop; the wall clock normally fires first.
    lim.rlimit_cpu_sec = timeout_ms > 0 ? (timeout_ms + 999) / 1000 + 1 : 0;
    lim.rlimit_as_mb = rt.run_as_mb;
    lim.rlimit_fsize_mb = 16;
    lim.rlimit_nofile = 256;
    // RLIMIT_NPROC counts every process of the user, so it stays off; the
    // process group kill covers whatever the program forks.
    lim.rlimit_nproc = 0;
    lim.no_new_privs = cfg.no_new_privs;
    lim.cancel = opts.cancel;
    return lim;
}

void set_timeout(ExecutionResult* r, TimeoutPhase phase, const char* step, double elapsed, int limit_ms) {
    r->succeeded = false;
    r->error_kind = ErrorKind::TIMEOUT;
    r->timeout_phase = phase;
    std::string msg = std::string("Execution timed out during ") + step + " after " + fmt_seconds(elapsed);
    if (phase == TimeoutPhase::WORKFLOW) {
        msg += " (request deadline reached)";
    } else {
        msg += " (limit " + fmt_seconds(limit_ms / 1000.0) + ")";
    }
    r->error = msg;
}

void set_failure(ExecutionResult* r, ErrorKind kind, const std::string& msg) {
    r->succeeded = false;
    r->error_kind = kind;
    r->error = msg;
}

bool check_toolchain(const std::vector<std::string>& argv, ExecutionResult* r) {
    if (!argv.empty() && executable_on_path(argv[0])) return true;
    set_failure(r, ErrorKind::TOOLCHAIN_UNAVAILABLE,
                "Toolchain not found: " + (argv.empty() ? std::string("<empty>") : argv[0]));
    return false;
}

} // namespace

SandboxExecutor::SandboxExecutor(SandboxConfig cfg) : cfg_(std::move(cfg)) {}

std::vector<std::string> SandboxExecutor::expand_cmd(const std::vector<std::string>& tmpl,
                                                     const std::string& src,
                                                     const std::string& exe,
                                                     const std::string& dir,
                                                     const std::string& cls) const {
    std::vector<std::string> out;
    out.reserve(tmpl.size());
    for (size_t i = 0; i < tmpl.size(); i++) {
        const std::string& t = tmpl[i];
        if (t == "{src}") out.push_back(src);
        else if (t == "{exe}") out.push_back(exe);
        else if (t == "{dir}") out.push_back(dir);
        else if (t == "{class}") out.push_back(cls);
        else out.push_back(t);
    }
    if (!out.empty()) {
        auto it = cfg_.tool_overrides.find(out[0]);
        if (it != cfg_.tool_overrides.end() && !it->second.empty()) out[0] = it->second;
    }
    return out;
}

ExecutionResult SandboxExecutor::run(const std::string& source,
                                     const std::string& language,
                                     const std::string& stdin_data,
                                     const RunOptions& opts) const {
    const auto t0 = Clock::now();
    ExecutionResult r;
    r.language = normalize_language(language);

    const LanguageRuntime* rt = find_language_runtime(language);
    if (!rt) {
        set_failure(&r, ErrorKind::UNSUPPORTED_LANGUAGE, unsupported_message(r.language));
        return r;
    }

    try {
        Workspace ws;
        std::string err;
        if (!materialize(*rt, source, cfg_, opts, &ws, &err)) {
            set_failure(&r, ErrorKind::INTERNAL, "Execution error: " + err);
            r.duration_sec = seconds_since(t0);
            return r;
        }
        const std::string dir = ws.dir.path().string();

        if (rt->compiled()) {
            int tmo = 0;
            bool clamped = false;
            if (!step_timeout(cfg_.compile_timeout_ms, opts, &tmo, &clamped)) {
                set_timeout(&r, TimeoutPhase::WORKFLOW, "compilation", seconds_since(t0), 0);
                r.duration_sec = seconds_since(t0);
                return r;
            }
            auto argv = expand_cmd(rt->compile_cmd, ws.src, ws.exe, dir, ws.cls);
            if (!check_toolchain(argv, &r)) {
                r.duration_sec = seconds_since(t0);
                return r;
            }
            ProcResult cr;
            if (!proc_run_capture_sandboxed(argv, dir, compile_limits(*rt, cfg_, tmo, opts), &cr)) {
                set_failure(&r, ErrorKind::INTERNAL, "Execution error: " + cr.error);
                r.duration_sec = seconds_since(t0);
                return r;
            }
            if (cr.cancelled) {
                set_failure(&r, ErrorKind::CANCELLED, "Execution cancelled during compilation");
                r.duration_sec = seconds_since(t0);
                return r;
            }
            if (cr.timed_out) {
                set_timeout(&r, clamped ? TimeoutPhase::WORKFLOW : TimeoutPhase::COMPILE,
                            "compilation", cr.elapsed_ms / 1000.0, tmo);
                r.stderr_data = cr.stderr_data;
                r.duration_sec = seconds_since(t0);
                return r;
            }
            if (cr.exit_code != 0) {
                const std::string& diag = cr.stderr_data.empty() ? cr.stdout_data : cr.stderr_data;
                set_failure(&r, ErrorKind::COMPILE_FAILURE, "Compilation error: " + diag);
                r.stderr_data = diag;
                r.output_truncated = cr.output_truncated;
                r.duration_sec = seconds_since(t0);
                return r;
            }
        }

        int tmo = 0;
        bool clamped = false;
        if (!step_timeout(cfg_.run_timeout_ms, opts, &tmo, &clamped)) {
            set_timeout(&r, TimeoutPhase::WORKFLOW, "execution", seconds_since(t0), 0);
            r.duration_sec = seconds_since(t0);
            return r;
        }
        auto argv = expand_cmd(rt->run_cmd, ws.src, ws.exe, dir, ws.cls);
        if (!check_toolchain(argv, &r)) {
            r.duration_sec = seconds_since(t0);
            return r;
        }
        ProcResult pr;
        if (!proc_run_capture_sandboxed_stdin(argv, dir, stdin_data, run_limits(*rt, cfg_, tmo, opts), &pr)) {
            set_failure(&r, ErrorKind::INTERNAL, "Execution error: " + pr.error);
            r.duration_sec = seconds_since(t0);
            return r;
        }
        r.stdout_data = pr.stdout_data;
        r.stderr_data = pr.stderr_data;
        r.output_truncated = pr.output_truncated;
        r.exit_code = pr.exit_code;

        if (pr.cancelled) {
            set_failure(&r, ErrorKind::CANCELLED, "Execution cancelled");
        } else if (pr.timed_out) {
            set_timeout(&r, clamped ? TimeoutPhase::WORKFLOW : TimeoutPhase::RUN,
                        "execution", pr.elapsed_ms / 1000.0, tmo);
        } else if (pr.term_signal == SIGXCPU) {
            set_timeout(&r, TimeoutPhase::RUN, "execution", pr.elapsed_ms / 1000.0, tmo);
            r.error += ": CPU time limit exceeded";
        } else if (pr.exit_code == 0) {
            r.succeeded = true;
            r.error_kind = ErrorKind::NONE;
            r.error = pr.stderr_data;
        } else {
            std::string msg = pr.stderr_data;
            if (msg.empty()) {
                msg = pr.term_signal ? "Process killed by signal " + std::to_string(pr.term_signal)
                                     : "Process exited with code " + std::to_string(pr.exit_code);
            }
            set_failure(&r, ErrorKind::RUNTIME_FAILURE, msg);
        }
        r.duration_sec = seconds_since(t0);
        return r;
    } catch (const std::exception& e) {
        set_failure(&r, ErrorKind::INTERNAL, std::string("Execution error: ") + e.what());
        r.duration_sec = seconds_since(t0);
        return r;
    }
}

BatchResult SandboxExecutor::run_batch(const std::vector<BatchSnippet>& snippets,
                                       const RunOptions& opts) const {
    BatchResult out;
    for (size_t i = 0; i < snippets.size(); i++) {
        const BatchSnippet& s = snippets[i];
        ExecutionResult r;
        if (!s.invalid_reason.empty()) {
            r.language = s.language;
            set_failure(&r, ErrorKind::INTERNAL, s.invalid_reason);
        } else {
            r = run(s.code, s.language, s.stdin_data, opts);
        }
        if (r.succeeded) out.successful++;
        else out.failed++;
        out.results.emplace_back("snippet_" + std::to_string(i), std::move(r));
    }
    out.total = (int)out.results.size();
    return out;
}

SyntaxCheck SandboxExecutor::validate_syntax(const std::string& source,
                                             const std::string& language,
                                             const RunOptions& opts) const {
    SyntaxCheck sc;
    sc.language = normalize_language(language);

    const LanguageRuntime* rt = find_language_runtime(language);
    if (!rt) {
        sc.valid = false;
        sc.error = "Unsupported language: " + sc.language;
        return sc;
    }
    if (!rt->compiled()) {
        sc.valid = true;
        sc.message = "Syntax validation not available for " + rt->id + " (interpreted language)";
        return sc;
    }

    try {
        Workspace ws;
        std::string err;
        if (!materialize(*rt, source, cfg_, opts, &ws, &err)) {
            sc.error = "Syntax validation error: " + err;
            return sc;
        }
        int tmo = 0;
        bool clamped = false;
        if (!step_timeout(cfg_.compile_timeout_ms, opts, &tmo, &clamped)) {
            sc.error = "Syntax validation error: request deadline reached";
            return sc;
        }
        const std::string dir = ws.dir.path().string();
        auto argv = expand_cmd(rt->compile_cmd, ws.src, ws.exe, dir, ws.cls);
        if (argv.empty() || !executable_on_path(argv[0])) {
            sc.error = "Toolchain not found: " + (argv.empty() ? std::string("<empty>") : argv[0]);
            return sc;
        }
        ProcResult cr;
        if (!proc_run_capture_sandboxed(argv, dir, compile_limits(*rt, cfg_, tmo, opts), &cr)) {
            sc.error = "Syntax validation error: " + cr.error;
            return sc;
        }
        if (cr.cancelled) {
            sc.error = "Syntax validation cancelled";
        } else if (cr.timed_out) {
            sc.error = "Compilation timed out after " + fmt_seconds(cr.elapsed_ms / 1000.0);
        } else if (cr.exit_code != 0) {
            sc.error = "Compilation error: " + (cr.stderr_data.empty() ? cr.stdout_data : cr.stderr_data);
        } else {
            sc.valid = true;
            sc.message = (rt->id == "java" ? "Java" : "C++") + std::string(" code compiled successfully");
        }
        return sc;
    } catch (const std::exception& e) {
        sc.valid = false;
        sc.error = std::string("Syntax validation error: ") + e.what();
        return sc;
    }
}

LanguageInfo SandboxExecutor::language_info() const {
    LanguageInfo info;
    info.supported_languages = supported_language_names();
    info.timeout_ms = cfg_.run_timeout_ms;
    for (const auto& rt : language_runtimes()) {
        LanguageDetail d;
        d.id = rt.id;
        d.extension = rt.extension;
        d.compiled = rt.compiled();
        d.interpreted = rt.interpreted;
        info.details.push_back(d);
    }
    return info;
}

std::optional<std::string> SandboxExecutor::language_template(const std::string& language) const {
    const LanguageRuntime* rt = find_language_runtime(language);
    if (!rt) return std::nullopt;

    std::string body;
    if (rt->id == "python") {
        body =
            "# Python Code Template\n"
            "print(\"Hello, World!\")\n\n"
            "# Input/Output example\n"
            "name = input(\"Enter your name: \")\n"
            "print(f\"Hello, {name}!\")\n\n"
            "# Basic operations\n"
            "numbers = [1, 2, 3, 4, 5]\n"
            "squared = [n**2 for n in numbers]\n"
            "print(\"Squared numbers:\", squared)\n";
    } else if (rt->id == "java") {
        body =
            "// Java Code Template\n"
            "import java.util.Scanner;\n\n"
            "public class Main {\n"
            "    public static void main(String[] args) {\n"
            "        System.out.println(\"Hello, World!\");\n\n"
            "        Scanner scanner = new Scanner(System.in);\n"
            "        System.out.print(\"Enter your name: \");\n"
            "        String name = scanner.nextLine();\n"
            "        System.out.println(\"Hello, \" + name + \"!\");\n\n"
            "        int[] numbers = {1, 2, 3, 4, 5};\n"
            "        System.out.print(\"Squared numbers: \");\n"
            "        for (int n : numbers) {\n"
            "            System.out.print(n * n + \" \");\n"
            "        }\n"
            "        System.out.println();\n"
            "        scanner.close();\n"
            "    }\n"
            "}\n";
    } else if (rt->id == "javascript") {
        body =
            "// JavaScript (Node.js) Code Template\n"
            "const readline = require('readline');\n\n"
            "console.log(\"Hello, World!\");\n\n"
            "const rl = readline.createInterface({\n"
            "    input: process.stdin,\n"
            "    output: process.stdout\n"
            "});\n\n"
            "rl.question('Enter your name: ', (name) => {\n"
            "    console.log(`Hello, ${name}!`);\n"
            "    const numbers = [1, 2, 3, 4, 5];\n"
            "    console.log(\"Squared numbers:\", numbers.map(n => n * n));\n"
            "    rl.close();\n"
            "});\n";
    } else {
        body =
            "// C++ Code Template\n"
            "#include <iostream>\n"
            "#include <string>\n"
            "#include <vector>\n\n"
            "int main() {\n"
            "    std::cout << \"Hello, World!\" << std::endl;\n\n"
            "    std::cout << \"Enter your name: \";\n"
            "    std::string name;\n"
            "    std::getline(std::cin, name);\n"
            "    std::cout << \"Hello, \" << name << \"!\" << std::endl;\n\n"
            "    std::vector<int> numbers = {1, 2, 3, 4, 5};\n"
            "    std::cout << \"Squared numbers: \";\n"
            "    for (int n : numbers) std::cout << n * n << \" \";\n"
            "    std::cout << std::endl;\n"
            "    return 0;\n"
            "}\n";
    }

    std::string upper = normalize_language(language);
    for (auto& c : upper) c = (char)std::toupper((unsigned char)c);

    std::ostringstream oss;
    oss << "Code Execution Template for " << upper << "\n\n"
        << body << "\n"
        << "Usage Instructions:\n"
        << "1. Use the execute_code tool with your code\n"
        << "2. Provide input data if your program requires user input\n"
        << "3. The timeout is set to " << fmt_seconds(cfg_.run_timeout_ms / 1000.0) << "\n"
        << "4. For compiled languages (Java, C++), compilation errors will be reported\n"
        << "5. For interpreted languages (Python, JavaScript), runtime errors will be shown\n";
    return oss.str();
}

std::optional<std::string> java_public_class_name(const std::string& source) {
    static const std::regex re(R"(public\s+class\s+(\w+))");
    std::smatch m;
    if (std::regex_search(source, m, re)) return m[1].str();
    return std::nullopt;
}

std::string prepare_java_source(const std::string& source) {
    if (java_public_class_name(source)) return source;

    std::ostringstream body;
    std::istringstream in(source);
    std::string line;
    bool first = true;
    while (std::getline(in, line)) {
        if (!first) body << "\n";
        first = false;
        bool blank = line.find_first_not_of(" \t\r") == std::string::npos;
        if (!blank) body << "        " << line;
    }

    return "public class Main {\n"
           "    public static void main(String[] args) {\n" +
           body.str() +
           "\n    }\n"
           "}\n";
}

} // namespace codeloop
