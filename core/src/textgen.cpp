#include "codeloop/textgen.h"
#include "codeloop/backoff.h"
#include "codeloop/json_mini.h"
#include "codeloop/language.h"
#include "codeloop/proc.h"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace codeloop {

namespace {

const char* const kSystemPrompt =
    "You are a coding agent. Read the user's task and write a complete, runnable "
    "program that solves it, including simple checks that print their results. "
    "If previous code and its execution status are provided, use them as a reference "
    "and fix any reported errors. Reply with a single fenced code block tagged with "
    "the language; the program reads stdin and writes stdout.";

std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

std::string tail(const std::string& s, size_t n) {
    return s.size() <= n ? s : s.substr(s.size() - n);
}

// Decode a driver reply. Returns false with *err when the reply carries an
// explicit error or no text.
bool decode_reply(const std::string& out, std::string* text, std::string* err) {
    const std::string body = trim(out);
    json_mini::Doc d = json_mini::parse(body);
    if (d && json_object_is_type(d.root, json_type_object)) {
        if (auto c = json_mini::field_string(d.root, "content")) {
            *text = *c;
        } else if (auto e = json_mini::field_string(d.root, "error")) {
            *err = "generator error: " + *e;
            return false;
        } else {
            *text = body;
        }
    } else {
        *text = body;
    }
    if (trim(*text).empty()) {
        *err = "generator returned an empty response";
        return false;
    }
    return true;
}

} // namespace

std::string generation_request_to_json(const GenerationRequest& req) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "system", json_mini::new_string(req.system));
    json_object_object_add(o, "task", json_mini::new_string(req.task));
    json_object_object_add(o, "prior_code", json_mini::new_string(req.prior_code));
    json_object_object_add(o, "prior_status", json_mini::new_string(req.prior_status));
    json_object_object_add(o, "prior_error", json_mini::new_string(req.prior_error));
    json_object_object_add(o, "language", json_mini::new_string(req.language));
    std::string s = json_mini::to_string(o);
    json_object_put(o);
    return s;
}

GenerationResult ProcessTextGenerator::generate(const GenerationRequest& req,
                                                int timeout_ms,
                                                const std::atomic<bool>* cancel) {
    GenerationResult gr;
    const auto argv = split_argv_quoted(cfg_.cmd);
    if (argv.empty()) {
        gr.error = "text generation command not configured (CODELOOP_LLM_CMD)";
        return gr;
    }

    ProcLimits lim;
    lim.timeout_ms = cfg_.timeout_ms;
    if (timeout_ms > 0 && (lim.timeout_ms <= 0 || timeout_ms < lim.timeout_ms)) lim.timeout_ms = timeout_ms;
    lim.stdout_max_bytes = cfg_.output_max_bytes;
    lim.rlimit_cpu_sec = 0;
    lim.rlimit_as_mb = 0;       // model drivers map large runtimes
    lim.rlimit_fsize_mb = 64;
    lim.rlimit_nofile = 256;
    lim.rlimit_nproc = 0;
    lim.cancel = cancel;

    const std::string payload = generation_request_to_json(req);
    const std::string cwd = cfg_.cwd.empty() ? "." : cfg_.cwd;
    const int attempts = 1 + std::max(0, cfg_.retries);

    // One budget covers every attempt and the backoff between them.
    const int budget_ms = lim.timeout_ms;
    const auto start = std::chrono::steady_clock::now();
    auto remaining_ms = [&]() -> int64_t {
        return budget_ms - (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
    };
    auto timed_out = [&]() {
        gr.timed_out = true;
        gr.error = "text generation timed out after " + std::to_string(budget_ms) + " ms";
        return gr;
    };

    for (int attempt = 1; attempt <= attempts; attempt++) {
        if (attempt > 1) {
            int64_t delay = backoff_delay_ms(attempt, cfg_.backoff_base_ms, cfg_.backoff_mult, cfg_.backoff_max_ms);
            if (budget_ms > 0) delay = std::min(delay, std::max<int64_t>(0, remaining_ms()));
            if (!sleep_interruptible_ms(delay, cancel)) {
                gr.error = "text generation cancelled";
                return gr;
            }
        }
        if (budget_ms > 0) {
            const int64_t left = remaining_ms();
            if (left <= 0) return timed_out();
            lim.timeout_ms = (int)left;
        }

        ProcResult pr;
        if (!proc_run_capture_sandboxed_stdin(argv, cwd, payload, lim, &pr)) {
            gr.error = "cannot start text generator: " + pr.error;
            continue;
        }
        if (pr.cancelled) {
            gr.error = "text generation cancelled";
            return gr;
        }
        if (pr.timed_out) return timed_out();
        if (pr.exit_code != 0) {
            gr.error = "text generator exited with code " + std::to_string(pr.exit_code);
            if (!pr.stderr_data.empty()) gr.error += ": " + trim(tail(pr.stderr_data, 512));
            continue;
        }

        std::string text, err;
        if (!decode_reply(pr.stdout_data, &text, &err)) {
            gr.error = err;
            return gr;
        }
        gr.ok = true;
        gr.text = text;
        gr.error.clear();
        return gr;
    }
    return gr;
}

ExtractedCode extract_code_block(const std::string& text, const std::string& default_language) {
    ExtractedCode ec;
    ec.language = normalize_language(default_language);

    const size_t open = text.find("```");
    if (open == std::string::npos) {
        ec.code = trim(text);
        return ec;
    }
    size_t tag_end = text.find('\n', open + 3);
    if (tag_end == std::string::npos) {
        ec.code = trim(text);
        return ec;
    }
    const std::string tag = trim(text.substr(open + 3, tag_end - open - 3));
    if (!tag.empty() && find_language_runtime(tag)) ec.language = normalize_language(tag);

    const size_t body = tag_end + 1;
    const size_t close = text.find("```", body);
    ec.code = text.substr(body, close == std::string::npos ? std::string::npos : close - body);
    while (!ec.code.empty() && (ec.code.back() == '\n' || ec.code.back() == '\r')) ec.code.pop_back();
    ec.code += "\n";
    ec.fenced = true;
    return ec;
}

GenerationRequest build_generation_request(const WorkflowState& st, const std::string& language) {
    GenerationRequest req;
    req.system = kSystemPrompt;
    req.task = st.request();
    req.language = language;
    req.prior_code = st.result.code.empty() ? "None" : st.result.code;
    req.prior_status = st.result.status == ExecStatus::NONE ? "None" : exec_status_name(st.result.status);
    req.prior_error = st.result.error_message.empty() ? "None" : st.result.error_message;
    return req;
}

} // namespace codeloop
