#include "codeloop/channel.h"
#include "codeloop/backoff.h"
#include "codeloop/json_mini.h"
#include "codeloop/language.h"
#include "codeloop/proc.h"
#include "codeloop/scratch.h"
#include "codeloop/serialization.h"

#include <algorithm>
#include <chrono>

namespace codeloop {

namespace {
// Slack past the request bound before the service itself is stopped, and
// the SIGTERM-to-SIGKILL window it gets for cleanup.
constexpr int kServiceGraceMs = 2000;
} // namespace

// --- DirectExecutionChannel ---

ChannelReply DirectExecutionChannel::execute(const std::string& code,
                                             const std::string& language,
                                             const std::string& stdin_data,
                                             int timeout_ms,
                                             const std::atomic<bool>* cancel) {
    RunOptions opts;
    if (timeout_ms > 0) opts.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    opts.cancel = cancel;

    ChannelReply reply;
    reply.available = true;
    reply.structured = true;
    reply.result = executor_.run(code, language, stdin_data, opts);
    return reply;
}

// --- ToolConnection ---

bool ToolCatalog::has(const std::string& tool) const {
    return std::find(tools.begin(), tools.end(), tool) != tools.end();
}

const char* connection_state_name(ConnectionState s) {
    switch (s) {
        case ConnectionState::UNINITIALIZED: return "UNINITIALIZED";
        case ConnectionState::READY: return "READY";
        case ConnectionState::PERMANENTLY_FAILED: return "PERMANENTLY_FAILED";
    }
    return "UNINITIALIZED";
}

ToolConnection::ToolConnection(Negotiator negotiate, int connect_attempts,
                               int64_t backoff_base_ms, int64_t backoff_max_ms)
    : negotiate_(std::move(negotiate)),
      connect_attempts_(std::max(1, connect_attempts)),
      backoff_base_ms_(backoff_base_ms),
      backoff_max_ms_(backoff_max_ms) {}

bool ToolConnection::acquire(ToolCatalog* out, std::string* err, const std::atomic<bool>* cancel) {
    std::unique_lock<std::mutex> lk(mu_);
    while (true) {
        if (state_ == ConnectionState::READY) {
            if (out) *out = catalog_;
            return true;
        }
        if (state_ == ConnectionState::PERMANENTLY_FAILED) {
            if (err) *err = failure_;
            return false;
        }
        if (!negotiating_) break;
        cv_.wait(lk);
    }
    negotiating_ = true;
    lk.unlock();

    ToolCatalog cat;
    std::string last_err = "no negotiation attempted";
    bool ok = false;
    bool cancelled = false;
    int tries = 0;
    for (int attempt = 1; attempt <= connect_attempts_; attempt++) {
        if (attempt > 1) {
            int64_t delay = backoff_delay_ms(attempt, backoff_base_ms_, 2, backoff_max_ms_);
            if (!sleep_interruptible_ms(delay, cancel)) {
                cancelled = true;
                break;
            }
        }
        tries++;
        std::string e;
        ToolCatalog c;
        bool good = false;
        try {
            good = negotiate_(&c, &e);
        } catch (const std::exception& ex) {
            e = ex.what();
        }
        if (good) {
            cat = std::move(c);
            ok = true;
            break;
        }
        last_err = e;
    }

    lk.lock();
    negotiations_ += tries;
    negotiating_ = false;
    if (ok) {
        state_ = ConnectionState::READY;
        catalog_ = std::move(cat);
        if (out) *out = catalog_;
    } else if (!cancelled) {
        state_ = ConnectionState::PERMANENTLY_FAILED;
        failure_ = "Could not connect to code execution server after " +
                   std::to_string(connect_attempts_) + " attempt(s): " + last_err;
        if (err) *err = failure_;
    } else if (err) {
        *err = "connection negotiation cancelled";
    }
    cv_.notify_all();
    return ok;
}

ConnectionState ToolConnection::state() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

int ToolConnection::negotiation_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return negotiations_;
}

void ToolConnection::reset() {
    std::lock_guard<std::mutex> lk(mu_);
    if (negotiating_) return;
    state_ = ConnectionState::UNINITIALIZED;
    catalog_ = ToolCatalog{};
    failure_.clear();
}

ToolConnection::Negotiator make_process_negotiator(const std::string& cmd, int timeout_ms) {
    return [cmd, timeout_ms](ToolCatalog* out, std::string* err) -> bool {
        auto argv = split_argv_quoted(cmd);
        if (argv.empty()) {
            *err = "execution service command is empty";
            return false;
        }
        argv.push_back("--list");

        ProcLimits lim;
        lim.timeout_ms = timeout_ms;
        lim.stdout_max_bytes = 64 * 1024;
        lim.rlimit_as_mb = 0;
        lim.rlimit_nofile = 256;

        ProcResult pr;
        if (!proc_run_capture_sandboxed(argv, ".", lim, &pr)) {
            *err = "cannot start " + argv[0] + ": " + pr.error;
            return false;
        }
        if (pr.timed_out) {
            *err = "tool listing timed out";
            return false;
        }
        if (pr.exit_code != 0) {
            *err = "tool listing exited with code " + std::to_string(pr.exit_code);
            return false;
        }

        json_mini::Doc d = json_mini::parse(pr.stdout_data);
        if (!d || !json_object_is_type(d.root, json_type_object) ||
            !json_mini::field_bool(d.root, "ok").value_or(false)) {
            *err = "malformed tool listing";
            return false;
        }
        ToolCatalog cat;
        cat.server = json_mini::field_string(d.root, "server").value_or("");
        cat.protocol = (int)json_mini::field_int(d.root, "protocol").value_or(0);
        json_object* tools = nullptr;
        if (json_object_object_get_ex(d.root, "tools", &tools) && json_object_is_type(tools, json_type_array)) {
            const size_t n = json_object_array_length(tools);
            for (size_t i = 0; i < n; i++) {
                json_object* t = json_object_array_get_idx(tools, (int)i);
                if (auto nm = json_mini::field_string(t, "name")) cat.tools.push_back(*nm);
            }
        }
        if (!cat.has("execute_code")) {
            *err = "execution service does not offer execute_code";
            return false;
        }
        *out = std::move(cat);
        return true;
    };
}

// --- ToolExecutionChannel ---

ChannelReply ToolExecutionChannel::execute(const std::string& code,
                                           const std::string& language,
                                           const std::string& stdin_data,
                                           int timeout_ms,
                                           const std::atomic<bool>* cancel) {
    ChannelReply reply;
    ToolCatalog cat;
    std::string err;
    if (!conn_ || !conn_->acquire(&cat, &err, cancel)) {
        reply.available = false;
        reply.error = err.empty() ? "Could not connect to code execution server" : err;
        return reply;
    }
    reply.available = true;

    ScratchDir scratch;
    if (!scratch.create(cfg_.scratch_root, "codeloop_exec_", &err)) {
        reply.structured = true;
        reply.result.language = language;
        reply.result.error_kind = ErrorKind::INTERNAL;
        reply.result.error = "Execution error: " + err;
        return reply;
    }

    auto argv = split_argv_quoted(cfg_.cmd);
    if (argv.empty()) {
        reply.available = false;
        reply.error = "execution service command is empty";
        return reply;
    }
    argv.push_back("--run");
    argv.push_back("execute_code");
    argv.push_back("--scratch-root");
    argv.push_back(scratch.path().string());
    if (timeout_ms > 0) {
        argv.push_back("--deadline-ms");
        argv.push_back(std::to_string(timeout_ms));
    }

    json_object* req = json_object_new_object();
    json_object_object_add(req, "code", json_mini::new_string(code));
    json_object_object_add(req, "language", json_mini::new_string(language));
    json_object_object_add(req, "input_data", json_mini::new_string(stdin_data));
    const std::string payload = json_take_string(req);

    // The service enforces timeout_ms itself and reports a structured TIMEOUT.
    // The outer bound only catches a stuck service; SIGTERM lets it kill the
    // user program's process group before SIGKILL follows.
    ProcLimits lim;
    lim.timeout_ms = timeout_ms > 0 ? timeout_ms + kServiceGraceMs : 0;
    lim.kill_grace_ms = kServiceGraceMs;
    lim.stdout_max_bytes = cfg_.output_max_bytes;
    lim.rlimit_as_mb = 0;
    lim.rlimit_fsize_mb = 128;
    lim.rlimit_nofile = 1024;
    lim.rlimit_nproc = 0;
    lim.cancel = cancel;

    ProcResult pr;
    if (!proc_run_capture_sandboxed_stdin(argv, scratch.path().string(), payload, lim, &pr)) {
        reply.available = false;
        reply.error = "Could not connect to code execution server: " + pr.error;
        return reply;
    }
    if (pr.cancelled || pr.timed_out) {
        reply.structured = true;
        reply.result.language = normalize_language(language);
        reply.result.duration_sec = pr.elapsed_ms / 1000.0;
        if (pr.cancelled) {
            reply.result.error_kind = ErrorKind::CANCELLED;
            reply.result.error = "Execution cancelled";
        } else {
            reply.result.error_kind = ErrorKind::TIMEOUT;
            reply.result.timeout_phase = TimeoutPhase::WORKFLOW;
            reply.result.error = "Code execution timed out after " + std::to_string(timeout_ms / 1000) + " seconds";
        }
        return reply;
    }

    json_mini::Doc d = json_mini::parse(pr.stdout_data);
    if (d && json_object_is_type(d.root, json_type_object)) {
        ExecutionResult r;
        if (execution_result_from_json(d.root, &r)) {
            reply.structured = true;
            reply.result = std::move(r);
            return reply;
        }
        if (auto e = json_mini::field_string(d.root, "error")) {
            reply.structured = true;
            reply.result.language = normalize_language(language);
            reply.result.error_kind = ErrorKind::INTERNAL;
            reply.result.error = *e;
            return reply;
        }
    }
    if (pr.stdout_data.find_first_not_of(" \t\r\n") != std::string::npos) {
        reply.free_text = pr.stdout_data;
        reply.classified = classify(pr.stdout_data);
        return reply;
    }
    reply.available = false;
    reply.error = "execution service exited with code " + std::to_string(pr.exit_code) + " and no reply";
    return reply;
}

} // namespace codeloop
