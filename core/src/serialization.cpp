#include "codeloop/serialization.h"
#include "codeloop/json_mini.h"

namespace codeloop {

using json_mini::new_string;

std::string json_take_string(json_object* o) {
    if (!o) return "null";
    std::string out = json_mini::to_string(o);
    json_object_put(o);
    return out;
}

// --- ExecutionResult ---

json_object* execution_result_to_json(const ExecutionResult& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "success", json_object_new_boolean(r.succeeded));
    json_object_object_add(o, "output", new_string(r.stdout_data));
    json_object_object_add(o, "error", new_string(r.error));
    json_object_object_add(o, "execution_time", json_object_new_double(r.duration_sec));
    json_object_object_add(o, "language", new_string(r.language));
    json_object_object_add(o, "stderr", new_string(r.stderr_data));
    json_object_object_add(o, "exit_code", json_object_new_int(r.exit_code));
    json_object_object_add(o, "error_kind", json_object_new_string(error_kind_name(r.error_kind)));
    json_object_object_add(o, "timeout_phase", json_object_new_string(timeout_phase_name(r.timeout_phase)));
    json_object_object_add(o, "output_truncated", json_object_new_boolean(r.output_truncated));
    return o;
}

bool execution_result_from_json(json_object* o, ExecutionResult* out) {
    if (!o || !json_object_is_type(o, json_type_object) || !out) return false;
    auto success = json_mini::field_bool(o, "success");
    if (!success) return false;

    ExecutionResult r;
    r.succeeded = *success;
    r.stdout_data = json_mini::field_string(o, "output").value_or("");
    r.error = json_mini::field_string(o, "error").value_or("");
    r.duration_sec = json_mini::field_double(o, "execution_time").value_or(0.0);
    r.language = json_mini::field_string(o, "language").value_or("");
    r.stderr_data = json_mini::field_string(o, "stderr").value_or(r.succeeded ? r.error : "");
    r.exit_code = (int)json_mini::field_int(o, "exit_code").value_or(r.succeeded ? 0 : -1);
    r.output_truncated = json_mini::field_bool(o, "output_truncated").value_or(false);

    // Peers that only send the five basic keys get a generic kind.
    r.error_kind = r.succeeded ? ErrorKind::NONE : ErrorKind::RUNTIME_FAILURE;
    if (auto k = json_mini::field_string(o, "error_kind")) {
        ErrorKind kind;
        if (parse_error_kind(*k, &kind)) r.error_kind = kind;
    }
    if (auto p = json_mini::field_string(o, "timeout_phase")) {
        TimeoutPhase phase;
        if (parse_timeout_phase(*p, &phase)) r.timeout_phase = phase;
    }
    *out = std::move(r);
    return true;
}

// --- Batch ---

json_object* batch_result_to_json(const BatchResult& b) {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "success", json_object_new_boolean(true));
    json_object* results = json_object_new_object();
    for (const auto& kv : b.results) {
        json_object_object_add(results, kv.first.c_str(), execution_result_to_json(kv.second));
    }
    json_object_object_add(root, "results", results);
    json_object* summary = json_object_new_object();
    json_object_object_add(summary, "total", json_object_new_int(b.total));
    json_object_object_add(summary, "successful", json_object_new_int(b.successful));
    json_object_object_add(summary, "failed", json_object_new_int(b.failed));
    json_object_object_add(root, "summary", summary);
    return root;
}

std::vector<BatchSnippet> batch_snippets_from_json(json_object* arr) {
    std::vector<BatchSnippet> out;
    if (!arr || !json_object_is_type(arr, json_type_array)) return out;
    const size_t n = json_object_array_length(arr);
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        json_object* el = json_object_array_get_idx(arr, (int)i);
        BatchSnippet s;
        auto code = json_mini::field_string(el, "code");
        auto lang = json_mini::field_string(el, "language");
        if (!el || !json_object_is_type(el, json_type_object) || !code || !lang) {
            s.invalid_reason = "Invalid snippet format. Required keys: code, language";
            if (lang) s.language = *lang;
        } else {
            s.code = *code;
            s.language = *lang;
            s.stdin_data = json_mini::field_string(el, "input").value_or("");
        }
        out.push_back(std::move(s));
    }
    return out;
}

// --- Other sandbox replies ---

json_object* syntax_check_to_json(const SyntaxCheck& s) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "valid", json_object_new_boolean(s.valid));
    if (!s.message.empty()) json_object_object_add(o, "message", new_string(s.message));
    if (!s.error.empty()) json_object_object_add(o, "error", new_string(s.error));
    json_object_object_add(o, "language", new_string(s.language));
    return o;
}

json_object* language_info_to_json(const LanguageInfo& info) {
    json_object* o = json_object_new_object();
    json_object* langs = json_object_new_array();
    for (const auto& n : info.supported_languages) json_object_array_add(langs, new_string(n));
    json_object_object_add(o, "supported_languages", langs);
    json_object_object_add(o, "timeout", json_object_new_double(info.timeout_ms / 1000.0));
    json_object* details = json_object_new_object();
    for (const auto& d : info.details) {
        json_object* e = json_object_new_object();
        json_object_object_add(e, "extension", new_string(d.extension));
        json_object_object_add(e, "compiled", json_object_new_boolean(d.compiled));
        json_object_object_add(e, "interpreter", json_object_new_boolean(d.interpreted));
        json_object_object_add(details, d.id.c_str(), e);
    }
    json_object_object_add(o, "language_details", details);
    return o;
}

// --- Workflow report ---

json_object* workflow_state_to_json(const WorkflowState& st) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "request", new_string(st.request()));
    json_object_object_add(o, "phase", json_object_new_string(phase_name(st.phase)));
    json_object_object_add(o, "outcome", json_object_new_string(outcome_name(st.outcome)));
    json_object_object_add(o, "attempt_count", json_object_new_int(st.attempt_count));
    json_object_object_add(o, "max_attempts", json_object_new_int(st.max_attempts()));
    json_object_object_add(o, "execution_status", json_object_new_string(exec_status_name(st.result.status)));
    json_object_object_add(o, "code", new_string(st.result.code));
    json_object_object_add(o, "language", new_string(st.result.language));
    if (st.result.status == ExecStatus::SUCCESS) {
        json_object_object_add(o, "result", new_string(st.result.payload));
    } else if (st.result.status == ExecStatus::FAILURE) {
        json_object_object_add(o, "error_message", new_string(st.result.error_message));
        json_object_object_add(o, "error_kind", json_object_new_string(error_kind_name(st.result.error_kind)));
    }
    if (st.result.execution) {
        json_object_object_add(o, "execution", execution_result_to_json(*st.result.execution));
    }
    if (!st.fault.empty()) json_object_object_add(o, "fault", new_string(st.fault));

    json_object* log = json_object_new_array();
    for (const auto& e : st.log()) {
        json_object* le = json_object_new_object();
        json_object_object_add(le, "producer", new_string(e.producer));
        json_object_object_add(le, "text", new_string(e.text));
        json_object_array_add(log, le);
    }
    json_object_object_add(o, "log", log);
    return o;
}

} // namespace codeloop
