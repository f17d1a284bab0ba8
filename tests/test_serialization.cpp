#include "test_common.h"
#include "codeloop/json_mini.h"
#include "codeloop/serialization.h"

using namespace codeloop;

static void test_basic_peer_result() {
    // A peer that only speaks the five basic keys.
    json_mini::Doc d = json_mini::parse(
        "{\"success\":false,\"output\":\"\",\"error\":\"boom\",\"execution_time\":0.25,\"language\":\"python\"}");
    ExecutionResult r;
    expect_true(execution_result_from_json(d.root, &r), "decodes");
    expect_true(!r.succeeded, "failure");
    expect_eq_str(r.error, "boom", "error");
    expect_true(r.error_kind == ErrorKind::RUNTIME_FAILURE, "generic kind");
    expect_eq_ll(r.exit_code, -1, "unknown exit code");

    json_mini::Doc no_success = json_mini::parse("{\"output\":\"x\"}");
    expect_true(!execution_result_from_json(no_success.root, &r), "success key required");
}

static void test_result_keys() {
    ExecutionResult r;
    r.succeeded = false;
    r.error = "Execution timed out during run after 1.00s (limit 1.00s)";
    r.language = "python";
    r.error_kind = ErrorKind::TIMEOUT;
    r.timeout_phase = TimeoutPhase::RUN;
    const std::string s = json_take_string(execution_result_to_json(r));
    for (const char* key : {"\"success\"", "\"output\"", "\"error\"", "\"execution_time\"", "\"language\""}) {
        expect_true(contains(s, key), std::string("key ") + key);
    }
    expect_true(contains(s, "\"timeout_phase\":\"RUN\""), "phase named: " + s);

    json_mini::Doc back = json_mini::parse(s);
    ExecutionResult r2;
    expect_true(execution_result_from_json(back.root, &r2), "decodes own output");
    expect_true(r2.error_kind == ErrorKind::TIMEOUT && r2.timeout_phase == TimeoutPhase::RUN, "kind and phase kept");
}

static void test_batch_snippets() {
    json_mini::Doc d = json_mini::parse(
        "[{\"code\":\"print(1)\",\"language\":\"python\",\"input\":\"in\"},"
        "{\"code\":\"x\"},"
        "42]");
    std::vector<BatchSnippet> s = batch_snippets_from_json(d.root);
    expect_eq_ll((long long)s.size(), 3, "three snippets");
    expect_eq_str(s[0].stdin_data, "in", "input key");
    expect_true(s[0].invalid_reason.empty(), "valid");
    expect_eq_str(s[1].invalid_reason, "Invalid snippet format. Required keys: code, language", "missing language");
    expect_true(!s[2].invalid_reason.empty(), "non-object");

    BatchResult b;
    ExecutionResult ok;
    ok.succeeded = true;
    b.results.emplace_back("snippet_0", ok);
    b.total = 1;
    b.successful = 1;
    const std::string js = json_take_string(batch_result_to_json(b));
    expect_true(contains(js, "\"snippet_0\""), "keyed results");
    expect_true(contains(js, "\"summary\""), "summary");
}

static void test_workflow_report() {
    WorkflowState st("task", 2);
    st.phase = Phase::DONE;
    st.outcome = Outcome::EXHAUSTED;
    st.attempt_count = 2;
    st.result.status = ExecStatus::FAILURE;
    st.result.error_message = "err";
    st.append_log("Evaluator", "Maximum retries (2) reached. Ending workflow.");
    const std::string js = json_take_string(workflow_state_to_json(st));
    expect_true(contains(js, "\"outcome\":\"exhausted\""), "outcome: " + js);
    expect_true(contains(js, "\"attempt_count\":2"), "attempt count");
    expect_true(contains(js, "Maximum retries (2) reached"), "log carried");
    expect_true(!contains(js, "\"execution\""), "no sandbox result, no execution object");

    ExecutionResult r;
    r.error = "NameError";
    r.language = "python";
    r.exit_code = 1;
    r.error_kind = ErrorKind::RUNTIME_FAILURE;
    st.result.execution = r;
    const std::string with = json_take_string(workflow_state_to_json(st));
    json_mini::Doc d = json_mini::parse(with);
    json_object* ex = nullptr;
    expect_true(d && json_object_object_get_ex(d.root, "execution", &ex), "execution object: " + with);
    ExecutionResult back;
    expect_true(execution_result_from_json(ex, &back), "execution decodes");
    expect_eq_ll(back.exit_code, 1, "exit code carried");
    expect_true(back.error_kind == ErrorKind::RUNTIME_FAILURE, "kind carried");
}

int main() {
    test_basic_peer_result();
    test_result_keys();
    test_batch_snippets();
    test_workflow_report();

    std::cerr << "test_serialization: ALL PASSED" << std::endl;
    return 0;
}
