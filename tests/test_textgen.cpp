#include "test_common.h"
#include "codeloop/textgen.h"
#include "codeloop/scratch.h"

#include <chrono>
#include <fstream>

using namespace codeloop;

static void test_extract() {
    ExtractedCode a = extract_code_block("Here you go:\n```python\nprint(1)\n```\nThanks", "java");
    expect_true(a.fenced, "fenced");
    expect_eq_str(a.code, "print(1)\n", "fenced body");
    expect_eq_str(a.language, "python", "tag wins");

    ExtractedCode b = extract_code_block("```\nint main(){}\n```", "c++");
    expect_eq_str(b.language, "cpp", "default normalized when untagged");
    expect_eq_str(b.code, "int main(){}\n", "untagged body");

    ExtractedCode c = extract_code_block("  print(2)  \n", "python");
    expect_true(!c.fenced, "unfenced");
    expect_eq_str(c.code, "print(2)", "whole text trimmed");

    ExtractedCode d = extract_code_block("```rust\nfn main(){}\n```", "python");
    expect_eq_str(d.language, "python", "unsupported tag ignored");

    ExtractedCode e = extract_code_block("```js\nconsole.log(1)\n```\n```python\nprint(1)\n```", "python");
    expect_eq_str(e.code, "console.log(1)\n", "first block only");
}

static void test_request_building() {
    WorkflowState st("sum two numbers", 3);
    GenerationRequest first = build_generation_request(st, "python");
    expect_eq_str(first.task, "sum two numbers", "task");
    expect_eq_str(first.prior_code, "None", "no prior code");
    expect_eq_str(first.prior_status, "None", "no prior status");
    expect_true(!first.system.empty(), "system instructions");

    st.result.code = "print(a+b)";
    st.result.status = ExecStatus::FAILURE;
    st.result.error_message = "NameError";
    GenerationRequest second = build_generation_request(st, "python");
    expect_eq_str(second.prior_code, "print(a+b)", "prior code");
    expect_eq_str(second.prior_status, "failure", "prior status");
    expect_eq_str(second.prior_error, "NameError", "prior error");

    const std::string js = generation_request_to_json(second);
    expect_true(contains(js, "\"prior_error\""), "json carries feedback");
}

static TextGenConfig sh_config(const std::string& script) {
    TextGenConfig c;
    c.cmd = "sh -c '" + script + "'";
    c.timeout_ms = 5000;
    c.retries = 2;
    c.backoff_base_ms = 1;
    c.backoff_max_ms = 5;
    return c;
}

static void test_process_generator(const std::string& dir) {
    if (!have_tool("sh", "process generator")) return;
    GenerationRequest req;
    req.task = "t";

    ProcessTextGenerator json_reply(sh_config("cat >/dev/null; echo \"{\\\"content\\\":\\\"hello\\\"}\""));
    GenerationResult a = json_reply.generate(req, 0, nullptr);
    expect_true(a.ok, "content reply: " + a.error);
    expect_eq_str(a.text, "hello", "content decoded");

    ProcessTextGenerator raw(sh_config("cat >/dev/null; printf \"just text\""));
    GenerationResult b = raw.generate(req, 0, nullptr);
    expect_eq_str(b.text, "just text", "raw text accepted");

    ProcessTextGenerator err(sh_config("cat >/dev/null; echo \"{\\\"error\\\":\\\"quota\\\"}\""));
    GenerationResult c = err.generate(req, 0, nullptr);
    expect_true(!c.ok && contains(c.error, "quota"), "error reply");

    ProcessTextGenerator empty(sh_config("cat >/dev/null"));
    GenerationResult d = empty.generate(req, 0, nullptr);
    expect_true(!d.ok && contains(d.error, "empty"), "empty reply rejected");

    // fails twice, then answers: the counter file lives in the scratch dir
    const std::string counter = dir + "/count";
    ProcessTextGenerator flaky(sh_config(
        "cat >/dev/null; echo x >> " + counter + "; n=$(wc -l < " + counter + "); "
        "if [ $n -lt 3 ]; then exit 1; fi; echo ok"));
    GenerationResult e = flaky.generate(req, 0, nullptr);
    expect_true(e.ok, "retried to success: " + e.error);
    expect_eq_str(e.text, "ok", "third reply");

    ProcessTextGenerator dead(sh_config("cat >/dev/null; echo down >&2; exit 3"));
    GenerationResult f = dead.generate(req, 0, nullptr);
    expect_true(!f.ok && contains(f.error, "exited with code 3"), "retries exhausted: " + f.error);

    ProcessTextGenerator slow(sh_config("sleep 10"));
    auto t0 = std::chrono::steady_clock::now();
    GenerationResult g = slow.generate(req, 300, nullptr);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
    expect_true(!g.ok && g.timed_out, "caller timeout applies");
    expect_true(ms < 3000, "timeout not retried");

    // failing retries share one budget instead of each getting the full bound
    TextGenConfig retry_cfg = sh_config("cat >/dev/null; sleep 0.4; exit 1");
    retry_cfg.retries = 3;
    ProcessTextGenerator failing_slowly(retry_cfg);
    t0 = std::chrono::steady_clock::now();
    GenerationResult h = failing_slowly.generate(req, 700, nullptr);
    ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
    expect_true(!h.ok, "no reply");
    expect_true(h.timed_out, "budget spent across retries: " + h.error);
    expect_true(ms < 1500, "retries bounded by the request budget (" + std::to_string(ms) + " ms)");
}

static void test_unconfigured() {
    ProcessTextGenerator gen(TextGenConfig{});
    GenerationResult r = gen.generate(GenerationRequest{}, 0, nullptr);
    expect_true(!r.ok && contains(r.error, "CODELOOP_LLM_CMD"), "empty command reported");
}

int main() {
    test_extract();
    test_request_building();
    test_unconfigured();

    std::string err;
    ScratchDir dir;
    expect_true(dir.create("", "codeloop_textgen_test_", &err), "scratch: " + err);
    test_process_generator(dir.path().string());

    std::cerr << "test_textgen: ALL PASSED" << std::endl;
    return 0;
}
