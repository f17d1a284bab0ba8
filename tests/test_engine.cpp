#include "test_common.h"
#include "codeloop/engine.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace codeloop;

// Scripted generator: replies in order, the last reply repeats.
class FakeGenerator : public ITextGenerator {
public:
    explicit FakeGenerator(std::vector<GenerationResult> replies) : replies_(std::move(replies)) {}

    GenerationResult generate(const GenerationRequest& req, int, const std::atomic<bool>*) override {
        std::lock_guard<std::mutex> lk(mu_);
        requests.push_back(req);
        size_t i = std::min(calls_++, replies_.size() - 1);
        return replies_[i];
    }

    std::vector<GenerationRequest> requests;

private:
    std::mutex mu_;
    std::vector<GenerationResult> replies_;
    size_t calls_{0};
};

class FakeChannel : public IExecutionChannel {
public:
    explicit FakeChannel(std::vector<ChannelReply> replies) : replies_(std::move(replies)) {}

    const char* name() const override { return "fake"; }
    ChannelReply execute(const std::string& code, const std::string&, const std::string&, int,
                         const std::atomic<bool>*) override {
        std::lock_guard<std::mutex> lk(mu_);
        codes.push_back(code);
        size_t i = std::min(calls_++, replies_.size() - 1);
        return replies_[i];
    }

    size_t calls() {
        std::lock_guard<std::mutex> lk(mu_);
        return calls_;
    }

    std::vector<std::string> codes;

private:
    std::mutex mu_;
    std::vector<ChannelReply> replies_;
    size_t calls_{0};
};

static GenerationResult gen_ok(const std::string& text) {
    GenerationResult g;
    g.ok = true;
    g.text = text;
    return g;
}

static GenerationResult gen_fail(const std::string& err) {
    GenerationResult g;
    g.error = err;
    return g;
}

static ChannelReply exec_reply(bool ok, const std::string& out, const std::string& err) {
    ChannelReply r;
    r.available = true;
    r.structured = true;
    r.result.succeeded = ok;
    r.result.stdout_data = out;
    r.result.error = err;
    r.result.language = "python";
    r.result.error_kind = ok ? ErrorKind::NONE : ErrorKind::RUNTIME_FAILURE;
    return r;
}

static ChannelReply unavailable() {
    ChannelReply r;
    r.available = false;
    r.error = "refused";
    return r;
}

static EngineConfig quick_config(int max_attempts) {
    EngineConfig c;
    c.max_attempts = max_attempts;
    c.request_timeout_ms = 1000;
    c.backoff_base_ms = 0;
    return c;
}

static void test_termination_exact() {
    for (int n = 1; n <= 5; n++) {
        FakeGenerator gen({gen_ok("```python\nprint(1/0)\n```")});
        FakeChannel ch({exec_reply(false, "", "ZeroDivisionError")});
        WorkflowEngine eng(quick_config(n), gen, ch);
        WorkflowState st = eng.run("divide");
        expect_true(st.phase == Phase::DONE, "done");
        expect_true(st.outcome == Outcome::EXHAUSTED, "exhausted");
        expect_eq_ll(st.attempt_count, n, "exactly N failed attempts");
        expect_eq_ll((long long)ch.calls(), n, "N executions, never N+1");
        expect_eq_ll((long long)gen.requests.size(), n, "N generations");
        expect_eq_str(st.result.error_message, "ZeroDivisionError", "last error kept");
        expect_eq_str(st.result.code, "print(1/0)\n", "last code kept");
    }
}

static void test_success_shortcut() {
    FakeGenerator gen({gen_ok("```python\nprint(42)\n```")});
    FakeChannel ch({exec_reply(true, "42\n", "")});
    WorkflowEngine eng(quick_config(4), gen, ch);

    std::vector<std::pair<Phase, Phase>> seen;
    RunContext ctx;
    ctx.on_transition = [&](const WorkflowState&, Phase from, Phase to) { seen.emplace_back(from, to); };
    WorkflowState st = eng.run("answer", ctx);

    expect_true(st.outcome == Outcome::SATISFIED, "satisfied");
    expect_eq_ll(st.attempt_count, 0, "count unincremented");
    expect_true(st.result.status == ExecStatus::SUCCESS, "success status");
    expect_eq_str(st.result.payload, "42\n", "payload");
    expect_true(st.result.error_message.empty(), "error cleared");
    expect_eq_ll((long long)seen.size(), 3, "one cycle");
    expect_true(seen[0] == std::make_pair(Phase::GENERATE, Phase::EXECUTE), "generate -> execute");
    expect_true(seen[1] == std::make_pair(Phase::EXECUTE, Phase::EVALUATE), "execute -> evaluate");
    expect_true(seen[2] == std::make_pair(Phase::EVALUATE, Phase::DONE), "evaluate -> done");
    expect_eq_ll((long long)st.log().size(), 3, "one log line per agent");
    expect_eq_str(st.log()[0].producer, "CodeGenerator", "producer");
}

static void test_retry_carries_feedback() {
    FakeGenerator gen({gen_ok("```python\nbad\n```"), gen_ok("```python\nprint('ok')\n```")});
    FakeChannel ch({exec_reply(false, "", "NameError: bad"), exec_reply(true, "ok\n", "")});
    WorkflowEngine eng(quick_config(4), gen, ch);
    WorkflowState st = eng.run("print ok");

    expect_true(st.outcome == Outcome::SATISFIED, "second attempt satisfies");
    expect_eq_ll(st.attempt_count, 1, "one failure counted");
    expect_eq_ll((long long)gen.requests.size(), 2, "two generations");
    expect_eq_str(gen.requests[0].prior_error, "None", "no feedback first");
    expect_eq_str(gen.requests[1].prior_error, "NameError: bad", "error fed back");
    expect_eq_str(gen.requests[1].prior_code, "bad\n", "code fed back");
    expect_eq_str(gen.requests[1].prior_status, "failure", "status fed back");
}

static void test_generation_failure_counts() {
    FakeGenerator gen({gen_fail("service down")});
    FakeChannel ch({exec_reply(true, "", "")});
    WorkflowEngine eng(quick_config(2), gen, ch);

    std::vector<std::pair<Phase, Phase>> seen;
    RunContext ctx;
    ctx.on_transition = [&](const WorkflowState&, Phase from, Phase to) { seen.emplace_back(from, to); };
    WorkflowState st = eng.run("x", ctx);

    expect_true(st.outcome == Outcome::EXHAUSTED, "exhausted");
    expect_eq_ll(st.attempt_count, 2, "each generation failure is an attempt");
    expect_eq_ll((long long)ch.calls(), 0, "never executed");
    expect_true(seen[0] == std::make_pair(Phase::GENERATE, Phase::EVALUATE), "generate -> evaluate");
    expect_eq_str(st.result.error_message, "Code generation error: service down", "message");
    expect_true(st.result.error_kind == ErrorKind::SERVICE_UNAVAILABLE, "kind");
}

static void test_channel_unavailable() {
    FakeGenerator gen({gen_ok("print(1)")});
    FakeChannel ch({unavailable()});
    WorkflowEngine eng(quick_config(3), gen, ch);
    WorkflowState st = eng.run("x");
    expect_true(st.outcome == Outcome::EXHAUSTED, "exhausted");
    expect_eq_str(st.result.error_message, "Could not connect to code execution server", "message");
    expect_eq_ll(st.attempt_count, 3, "counted");
}

static void test_free_text_classified() {
    ChannelReply fail;
    fail.available = true;
    fail.free_text = "Traceback (most recent call last): boom";
    fail.classified = classify(fail.free_text);
    ChannelReply pass;
    pass.available = true;
    pass.free_text = "Status: success";
    pass.classified = classify(pass.free_text);

    FakeGenerator gen({gen_ok("print(1)")});
    FakeChannel ch({fail, pass});
    WorkflowEngine eng(quick_config(4), gen, ch);
    WorkflowState st = eng.run("x");
    expect_true(st.outcome == Outcome::SATISFIED, "second reply satisfies");
    expect_eq_ll(st.attempt_count, 1, "traceback counted as failure");
    expect_eq_str(st.result.payload, "Status: success", "payload is the text");
}

static void test_language_default_and_override() {
    FakeGenerator gen({gen_ok("no fences here")});
    FakeChannel ch({exec_reply(true, "", "")});
    EngineConfig cfg = quick_config(1);
    cfg.default_language = "javascript";
    WorkflowEngine eng(cfg, gen, ch);

    WorkflowState a = eng.run("x");
    expect_eq_str(a.result.language, "javascript", "engine default");
    expect_eq_str(a.result.code, "no fences here", "whole text is code");

    RunContext ctx;
    ctx.language = "c++";
    WorkflowState b = eng.run("x", ctx);
    expect_eq_str(b.result.language, "cpp", "request override normalized");
}

static void test_observer_fault_aborts() {
    FakeGenerator gen({gen_ok("print(1)")});
    FakeChannel ch({exec_reply(false, "", "err")});
    WorkflowEngine eng(quick_config(4), gen, ch);
    RunContext ctx;
    ctx.on_transition = [](const WorkflowState&, Phase from, Phase) {
        if (from == Phase::EXECUTE) throw std::runtime_error("observer exploded");
    };
    WorkflowState st = eng.run("x", ctx);
    expect_true(st.outcome == Outcome::ABORTED, "aborted");
    expect_eq_str(st.fault, "observer exploded", "fault kept");
    expect_eq_str(st.result.code, "print(1)", "partial state returned");
}

static void test_cancellation() {
    std::atomic<bool> cancel{false};
    FakeGenerator gen({gen_ok("print(1)")});
    FakeChannel ch({exec_reply(false, "", "err")});
    EngineConfig cfg = quick_config(50);
    cfg.backoff_base_ms = 10000;      // the run would sit in backoff without cancellation
    WorkflowEngine eng(cfg, gen, ch);

    RunContext ctx;
    ctx.cancel = &cancel;
    std::thread t([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.store(true);
    });
    auto t0 = std::chrono::steady_clock::now();
    WorkflowState st = eng.run("x", ctx);
    t.join();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
    expect_true(st.outcome == Outcome::CANCELLED, "cancelled");
    expect_true(st.phase == Phase::DONE, "terminal");
    expect_true(ms < 5000, "backoff interrupted");
}

static void test_execution_tracks_latest_attempt() {
    // a sandbox result from an earlier attempt never survives a later one
    {
        FakeGenerator gen({gen_ok("print(1)")});
        FakeChannel ch({exec_reply(false, "", "NameError"), unavailable()});
        WorkflowEngine eng(quick_config(2), gen, ch);
        WorkflowState st = eng.run("t");
        expect_eq_ll(st.attempt_count, 2, "two attempts");
        expect_true(!st.result.execution.has_value(), "unavailable attempt has no sandbox result");
    }
    {
        FakeGenerator gen({gen_ok("print(1)"), gen_fail("down")});
        FakeChannel ch({exec_reply(false, "", "NameError")});
        WorkflowEngine eng(quick_config(2), gen, ch);
        WorkflowState st = eng.run("t");
        expect_eq_ll((long long)ch.calls(), 1, "second attempt never executed");
        expect_true(!st.result.execution.has_value(), "generation failure clears sandbox result");
    }
    {
        FakeGenerator gen({gen_ok("print(42)")});
        FakeChannel ch({exec_reply(false, "", "NameError"), exec_reply(true, "42\n", "")});
        WorkflowEngine eng(quick_config(3), gen, ch);
        WorkflowState st = eng.run("t");
        expect_true(st.result.execution.has_value(), "structured reply kept");
        expect_true(st.result.execution->succeeded, "latest attempt's result");
        expect_eq_str(st.result.execution->stdout_data, "42\n", "latest output");
    }
}

static void test_transition_table() {
    expect_true(WorkflowEngine::transition_allowed(Phase::GENERATE, Phase::EXECUTE), "g->x");
    expect_true(WorkflowEngine::transition_allowed(Phase::GENERATE, Phase::EVALUATE), "g->v");
    expect_true(!WorkflowEngine::transition_allowed(Phase::GENERATE, Phase::DONE), "g->d");
    expect_true(!WorkflowEngine::transition_allowed(Phase::EXECUTE, Phase::GENERATE), "x->g");
    expect_true(WorkflowEngine::transition_allowed(Phase::EVALUATE, Phase::DONE), "v->d");
    expect_true(!WorkflowEngine::transition_allowed(Phase::DONE, Phase::GENERATE), "done is terminal");
}

static void test_concurrent_runs() {
    FakeGenerator gen({gen_ok("print(1)")});
    FakeChannel ch({exec_reply(false, "", "e"), exec_reply(true, "x", "")});
    WorkflowEngine eng(quick_config(3), gen, ch);
    std::vector<WorkflowState> results(4, WorkflowState("", 1));
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; i++) {
        threads.emplace_back([&, i] { results[i] = eng.run("task " + std::to_string(i)); });
    }
    for (auto& t : threads) t.join();
    for (int i = 0; i < 4; i++) {
        expect_eq_str(results[i].request(), "task " + std::to_string(i), "own state per run");
        expect_true(results[i].phase == Phase::DONE, "each run finished");
    }
}

int main() {
    test_termination_exact();
    test_success_shortcut();
    test_retry_carries_feedback();
    test_generation_failure_counts();
    test_channel_unavailable();
    test_free_text_classified();
    test_language_default_and_override();
    test_observer_fault_aborts();
    test_cancellation();
    test_execution_tracks_latest_attempt();
    test_transition_table();
    test_concurrent_runs();

    std::cerr << "test_engine: ALL PASSED" << std::endl;
    return 0;
}
