#include "test_common.h"
#include "codeloop/channel.h"
#include "codeloop/engine.h"
#include "codeloop/scratch.h"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <thread>

using namespace codeloop;

static std::shared_ptr<ToolConnection> fixed_catalog() {
    return std::make_shared<ToolConnection>([](ToolCatalog* out, std::string*) {
        out->server = "script";
        out->tools = {"execute_code"};
        return true;
    }, 1, 0, 0);
}

static void test_execd_channel(const std::string& execd) {
    ToolChannelConfig cfg;
    cfg.cmd = execd;
    auto conn = std::make_shared<ToolConnection>(make_process_negotiator(execd, 10000), 3, 0, 0);
    ToolExecutionChannel ch(cfg, conn);
    expect_eq_str(ch.name(), "tool", "channel name");

    ChannelReply r = ch.execute("x", "cobol", "", 30000, nullptr);
    expect_true(r.available && r.structured, "structured reply");
    expect_true(r.result.error_kind == ErrorKind::UNSUPPORTED_LANGUAGE, "kind travels over the wire");
    expect_true(conn->state() == ConnectionState::READY, "negotiated on first call");

    if (!have_tool("python3", "tool channel python")) return;
    ChannelReply ok = ch.execute("print(input())", "python", "echo me", 30000, nullptr);
    expect_true(ok.structured && ok.result.succeeded, "python via service: " + ok.result.error);
    expect_eq_str(ok.result.stdout_data, "echo me\n", "stdin forwarded as input_data");
    expect_eq_ll(conn->negotiation_count(), 1, "negotiated once");

    ChannelReply slow = ch.execute("import time\ntime.sleep(30)", "python", "", 500, nullptr);
    expect_true(slow.structured && slow.result.error_kind == ErrorKind::TIMEOUT, "request timeout");
    expect_true(slow.result.timeout_phase == TimeoutPhase::WORKFLOW, "workflow phase");
    expect_true(contains(slow.result.error, "timed out"), "timeout message: " + slow.result.error);
}

// A live process is one with a /proc entry that is not a zombie.
static bool process_alive(long pid) {
    std::ifstream f("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (!f || !std::getline(f, line)) return false;
    size_t rp = line.rfind(')');
    if (rp == std::string::npos || rp + 2 >= line.size()) return false;
    const char state = line[rp + 2];
    return state != 'Z' && state != 'X';
}

static long read_pid_file(const std::filesystem::path& p) {
    std::ifstream f(p);
    long pid = 0;
    if (f >> pid) return pid;
    return 0;
}

static bool gone_within(long pid, int ms) {
    auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (std::chrono::steady_clock::now() < until) {
        if (!process_alive(pid)) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return !process_alive(pid);
}

// Python program that forks a long sleep, records its pid, then blocks.
static std::string forking_program(const std::filesystem::path& pid_file) {
    return "import subprocess, time\n"
           "p = subprocess.Popen(['sleep', '61.37'])\n"
           "with open('" + pid_file.string() + "', 'w') as f:\n"
           "    f.write(str(p.pid))\n"
           "time.sleep(30)\n";
}

static void test_forked_children_reaped(const std::string& execd) {
    if (!have_tool("python3", "forked child teardown")) return;
    if (!have_tool("sleep", "forked child teardown")) return;
    ScratchDir dir;
    std::string err;
    if (!dir.create("", "codeloop_test_", &err)) die("scratch: " + err);

    ToolChannelConfig cfg;
    cfg.cmd = execd;
    auto conn = std::make_shared<ToolConnection>(make_process_negotiator(execd, 10000), 3, 0, 0);
    ToolExecutionChannel ch(cfg, conn);

    // request deadline forwarded to the service
    const auto timed_pid_file = dir.path() / "timed.pid";
    ChannelReply t = ch.execute(forking_program(timed_pid_file), "python", "", 3000, nullptr);
    expect_true(t.structured && t.result.error_kind == ErrorKind::TIMEOUT, "deadline reply: " + t.result.error);
    const long timed_pid = read_pid_file(timed_pid_file);
    expect_true(timed_pid > 0, "grandchild started before the deadline");
    expect_true(gone_within(timed_pid, 2000), "grandchild killed at the deadline");

    // cancellation stops the service, which kills the program's group
    const auto cancel_pid_file = dir.path() / "cancel.pid";
    std::atomic<bool> cancel{false};
    std::thread canceller([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(3000));
        cancel.store(true);
    });
    const auto t0 = std::chrono::steady_clock::now();
    ChannelReply c = ch.execute(forking_program(cancel_pid_file), "python", "", 60000, &cancel);
    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    canceller.join();
    expect_true(c.result.error_kind == ErrorKind::CANCELLED, "cancelled reply: " + c.result.error);
    expect_true(waited < 10000, "cancel returns promptly");
    const long cancel_pid = read_pid_file(cancel_pid_file);
    expect_true(cancel_pid > 0, "grandchild started before cancel");
    expect_true(gone_within(cancel_pid, 2000), "grandchild killed on cancel");
}

static void test_unreachable_service() {
    auto conn = std::make_shared<ToolConnection>(make_process_negotiator("/nonexistent/codeloop_execd", 1000), 2, 0, 0);
    ToolChannelConfig cfg;
    cfg.cmd = "/nonexistent/codeloop_execd";
    ToolExecutionChannel ch(cfg, conn);

    ChannelReply r = ch.execute("print(1)", "python", "", 1000, nullptr);
    expect_true(!r.available, "unavailable");
    expect_true(conn->state() == ConnectionState::PERMANENTLY_FAILED, "sticky failure");
    ChannelReply again = ch.execute("print(1)", "python", "", 1000, nullptr);
    expect_true(!again.available, "still unavailable");
    expect_eq_ll(conn->negotiation_count(), 2, "no renegotiation after failure");

    // through the workflow: every attempt fails with the connection message
    struct OneShot : ITextGenerator {
        GenerationResult generate(const GenerationRequest&, int, const std::atomic<bool>*) override {
            GenerationResult g;
            g.ok = true;
            g.text = "print(1)";
            return g;
        }
    } gen;
    EngineConfig ec;
    ec.max_attempts = 2;
    WorkflowEngine eng(ec, gen, ch);
    WorkflowState st = eng.run("x");
    expect_true(st.outcome == Outcome::EXHAUSTED, "exhausted");
    expect_eq_str(st.result.error_message, "Could not connect to code execution server", "message");
}

static void test_free_text_reply() {
    if (!have_tool("sh", "free text service")) return;
    ToolChannelConfig cfg;
    cfg.cmd = "sh -c 'cat >/dev/null; echo Traceback: boom' --";
    ToolExecutionChannel failing(cfg, fixed_catalog());
    ChannelReply f = failing.execute("print(1)", "python", "", 5000, nullptr);
    expect_true(f.available && !f.structured, "free text");
    expect_true(!f.classified.succeeded, "traceback is failure");
    expect_true(f.classified.verdict == Verdict::MATCHED_FAILURE, "failure verdict");

    cfg.cmd = "sh -c 'cat >/dev/null; echo Program completed successfully' --";
    ToolExecutionChannel passing(cfg, fixed_catalog());
    ChannelReply p = passing.execute("print(1)", "python", "", 5000, nullptr);
    expect_true(p.classified.succeeded, "success phrase");

    cfg.cmd = "sh -c 'cat >/dev/null; echo \"{\\\"error\\\":\\\"quota exceeded\\\"}\"' --";
    ToolExecutionChannel erroring(cfg, fixed_catalog());
    ChannelReply e = erroring.execute("print(1)", "python", "", 5000, nullptr);
    expect_true(e.structured && e.result.error_kind == ErrorKind::INTERNAL, "error object");
    expect_eq_str(e.result.error, "quota exceeded", "error text");

    cfg.cmd = "sh -c 'cat >/dev/null; exit 9' --";
    ToolExecutionChannel silent(cfg, fixed_catalog());
    ChannelReply s = silent.execute("print(1)", "python", "", 5000, nullptr);
    expect_true(!s.available, "no reply is unavailable");
}

int main(int argc, char** argv) {
    if (argc < 2) die("usage: test_tool_channel <path to codeloop_execd>");

    test_execd_channel(argv[1]);
    test_forked_children_reaped(argv[1]);
    test_unreachable_service();
    test_free_text_reply();

    std::cerr << "test_tool_channel: ALL PASSED" << std::endl;
    return 0;
}
