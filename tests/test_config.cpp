#include "test_common.h"
#include "codeloop/config.h"
#include <cstdlib>

static std::string env_or_empty(const char* k) {
    const char* v = std::getenv(k);
    return v ? v : "";
}

int main() {
    // Default profile is DEV
    unsetenv("CODELOOP_PROFILE");
    auto p = codeloop::detect_profile();
    expect_true(p == codeloop::Profile::DEV, "default should be DEV");

    setenv("CODELOOP_PROFILE", "PROD", 1);
    p = codeloop::detect_profile();
    expect_true(p == codeloop::Profile::PROD, "should detect PROD case-insensitive");

    // Pre-existing values win over profile defaults
    setenv("CODELOOP_MAX_ATTEMPTS", "7", 1);
    unsetenv("CODELOOP_SANDBOX_TIMEOUT_MS");
    unsetenv("CODELOOP_RETRY_BACKOFF_BASE_MS");
    codeloop::apply_profile_defaults(codeloop::Profile::PROD);
    expect_eq_str(env_or_empty("CODELOOP_MAX_ATTEMPTS"), "7", "should NOT override pre-existing env var");
    expect_eq_str(env_or_empty("CODELOOP_SANDBOX_TIMEOUT_MS"), "10000", "PROD sandbox timeout");
    expect_eq_str(env_or_empty("CODELOOP_RETRY_BACKOFF_BASE_MS"), "500", "PROD backoff");

    expect_eq_str(codeloop::profile_name(codeloop::Profile::DEV), "dev", "dev name");
    expect_eq_str(codeloop::profile_name(codeloop::Profile::PROD), "prod", "prod name");

    // Typed loaders
    codeloop::EngineConfig ec = codeloop::load_engine_config();
    expect_eq_ll(ec.max_attempts, 7, "max attempts from env");
    expect_eq_ll(ec.backoff_base_ms, 500, "backoff from env");

    setenv("CODELOOP_MAX_ATTEMPTS", "0", 1);
    expect_eq_ll(codeloop::load_engine_config().max_attempts, 1, "attempts clamped to 1");
    setenv("CODELOOP_MAX_ATTEMPTS", "lots", 1);
    expect_eq_ll(codeloop::load_engine_config().max_attempts, 4, "unparsable falls back to default");

    setenv("CODELOOP_SANDBOX_TIMEOUT_MS", "2500", 1);
    unsetenv("CODELOOP_COMPILE_TIMEOUT_MS");
    setenv("CODELOOP_CXX", "clang++", 1);
    setenv("CODELOOP_NO_NEW_PRIVS", "off", 1);
    codeloop::SandboxConfig sc = codeloop::load_sandbox_config();
    expect_eq_ll(sc.run_timeout_ms, 2500, "run timeout");
    expect_eq_ll(sc.compile_timeout_ms, 2500, "compile timeout follows run timeout");
    expect_eq_str(sc.tool_overrides["g++"], "clang++", "compiler override");
    expect_true(!sc.no_new_privs, "no_new_privs off");

    setenv("CODELOOP_LLM_CMD", "my-driver --model x", 1);
    setenv("CODELOOP_LLM_RETRIES", "-3", 1);
    codeloop::TextGenConfig tc = codeloop::load_textgen_config();
    expect_eq_str(tc.cmd, "my-driver --model x", "driver command");
    expect_eq_ll(tc.retries, 0, "retries clamped");

    codeloop::ExecMode m = codeloop::ExecMode::DIRECT;
    expect_true(codeloop::parse_exec_mode("Tool", &m) && m == codeloop::ExecMode::TOOL, "tool mode");
    expect_true(!codeloop::parse_exec_mode("socket", &m), "unknown mode rejected");

    setenv("CODELOOP_EXEC_MODE", "tool", 1);
    setenv("CODELOOP_EXEC_CMD", "/opt/codeloop/bin/codeloop_execd", 1);
    setenv("CODELOOP_EXEC_CONNECT_ATTEMPTS", "5", 1);
    codeloop::ChannelSettings cs = codeloop::load_channel_settings();
    expect_true(cs.mode == codeloop::ExecMode::TOOL, "exec mode");
    expect_eq_str(cs.tool.cmd, "/opt/codeloop/bin/codeloop_execd", "exec command");
    expect_eq_ll(cs.connect_attempts, 5, "connect attempts");

    expect_true(codeloop::env_true("CODELOOP_UNSET_FLAG", true), "env_true default");
    expect_eq_ll(codeloop::getenv_int("CODELOOP_UNSET_INT", 11), 11, "getenv_int default");

    const char* vars[] = {"CODELOOP_PROFILE", "CODELOOP_MAX_ATTEMPTS", "CODELOOP_SANDBOX_TIMEOUT_MS",
                          "CODELOOP_RETRY_BACKOFF_BASE_MS", "CODELOOP_CXX", "CODELOOP_NO_NEW_PRIVS",
                          "CODELOOP_LLM_CMD", "CODELOOP_LLM_RETRIES", "CODELOOP_EXEC_MODE",
                          "CODELOOP_EXEC_CMD", "CODELOOP_EXEC_CONNECT_ATTEMPTS"};
    for (const char* v : vars) unsetenv(v);

    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
