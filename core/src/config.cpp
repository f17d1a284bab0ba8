#include "codeloop/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace codeloop {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

} // namespace

Profile detect_profile() {
    const char* env = std::getenv("CODELOOP_PROFILE");
    if (!env) return Profile::DEV;
    const std::string val = lower(env);
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("CODELOOP_SANDBOX_TIMEOUT_MS",    "15000",  NO_OVERWRITE);
            setenv("CODELOOP_REQUEST_TIMEOUT_MS",    "60000",  NO_OVERWRITE);
            setenv("CODELOOP_MAX_ATTEMPTS",          "4",      NO_OVERWRITE);
            setenv("CODELOOP_RETRY_BACKOFF_BASE_MS", "0",      NO_OVERWRITE);
            setenv("CODELOOP_NO_NEW_PRIVS",          "1",      NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("CODELOOP_SANDBOX_TIMEOUT_MS",    "10000",  NO_OVERWRITE);
            setenv("CODELOOP_REQUEST_TIMEOUT_MS",    "45000",  NO_OVERWRITE);
            setenv("CODELOOP_MAX_ATTEMPTS",          "3",      NO_OVERWRITE);
            setenv("CODELOOP_RETRY_BACKOFF_BASE_MS", "500",    NO_OVERWRITE);
            setenv("CODELOOP_NO_NEW_PRIVS",          "1",      NO_OVERWRITE);
            setenv("CODELOOP_STDOUT_MAX",            "65536",  NO_OVERWRITE);
            break;
    }
}

int getenv_int(const char* k, int defv) {
    if (const char* e = std::getenv(k)) {
        try {
            return std::stoi(e);
        } catch (const std::exception&) {
            return defv;
        }
    }
    return defv;
}

int64_t getenv_i64(const char* k, int64_t defv) {
    if (const char* e = std::getenv(k)) {
        try {
            return std::stoll(e);
        } catch (const std::exception&) {
            return defv;
        }
    }
    return defv;
}

std::string getenv_str(const char* k, const std::string& defv) {
    const char* e = std::getenv(k);
    return (e && *e) ? std::string(e) : defv;
}

bool env_true(const char* k, bool defv) {
    const char* e = std::getenv(k);
    if (!e) return defv;
    const std::string v = lower(e);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    return defv;
}

SandboxConfig load_sandbox_config() {
    SandboxConfig c;
    c.run_timeout_ms = getenv_int("CODELOOP_SANDBOX_TIMEOUT_MS", c.run_timeout_ms);
    c.compile_timeout_ms = getenv_int("CODELOOP_COMPILE_TIMEOUT_MS", c.run_timeout_ms);
    c.output_max_bytes = (size_t)std::max<int64_t>(1024, getenv_i64("CODELOOP_STDOUT_MAX", (int64_t)c.output_max_bytes));
    c.scratch_root = getenv_str("CODELOOP_SCRATCH_ROOT", "");
    c.no_new_privs = env_true("CODELOOP_NO_NEW_PRIVS", true);

    const struct { const char* env; const char* tool; } overrides[] = {
        {"CODELOOP_PYTHON_BIN", "python3"},
        {"CODELOOP_NODE_BIN", "node"},
        {"CODELOOP_JAVA_BIN", "java"},
        {"CODELOOP_JAVAC_BIN", "javac"},
        {"CODELOOP_CXX", "g++"},
    };
    for (const auto& o : overrides) {
        std::string v = getenv_str(o.env, "");
        if (!v.empty()) c.tool_overrides[o.tool] = v;
    }
    return c;
}

EngineConfig load_engine_config() {
    EngineConfig c;
    c.max_attempts = std::max(1, getenv_int("CODELOOP_MAX_ATTEMPTS", c.max_attempts));
    c.request_timeout_ms = getenv_int("CODELOOP_REQUEST_TIMEOUT_MS", c.request_timeout_ms);
    c.default_language = getenv_str("CODELOOP_DEFAULT_LANGUAGE", c.default_language);
    c.backoff_base_ms = getenv_i64("CODELOOP_RETRY_BACKOFF_BASE_MS", c.backoff_base_ms);
    c.backoff_mult = getenv_i64("CODELOOP_RETRY_BACKOFF_MULT", c.backoff_mult);
    c.backoff_max_ms = getenv_i64("CODELOOP_RETRY_BACKOFF_MAX_MS", c.backoff_max_ms);
    c.backoff_jitter_ms = getenv_i64("CODELOOP_RETRY_BACKOFF_JITTER_MS", c.backoff_jitter_ms);
    return c;
}

TextGenConfig load_textgen_config() {
    TextGenConfig c;
    c.cmd = getenv_str("CODELOOP_LLM_CMD", "");
    c.timeout_ms = getenv_int("CODELOOP_LLM_TIMEOUT_MS", c.timeout_ms);
    c.retries = std::max(0, getenv_int("CODELOOP_LLM_RETRIES", c.retries));
    return c;
}

bool parse_exec_mode(const std::string& s, ExecMode* out) {
    const std::string v = lower(s);
    if (v == "direct") {
        *out = ExecMode::DIRECT;
        return true;
    }
    if (v == "tool") {
        *out = ExecMode::TOOL;
        return true;
    }
    return false;
}

ChannelSettings load_channel_settings() {
    ChannelSettings c;
    ExecMode m;
    if (parse_exec_mode(getenv_str("CODELOOP_EXEC_MODE", "direct"), &m)) c.mode = m;
    c.tool.cmd = getenv_str("CODELOOP_EXEC_CMD", c.tool.cmd);
    c.tool.scratch_root = getenv_str("CODELOOP_SCRATCH_ROOT", "");
    c.connect_attempts = std::max(1, getenv_int("CODELOOP_EXEC_CONNECT_ATTEMPTS", c.connect_attempts));
    c.list_timeout_ms = getenv_int("CODELOOP_EXEC_LIST_TIMEOUT_MS", c.list_timeout_ms);
    return c;
}

} // namespace codeloop
