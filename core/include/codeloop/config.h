#pragma once

#include "codeloop/channel.h"
#include "codeloop/engine.h"
#include "codeloop/executor.h"
#include "codeloop/textgen.h"

#include <cstdint>
#include <string>

namespace codeloop {

enum class Profile { DEV, PROD };

// Detect profile from CODELOOP_PROFILE env var. Default: DEV.
Profile detect_profile();

const char* profile_name(Profile p);

// Sets profile defaults for env vars that are not already set.
// DEV: generous timeouts, no retry backoff
// PROD: tighter timeouts, fewer attempts, backoff between attempts
// Must run before any worker thread starts (setenv is not thread-safe).
void apply_profile_defaults(Profile p);

// --- env helpers ---

int getenv_int(const char* k, int defv);
int64_t getenv_i64(const char* k, int64_t defv);
std::string getenv_str(const char* k, const std::string& defv);
bool env_true(const char* k, bool defv = false);

// --- typed loaders (read the environment once) ---

SandboxConfig load_sandbox_config();
EngineConfig load_engine_config();
TextGenConfig load_textgen_config();

enum class ExecMode { DIRECT, TOOL };

struct ChannelSettings {
    ExecMode mode{ExecMode::DIRECT};
    ToolChannelConfig tool;
    int connect_attempts{3};
    int list_timeout_ms{5000};
};

ChannelSettings load_channel_settings();
bool parse_exec_mode(const std::string& s, ExecMode* out);

} // namespace codeloop
