#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace codeloop {

struct ProcLimits {
    int timeout_ms{2000};            // wall clock; <= 0 disables
    size_t stdout_max_bytes{256 * 1024}; // cap per stream (stdout, stderr)

    int rlimit_cpu_sec{0};           // CPU time seconds; 0 = no limit
    size_t rlimit_as_mb{512};        // virtual memory MB; 0 = no limit
    size_t rlimit_fsize_mb{16};      // max file size MB
    int rlimit_nofile{64};           // max open fds
    int rlimit_nproc{0};             // max processes (best-effort); 0 = no limit

    bool no_new_privs{true};

    // Polled while the child runs; when it flips to true the whole process
    // group is killed and ProcResult::cancelled is set.
    const std::atomic<bool>* cancel{nullptr};

    // On timeout or cancel the group first gets SIGTERM and this long to exit
    // (output is still drained) before SIGKILL. 0 kills at once.
    int kill_grace_ms{0};
};

struct ProcResult {
    int exit_code{127};
    int term_signal{0};        // signal that killed the child, 0 if it exited
    bool timed_out{false};
    bool cancelled{false};
    bool output_truncated{false};
    std::string stdout_data;
    std::string stderr_data;
    std::string error;         // internal runner error, not child stderr
    int64_t elapsed_ms{0};
};

// Run a process (argv[0] is executable, resolved through PATH) in its own
// process group, feed stdin_data, capture stdout and stderr separately,
// enforce the wall-clock timeout and rlimits (POSIX best-effort).
// Returns true if the process started.
bool proc_run_capture_sandboxed_stdin(const std::vector<std::string>& argv,
                                      const std::string& cwd,
                                      const std::string& stdin_data,
                                      const ProcLimits& lim,
                                      ProcResult* res);

// Same with empty stdin.
bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                                const std::string& cwd,
                                const ProcLimits& lim,
                                ProcResult* res);

// Small helper: split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

// Directory of the running binary from /proc/self/exe; argv0 resolved
// against the cwd is the fallback where that link is unavailable.
std::filesystem::path self_exe_dir(const char* argv0);

// True if `exe` names an executable file, either as a path or through PATH.
bool executable_on_path(const std::string& exe);

} // namespace codeloop
