#pragma once

#include "codeloop/types.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codeloop {

struct SandboxConfig {
    int run_timeout_ms{15000};
    int compile_timeout_ms{15000};
    size_t output_max_bytes{256 * 1024};
    std::filesystem::path scratch_root;     // empty: system temp directory
    bool no_new_privs{true};

    // Replaces a command template's argv[0], e.g. "python3" -> "/opt/py/bin/python3".
    std::map<std::string, std::string> tool_overrides;
};

// Per-call options. The sandbox's own timeouts still apply; the deadline can
// only shorten them.
struct RunOptions {
    std::optional<std::chrono::steady_clock::time_point> deadline;
    const std::atomic<bool>* cancel{nullptr};
    std::filesystem::path scratch_root;     // overrides SandboxConfig::scratch_root
};

// Compiles and runs untrusted snippets in a fresh scratch directory per call.
// Immutable after construction; every member is safe to call concurrently.
class SandboxExecutor {
public:
    explicit SandboxExecutor(SandboxConfig cfg = {});

    ExecutionResult run(const std::string& source,
                        const std::string& language,
                        const std::string& stdin_data,
                        const RunOptions& opts = {}) const;

    // Snippets run one after another; a failing one never stops the rest.
    BatchResult run_batch(const std::vector<BatchSnippet>& snippets,
                          const RunOptions& opts = {}) const;

    // Compile-only check for compiled languages.
    SyntaxCheck validate_syntax(const std::string& source,
                                const std::string& language,
                                const RunOptions& opts = {}) const;

    LanguageInfo language_info() const;

    // Starter program plus usage notes; nullopt for unsupported languages.
    std::optional<std::string> language_template(const std::string& language) const;

    const SandboxConfig& config() const { return cfg_; }

private:
    std::vector<std::string> expand_cmd(const std::vector<std::string>& tmpl,
                                        const std::string& src,
                                        const std::string& exe,
                                        const std::string& dir,
                                        const std::string& cls) const;

    SandboxConfig cfg_;
};

// Name captured by `public\s+class\s+(\w+)`, or nullopt.
std::optional<std::string> java_public_class_name(const std::string& source);

// Wraps code lacking a public class in `public class Main` with a main method
// (body indented by 8 spaces). Returns the source unchanged otherwise.
std::string prepare_java_source(const std::string& source);

} // namespace codeloop
