#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace codeloop {

// Failure taxonomy shared by the sandbox, the execution channels and the
// workflow. NONE means the execution succeeded.
enum class ErrorKind {
    NONE,
    UNSUPPORTED_LANGUAGE,
    COMPILE_FAILURE,
    RUNTIME_FAILURE,
    TIMEOUT,
    SERVICE_UNAVAILABLE,
    TOOLCHAIN_UNAVAILABLE,
    CANCELLED,
    INTERNAL,
};

// Which bound fired for ErrorKind::TIMEOUT.
enum class TimeoutPhase {
    NONE,
    COMPILE,
    RUN,
    WORKFLOW,   // the caller's outer, request-scoped deadline
};

const char* error_kind_name(ErrorKind k);
bool parse_error_kind(const std::string& s, ErrorKind* out);
const char* timeout_phase_name(TimeoutPhase p);
bool parse_timeout_phase(const std::string& s, TimeoutPhase* out);

// One sandbox invocation. Produced fresh per call, never shared.
struct ExecutionResult {
    bool succeeded{false};
    std::string stdout_data;
    std::string stderr_data;
    double duration_sec{0.0};
    std::string language;      // normalized id

    ErrorKind error_kind{ErrorKind::NONE};
    TimeoutPhase timeout_phase{TimeoutPhase::NONE};
    std::string error;         // stderr on run, diagnostics or explanation otherwise
    int exit_code{-1};         // -1 when the run step never executed
    bool output_truncated{false};
};

struct SyntaxCheck {
    bool valid{false};
    std::string message;
    std::string error;
    std::string language;
};

struct BatchSnippet {
    std::string code;
    std::string language;
    std::string stdin_data;
    // Set by the decoder when a wire snippet lacks required keys.
    std::string invalid_reason;
};

struct BatchResult {
    std::vector<std::pair<std::string, ExecutionResult>> results; // "snippet_<i>", in input order
    int total{0};
    int successful{0};
    int failed{0};

    const ExecutionResult* find(const std::string& key) const;
};

struct LanguageDetail {
    std::string id;
    std::string extension;
    bool compiled{false};
    bool interpreted{true};
};

struct LanguageInfo {
    std::vector<std::string> supported_languages;
    int timeout_ms{0};
    std::vector<LanguageDetail> details;
};

} // namespace codeloop
