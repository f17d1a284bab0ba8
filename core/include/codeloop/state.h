#pragma once

#include "codeloop/types.h"

#include <optional>
#include <string>
#include <vector>

namespace codeloop {

enum class Phase { GENERATE, EXECUTE, EVALUATE, DONE };

enum class ExecStatus { NONE, SUCCESS, FAILURE };

// How a run ended. RUNNING until phase reaches DONE (or the engine gives up).
enum class Outcome { RUNNING, SATISFIED, EXHAUSTED, CANCELLED, ABORTED };

const char* phase_name(Phase p);
const char* exec_status_name(ExecStatus s);
const char* outcome_name(Outcome o);

struct LogEntry {
    std::string producer;
    std::string text;
};

// Result of the latest attempt. Overwritten field by field each attempt.
struct AttemptResult {
    std::string code;
    std::string language;
    std::string raw_response;            // generator output before code extraction
    ExecStatus status{ExecStatus::NONE};
    ErrorKind error_kind{ErrorKind::NONE};
    std::string error_message;           // cleared on success
    std::string payload;                 // program output on success
    std::optional<ExecutionResult> execution; // structured sandbox result of this attempt only
};

// Mutable record threaded through the agents for one run. Owned by exactly
// one run; never shared across runs.
class WorkflowState {
public:
    WorkflowState(std::string request, int max_attempts)
        : request_(std::move(request)), max_attempts_(max_attempts) {}

    const std::string& request() const { return request_; }
    int max_attempts() const { return max_attempts_; }

    const std::vector<LogEntry>& log() const { return log_; }
    void append_log(const std::string& producer, const std::string& text) {
        log_.push_back(LogEntry{producer, text});
    }

    Phase phase{Phase::GENERATE};
    AttemptResult result;
    int attempt_count{0};                // failed attempts so far
    Outcome outcome{Outcome::RUNNING};
    std::string fault;                   // set when the engine aborts the run
    std::string language;                // requested language, used when the generator does not name one

private:
    std::string request_;
    int max_attempts_;
    std::vector<LogEntry> log_;
};

} // namespace codeloop
