#pragma once

#include "codeloop/channel.h"
#include "codeloop/state.h"
#include "codeloop/textgen.h"

#include <atomic>
#include <string>

namespace codeloop {

// Per-run values every agent needs.
struct AgentContext {
    int timeout_ms{60000};                   // request-scoped bound for external calls
    const std::atomic<bool>* cancel{nullptr};
};

// The three phase handlers. Each owns one phase, appends one log line per
// call and folds every failure into state.result instead of throwing.

class CodeGenerator {
public:
    static constexpr Phase kPhase = Phase::GENERATE;
    static constexpr const char* kName = "CodeGenerator";

    explicit CodeGenerator(ITextGenerator& gen) : gen_(gen) {}

    // GENERATE -> EXECUTE on success, GENERATE -> EVALUATE on failure.
    void process(WorkflowState& st, const AgentContext& ctx) const;

private:
    ITextGenerator& gen_;
};

class CodeRunner {
public:
    static constexpr Phase kPhase = Phase::EXECUTE;
    static constexpr const char* kName = "CodeRunner";

    explicit CodeRunner(IExecutionChannel& channel) : channel_(channel) {}

    // EXECUTE -> EVALUATE, always.
    void process(WorkflowState& st, const AgentContext& ctx) const;

private:
    IExecutionChannel& channel_;
};

class Evaluator {
public:
    static constexpr Phase kPhase = Phase::EVALUATE;
    static constexpr const char* kName = "Evaluator";

    // Failure: attempt_count += 1, then DONE (EXHAUSTED) once it reaches
    // max_attempts, else GENERATE. Success: DONE (SATISFIED), count unchanged.
    void process(WorkflowState& st) const;
};

} // namespace codeloop
