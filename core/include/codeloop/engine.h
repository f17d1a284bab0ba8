#pragma once

#include "codeloop/agents.h"
#include "codeloop/channel.h"
#include "codeloop/log.h"
#include "codeloop/state.h"
#include "codeloop/textgen.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace codeloop {

struct EngineConfig {
    int max_attempts{4};
    int request_timeout_ms{60000};
    std::string default_language{"python"};

    // Delay between a failed evaluation and the next generation.
    int64_t backoff_base_ms{0};
    int64_t backoff_mult{2};
    int64_t backoff_max_ms{5000};
    int64_t backoff_jitter_ms{0};

    int max_steps{0};                    // 0: 3 * max_attempts + 3
};

using TransitionObserver = std::function<void(const WorkflowState& st, Phase from, Phase to)>;

struct RunContext {
    const std::atomic<bool>* cancel{nullptr};
    JsonlLogger* logger{nullptr};
    TransitionObserver on_transition;
    std::string language;                // overrides EngineConfig::default_language
    int max_attempts{0};                 // overrides EngineConfig::max_attempts when > 0
};

// generate -> execute -> evaluate -> {generate | done}. Owns the retry loop
// and termination. One engine can serve concurrent runs; every run owns its
// own WorkflowState.
class WorkflowEngine {
public:
    WorkflowEngine(EngineConfig cfg, ITextGenerator& gen, IExecutionChannel& channel);

    // Never throws; a fault ends the run as ABORTED with the partial state.
    WorkflowState run(const std::string& request, const RunContext& ctx = {}) const;

    static bool transition_allowed(Phase from, Phase to);

    const EngineConfig& config() const { return cfg_; }

private:
    EngineConfig cfg_;
    CodeGenerator generator_;
    CodeRunner runner_;
    Evaluator evaluator_;
};

} // namespace codeloop
