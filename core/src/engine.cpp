#include "codeloop/engine.h"
#include "codeloop/backoff.h"
#include "codeloop/json_mini.h"
#include "codeloop/language.h"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace codeloop {

namespace {

bool cancelled(const std::atomic<bool>* c) {
    return c && c->load();
}

std::string transition_payload(const WorkflowState& st, Phase from, Phase to) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "from", json_object_new_string(phase_name(from)));
    json_object_object_add(o, "to", json_object_new_string(phase_name(to)));
    json_object_object_add(o, "attempt_count", json_object_new_int(st.attempt_count));
    json_object_object_add(o, "status", json_object_new_string(exec_status_name(st.result.status)));
    json_object_object_add(o, "error_kind", json_object_new_string(error_kind_name(st.result.error_kind)));
    if (!st.log().empty()) json_object_object_add(o, "message", json_mini::new_string(st.log().back().text));
    std::string s = json_mini::to_string(o);
    json_object_put(o);
    return s;
}

std::string summary_payload(const WorkflowState& st) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "outcome", json_object_new_string(outcome_name(st.outcome)));
    json_object_object_add(o, "attempt_count", json_object_new_int(st.attempt_count));
    json_object_object_add(o, "max_attempts", json_object_new_int(st.max_attempts()));
    if (!st.fault.empty()) json_object_object_add(o, "fault", json_mini::new_string(st.fault));
    std::string s = json_mini::to_string(o);
    json_object_put(o);
    return s;
}

} // namespace

WorkflowEngine::WorkflowEngine(EngineConfig cfg, ITextGenerator& gen, IExecutionChannel& channel)
    : cfg_(std::move(cfg)), generator_(gen), runner_(channel) {}

bool WorkflowEngine::transition_allowed(Phase from, Phase to) {
    switch (from) {
        case Phase::GENERATE: return to == Phase::EXECUTE || to == Phase::EVALUATE;
        case Phase::EXECUTE: return to == Phase::EVALUATE;
        case Phase::EVALUATE: return to == Phase::GENERATE || to == Phase::DONE;
        case Phase::DONE: return false;
    }
    return false;
}

WorkflowState WorkflowEngine::run(const std::string& request, const RunContext& ctx) const {
    const int max_attempts = std::max(1, ctx.max_attempts > 0 ? ctx.max_attempts : cfg_.max_attempts);
    WorkflowState st(request, max_attempts);
    st.language = normalize_language(ctx.language.empty() ? cfg_.default_language : ctx.language);

    const int max_steps = cfg_.max_steps > 0 ? cfg_.max_steps : 3 * max_attempts + 3;
    AgentContext actx;
    actx.timeout_ms = cfg_.request_timeout_ms;
    actx.cancel = ctx.cancel;

    int step = 0;
    try {
        if (ctx.logger) {
            json_object* o = json_object_new_object();
            json_object_object_add(o, "request", json_mini::new_string(request));
            json_object_object_add(o, "language", json_mini::new_string(st.language));
            json_object_object_add(o, "max_attempts", json_object_new_int(max_attempts));
            ctx.logger->event(step, "run_start", json_mini::to_string(o));
            json_object_put(o);
        }

        while (st.phase != Phase::DONE) {
            if (cancelled(ctx.cancel)) {
                st.outcome = Outcome::CANCELLED;
                st.append_log("WorkflowEngine", std::string("Run cancelled during ") + phase_name(st.phase));
                st.phase = Phase::DONE;
                break;
            }
            if (++step > max_steps) {
                throw std::runtime_error("step budget of " + std::to_string(max_steps) + " exhausted");
            }

            const Phase from = st.phase;
            switch (from) {
                case Phase::GENERATE: generator_.process(st, actx); break;
                case Phase::EXECUTE: runner_.process(st, actx); break;
                case Phase::EVALUATE: evaluator_.process(st); break;
                case Phase::DONE: break;
            }
            if (!transition_allowed(from, st.phase)) {
                throw std::logic_error(std::string("illegal transition ") + phase_name(from) + " -> " +
                                       phase_name(st.phase));
            }

            if (ctx.logger) ctx.logger->event(step, "transition", transition_payload(st, from, st.phase));
            if (ctx.on_transition) ctx.on_transition(st, from, st.phase);

            if (from == Phase::EVALUATE && st.phase == Phase::GENERATE) {
                const int64_t delay = backoff_delay_ms(st.attempt_count + 1, cfg_.backoff_base_ms, cfg_.backoff_mult,
                                                       cfg_.backoff_max_ms, cfg_.backoff_jitter_ms);
                if (delay > 0) sleep_interruptible_ms(delay, ctx.cancel);
            }
        }
        if (cancelled(ctx.cancel) && st.outcome == Outcome::RUNNING) st.outcome = Outcome::CANCELLED;
    } catch (const std::exception& e) {
        st.outcome = Outcome::ABORTED;
        st.fault = e.what();
        st.append_log("WorkflowEngine", std::string("Run aborted: ") + e.what());
        st.phase = Phase::DONE;
    }

    if (ctx.logger) {
        try {
            ctx.logger->event(step + 1, "run_end", summary_payload(st));
        } catch (const std::exception& e) {
            std::fprintf(stderr, "[WARN] run log write failed: %s\n", e.what());
        }
    }
    return st;
}

} // namespace codeloop
