#include "codeloop/agents.h"

#include <algorithm>
#include <cstdio>

namespace codeloop {

namespace {

void record_failure(WorkflowState& st, ErrorKind kind, const std::string& msg) {
    st.result.status = ExecStatus::FAILURE;
    st.result.error_kind = kind;
    st.result.error_message = msg;
    st.result.payload.clear();
}

void record_success(WorkflowState& st, const std::string& payload) {
    st.result.status = ExecStatus::SUCCESS;
    st.result.error_kind = ErrorKind::NONE;
    st.result.error_message.clear();
    st.result.payload = payload;
}

size_t count_lines(const std::string& s) {
    if (s.empty()) return 0;
    size_t n = (size_t)std::count(s.begin(), s.end(), '\n');
    return s.back() == '\n' ? n : n + 1;
}

std::string first_line(const std::string& s, size_t max_len = 200) {
    std::string line = s.substr(0, s.find('\n'));
    if (line.size() > max_len) line = line.substr(0, max_len) + "...";
    return line;
}

} // namespace

void CodeGenerator::process(WorkflowState& st, const AgentContext& ctx) const {
    st.result.execution.reset();
    try {
        const GenerationRequest req = build_generation_request(st, st.language);
        const GenerationResult gr = gen_.generate(req, ctx.timeout_ms, ctx.cancel);
        if (!gr.ok) {
            ErrorKind kind = gr.timed_out ? ErrorKind::TIMEOUT : ErrorKind::SERVICE_UNAVAILABLE;
            if (ctx.cancel && ctx.cancel->load()) kind = ErrorKind::CANCELLED;
            record_failure(st, kind, "Code generation error: " + gr.error);
            st.append_log(kName, "Code generation failed: " + gr.error);
            st.phase = Phase::EVALUATE;
            return;
        }

        const ExtractedCode ec = extract_code_block(gr.text, st.language);
        st.result.raw_response = gr.text;
        if (ec.code.find_first_not_of(" \t\r\n") == std::string::npos) {
            record_failure(st, ErrorKind::SERVICE_UNAVAILABLE, "Code generation error: response contained no code");
            st.append_log(kName, "Code generation failed: response contained no code");
            st.phase = Phase::EVALUATE;
            return;
        }
        st.result.code = ec.code;
        st.result.language = ec.language;
        st.append_log(kName, "Generated " + std::to_string(count_lines(ec.code)) + " line(s) of " +
                                 ec.language + (ec.fenced ? "" : " (unfenced response)"));
        st.phase = Phase::EXECUTE;
    } catch (const std::exception& e) {
        record_failure(st, ErrorKind::INTERNAL, std::string("Code generation error: ") + e.what());
        st.append_log(kName, std::string("Code generation failed: ") + e.what());
        st.phase = Phase::EVALUATE;
    }
}

void CodeRunner::process(WorkflowState& st, const AgentContext& ctx) const {
    st.result.execution.reset();
    try {
        const std::string language = st.result.language.empty() ? st.language : st.result.language;
        ChannelReply reply = channel_.execute(st.result.code, language, "", ctx.timeout_ms, ctx.cancel);

        if (!reply.available) {
            record_failure(st, ErrorKind::SERVICE_UNAVAILABLE, "Could not connect to code execution server");
            st.append_log(kName, "Error: Could not connect to code execution server (" + reply.error + ")");
        } else if (reply.structured) {
            const ExecutionResult& r = reply.result;
            st.result.execution = r;
            if (r.succeeded) {
                record_success(st, r.stdout_data);
                char buf[64];
                std::snprintf(buf, sizeof(buf), "%.3fs", r.duration_sec);
                st.append_log(kName, "Executed " + r.language + " code successfully in " + buf);
            } else {
                record_failure(st, r.error_kind, r.error);
                st.append_log(kName, std::string("Execution failed [") + error_kind_name(r.error_kind) + "]: " +
                                         first_line(r.error));
            }
        } else {
            const Classification& c = reply.classified;
            if (c.succeeded) {
                record_success(st, reply.free_text);
                st.append_log(kName, std::string("Execution reported success (") + verdict_name(c.verdict) + ")");
            } else {
                record_failure(st, ErrorKind::RUNTIME_FAILURE, reply.free_text);
                st.append_log(kName, std::string("Execution reported failure (") + verdict_name(c.verdict) +
                                         ": \"" + c.matched + "\")");
            }
        }
    } catch (const std::exception& e) {
        record_failure(st, ErrorKind::INTERNAL, std::string("Execution error: ") + e.what());
        st.append_log(kName, std::string("Execution failed: ") + e.what());
    }
    st.phase = Phase::EVALUATE;
}

void Evaluator::process(WorkflowState& st) const {
    if (st.result.status == ExecStatus::SUCCESS) {
        st.append_log(kName, "Code executed successfully!");
        st.outcome = Outcome::SATISFIED;
        st.phase = Phase::DONE;
        return;
    }

    st.attempt_count++;
    if (st.attempt_count >= st.max_attempts()) {
        st.append_log(kName, "Maximum retries (" + std::to_string(st.max_attempts()) + ") reached. Ending workflow.");
        st.outcome = Outcome::EXHAUSTED;
        st.phase = Phase::DONE;
    } else {
        st.append_log(kName, "Execution failed. Retry " + std::to_string(st.attempt_count) + "/" +
                                 std::to_string(st.max_attempts()) + ". Going back to code generation.");
        st.phase = Phase::GENERATE;
    }
}

} // namespace codeloop
