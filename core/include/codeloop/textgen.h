#pragma once

#include "codeloop/state.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

namespace codeloop {

struct GenerationRequest {
    std::string system;
    std::string task;
    std::string prior_code;
    std::string prior_status;
    std::string prior_error;
    std::string language;
};

struct GenerationResult {
    bool ok{false};
    std::string text;
    std::string error;
    bool timed_out{false};
};

// External text generation service. Implementations must honor the timeout
// and stop promptly when *cancel becomes true.
class ITextGenerator {
public:
    virtual ~ITextGenerator() = default;
    virtual GenerationResult generate(const GenerationRequest& req,
                                      int timeout_ms,
                                      const std::atomic<bool>* cancel) = 0;
};

struct TextGenConfig {
    std::string cmd;                // CODELOOP_LLM_CMD, split without a shell
    int timeout_ms{60000};
    int retries{2};                 // extra attempts after a start or exit failure
    int64_t backoff_base_ms{250};
    int64_t backoff_mult{2};
    int64_t backoff_max_ms{2000};
    size_t output_max_bytes{1024 * 1024};
    std::string cwd;                // working directory for the driver; empty = "."
};

// Runs a driver process per request: the request as JSON on stdin, the reply
// on stdout, either {"content": "..."} or raw text.
class ProcessTextGenerator : public ITextGenerator {
public:
    explicit ProcessTextGenerator(TextGenConfig cfg) : cfg_(std::move(cfg)) {}

    GenerationResult generate(const GenerationRequest& req,
                              int timeout_ms,
                              const std::atomic<bool>* cancel) override;

private:
    TextGenConfig cfg_;
};

std::string generation_request_to_json(const GenerationRequest& req);

struct ExtractedCode {
    std::string code;
    std::string language;
    bool fenced{false};
};

// First ``` fenced block of `text`, or the whole text when there is none.
// The fence tag decides the language when it names a supported one.
ExtractedCode extract_code_block(const std::string& text, const std::string& default_language);

// Task plus the previous attempt's code, status and error.
GenerationRequest build_generation_request(const WorkflowState& st, const std::string& language);

} // namespace codeloop
