#pragma once

#include "codeloop/classifier.h"
#include "codeloop/executor.h"
#include "codeloop/types.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace codeloop {

struct ChannelReply {
    bool available{false};          // false: the execution capability could not be reached
    std::string error;              // why it was unavailable

    bool structured{false};         // true: `result` holds a decoded ExecutionResult
    ExecutionResult result;

    std::string free_text;          // unstructured reply, judged by `classified`
    Classification classified;
};

// How the workflow reaches code execution.
class IExecutionChannel {
public:
    virtual ~IExecutionChannel() = default;
    virtual const char* name() const = 0;

    // timeout_ms is the request-scoped outer bound; <= 0 leaves only the
    // sandbox's own limits.
    virtual ChannelReply execute(const std::string& code,
                                 const std::string& language,
                                 const std::string& stdin_data,
                                 int timeout_ms,
                                 const std::atomic<bool>* cancel) = 0;
};

// In-process sandbox call.
class DirectExecutionChannel : public IExecutionChannel {
public:
    explicit DirectExecutionChannel(const SandboxExecutor& executor) : executor_(executor) {}

    const char* name() const override { return "direct"; }
    ChannelReply execute(const std::string& code,
                         const std::string& language,
                         const std::string& stdin_data,
                         int timeout_ms,
                         const std::atomic<bool>* cancel) override;

private:
    const SandboxExecutor& executor_;
};

// Tools offered by an execution service.
struct ToolCatalog {
    std::string server;
    int protocol{0};
    std::vector<std::string> tools;

    bool has(const std::string& tool) const;
};

enum class ConnectionState { UNINITIALIZED, READY, PERMANENTLY_FAILED };

const char* connection_state_name(ConnectionState s);

// Lazily negotiated handle to an execution service, shared by every run.
// UNINITIALIZED -> READY(catalog) on the first successful negotiation; once
// READY the catalog never changes. After connect_attempts failed tries the
// handle turns PERMANENTLY_FAILED and later callers fail immediately.
// Concurrent callers wait for an in-flight negotiation instead of starting
// their own.
class ToolConnection {
public:
    using Negotiator = std::function<bool(ToolCatalog* out, std::string* err)>;

    ToolConnection(Negotiator negotiate, int connect_attempts,
                   int64_t backoff_base_ms = 200, int64_t backoff_max_ms = 2000);

    // True with *out filled when READY. A cancelled negotiation leaves the
    // state UNINITIALIZED.
    bool acquire(ToolCatalog* out, std::string* err, const std::atomic<bool>* cancel = nullptr);

    ConnectionState state() const;
    int negotiation_count() const;

    // Back to UNINITIALIZED (operator action, e.g. after restarting the service).
    void reset();

private:
    Negotiator negotiate_;
    int connect_attempts_;
    int64_t backoff_base_ms_;
    int64_t backoff_max_ms_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    ConnectionState state_{ConnectionState::UNINITIALIZED};
    bool negotiating_{false};
    ToolCatalog catalog_;
    std::string failure_;
    int negotiations_{0};
};

// Negotiator that runs `<cmd> --list` and requires an execute_code tool.
ToolConnection::Negotiator make_process_negotiator(const std::string& cmd, int timeout_ms);

struct ToolChannelConfig {
    std::string cmd{"codeloop_execd"};
    std::filesystem::path scratch_root;     // parent for per-call scratch dirs
    size_t output_max_bytes{1024 * 1024};
};

// Execution through a tool service process. Each call gets a caller-owned
// scratch directory passed with --scratch-root, so cleanup does not depend
// on the service exiting cleanly.
class ToolExecutionChannel : public IExecutionChannel {
public:
    ToolExecutionChannel(ToolChannelConfig cfg, std::shared_ptr<ToolConnection> conn)
        : cfg_(std::move(cfg)), conn_(std::move(conn)) {}

    const char* name() const override { return "tool"; }
    ChannelReply execute(const std::string& code,
                         const std::string& language,
                         const std::string& stdin_data,
                         int timeout_ms,
                         const std::atomic<bool>* cancel) override;

    const std::shared_ptr<ToolConnection>& connection() const { return conn_; }

private:
    ToolChannelConfig cfg_;
    std::shared_ptr<ToolConnection> conn_;
};

} // namespace codeloop
