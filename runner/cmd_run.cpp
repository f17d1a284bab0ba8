#include "cmd_run.h"
#include "runner_utils.h"

#include "codeloop/channel.h"
#include "codeloop/config.h"
#include "codeloop/engine.h"
#include "codeloop/executor.h"
#include "codeloop/ids.h"
#include "codeloop/json_mini.h"
#include "codeloop/log.h"
#include "codeloop/proc.h"
#include "codeloop/serialization.h"
#include "codeloop/textgen.h"

#include <filesystem>
#include <iostream>
#include <memory>

using namespace codeloop;

int cmd_run(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: codeloop_cli run <request.json>\n";
        std::cerr << "request: {\"task\": \"...\", \"language\"?, \"max_attempts\"?, \"exec_mode\"?: \"direct\"|\"tool\", \"request_id\"?}\n";
        std::cerr << "env: CODELOOP_LLM_CMD (required), CODELOOP_PROFILE=dev|prod, CODELOOP_LOG_DIR\n";
        return 2;
    }

    const Profile profile = detect_profile();
    apply_profile_defaults(profile);
    set_env_if_missing("CODELOOP_EXEC_CMD", (self_exe_dir(argv[0]) / "codeloop_execd").string());

    std::string req;
    try {
        req = slurp(argv[2]);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
    json_mini::Doc d = json_mini::parse(req);
    if (!d || !json_object_is_type(d.root, json_type_object)) {
        std::cerr << "[ERROR] request is not a JSON object: " << argv[2] << "\n";
        return 2;
    }
    const auto task = json_mini::field_string(d.root, "task");
    if (!task || task->empty()) {
        std::cerr << "[ERROR] request has no \"task\"\n";
        return 2;
    }

    EngineConfig ecfg = load_engine_config();
    RunContext ctx;
    ctx.language = json_mini::field_string(d.root, "language").value_or("");
    ctx.max_attempts = (int)json_mini::field_int(d.root, "max_attempts").value_or(0);

    ChannelSettings cs = load_channel_settings();
    if (auto m = json_mini::field_string(d.root, "exec_mode")) {
        if (!parse_exec_mode(*m, &cs.mode)) {
            std::cerr << "[ERROR] unknown exec_mode: " << *m << "\n";
            return 2;
        }
    }

    TextGenConfig tcfg = load_textgen_config();
    if (tcfg.cmd.empty()) {
        std::cerr << "[WARN] CODELOOP_LLM_CMD is not set; every generation attempt will fail\n";
    }
    ProcessTextGenerator gen(tcfg);

    const SandboxExecutor executor(load_sandbox_config());
    std::unique_ptr<IExecutionChannel> channel;
    if (cs.mode == ExecMode::TOOL) {
        auto conn = std::make_shared<ToolConnection>(make_process_negotiator(cs.tool.cmd, cs.list_timeout_ms),
                                                     cs.connect_attempts);
        channel = std::make_unique<ToolExecutionChannel>(cs.tool, conn);
    } else {
        channel = std::make_unique<DirectExecutionChannel>(executor);
    }

    const std::string run_id = gen_run_id();
    std::unique_ptr<JsonlLogger> logger;
    const std::string log_dir = getenv_str("CODELOOP_LOG_DIR", "");
    if (!log_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(log_dir, ec);
        RunHeader hdr;
        hdr.run_id = run_id;
        hdr.request_id = json_mini::field_string(d.root, "request_id").value_or("");
        hdr.profile = profile_name(profile);
        const std::string path = (std::filesystem::path(log_dir) / ("run_" + run_id + ".jsonl")).string();
        logger = std::make_unique<JsonlLogger>(hdr, path);
        if (!logger->ok()) {
            std::cerr << "[WARN] cannot open run log " << path << "\n";
            logger.reset();
        }
    }

    install_cancel_handlers();
    ctx.cancel = cancel_flag();
    ctx.logger = logger.get();
    ctx.on_transition = [](const WorkflowState& st, Phase from, Phase to) {
        std::cerr << "[INFO] " << phase_name(from) << " -> " << phase_name(to)
                  << " (failed attempts " << st.attempt_count << "/" << st.max_attempts() << ")\n";
    };

    WorkflowEngine engine(ecfg, gen, *channel);
    WorkflowState st = engine.run(*task, ctx);

    json_object* out = workflow_state_to_json(st);
    json_object_object_add(out, "run_id", json_mini::new_string(run_id));
    json_object_object_add(out, "exec_mode", json_object_new_string(channel->name()));
    if (logger) json_object_object_add(out, "run_log", json_mini::new_string(logger->path()));
    print_json(out);

    return st.outcome == Outcome::SATISFIED ? 0 : 1;
}
