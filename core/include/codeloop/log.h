#pragma once

#include <fstream>
#include <mutex>
#include <string>

namespace codeloop {

struct RunHeader {
    std::string run_id;
    std::string request_id;
    std::string profile;        // "dev" / "prod"
    std::string log_version{"codeloop.runlog.v1"};
};

// Append-only JSONL run log. Every line is canonical (sorted keys) JSON and
// carries chain_hash = SHA256(chain_prev || record), so edits, drops and
// reorders are detectable by recomputing the chain.
class JsonlLogger {
public:
    JsonlLogger(const RunHeader& hdr, const std::string& path);

    bool ok() const { return out_.good(); }
    void event(int step, const std::string& name, const std::string& payload_json);
    const std::string& path() const { return path_; }

private:
    RunHeader hdr_;
    std::string path_;
    std::ofstream out_;
    std::string chain_prev_;
    std::mutex mu_;
};

// Recompute the chain of a run log. Returns false with *err naming the first
// bad line.
bool verify_run_log(const std::string& path, std::string* err);

// Sorted-key serialization of any JSON text; returns input unchanged if it
// does not parse.
std::string canonicalize_json(const std::string& raw);

} // namespace codeloop
