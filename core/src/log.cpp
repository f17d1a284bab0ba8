#include "codeloop/log.h"
#include "codeloop/hash.h"
#include "codeloop/json_mini.h"

#include <json-c/json.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>

namespace codeloop {

namespace {

std::string iso_now() {
    using namespace std::chrono;
    std::time_t t = system_clock::to_time_t(system_clock::now());
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

void canonical_serialize(json_object* obj, std::ostringstream& out) {
    if (!obj) {
        out << "null";
        return;
    }
    switch (json_object_get_type(obj)) {
    case json_type_object: {
        std::vector<std::string> keys;
        json_object_object_foreach(obj, k, v) {
            (void)v;
            keys.emplace_back(k);
        }
        std::sort(keys.begin(), keys.end());
        out << "{";
        for (size_t i = 0; i < keys.size(); i++) {
            if (i > 0) out << ",";
            out << json_mini::quote(keys[i]) << ":";
            json_object* val = nullptr;
            json_object_object_get_ex(obj, keys[i].c_str(), &val);
            canonical_serialize(val, out);
        }
        out << "}";
        break;
    }
    case json_type_array: {
        out << "[";
        const size_t len = json_object_array_length(obj);
        for (size_t i = 0; i < len; i++) {
            if (i > 0) out << ",";
            canonical_serialize(json_object_array_get_idx(obj, (int)i), out);
        }
        out << "]";
        break;
    }
    default:
        out << json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN);
        break;
    }
}

std::string canonical(json_object* obj) {
    std::ostringstream out;
    canonical_serialize(obj, out);
    return out.str();
}

// The chained record: every field except chain_hash / chain_prev.
json_object* build_record(const RunHeader& hdr, int step, const std::string& name,
                          const std::string& payload, const std::string& ts) {
    json_object* rec = json_object_new_object();
    json_object_object_add(rec, "event", json_mini::new_string(name));
    json_object* pobj = json_tokener_parse(payload.c_str());
    json_object_object_add(rec, "payload", pobj ? pobj : json_mini::new_string(payload));
    json_object_object_add(rec, "profile", json_mini::new_string(hdr.profile));
    if (!hdr.request_id.empty()) json_object_object_add(rec, "request_id", json_mini::new_string(hdr.request_id));
    json_object_object_add(rec, "run_id", json_mini::new_string(hdr.run_id));
    json_object_object_add(rec, "log_version", json_mini::new_string(hdr.log_version));
    json_object_object_add(rec, "step", json_object_new_int(step));
    json_object_object_add(rec, "ts", json_mini::new_string(ts));
    return rec;
}

} // namespace

std::string canonicalize_json(const std::string& raw) {
    json_mini::Doc d = json_mini::parse(raw);
    if (!d) return raw;
    return canonical(d.root);
}

JsonlLogger::JsonlLogger(const RunHeader& hdr, const std::string& path)
    : hdr_(hdr), path_(path), out_(path, std::ios::out | std::ios::trunc), chain_prev_(std::string(64, '0')) {}

void JsonlLogger::event(int step, const std::string& name, const std::string& payload_json) {
    std::lock_guard<std::mutex> lk(mu_);
    const std::string ts = iso_now();
    const std::string payload = canonicalize_json(payload_json);

    json_object* rec = build_record(hdr_, step, name, payload, ts);
    const std::string record = canonical(rec);
    const std::string chain_hash = hash::sha256_hex(chain_prev_ + record);

    json_object_object_add(rec, "chain_hash", json_mini::new_string(chain_hash));
    json_object_object_add(rec, "chain_prev", json_mini::new_string(chain_prev_));
    out_ << canonical(rec) << "\n";
    out_.flush();
    json_object_put(rec);

    chain_prev_ = chain_hash;
}

bool verify_run_log(const std::string& path, std::string* err) {
    std::ifstream in(path);
    if (!in) {
        if (err) *err = "cannot open " + path;
        return false;
    }
    std::string prev(64, '0');
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        lineno++;
        if (line.empty()) continue;
        json_mini::Doc d = json_mini::parse(line);
        if (!d || !json_object_is_type(d.root, json_type_object)) {
            if (err) *err = "line " + std::to_string(lineno) + ": not a JSON object";
            return false;
        }
        auto hash_v = json_mini::field_string(d.root, "chain_hash");
        auto prev_v = json_mini::field_string(d.root, "chain_prev");
        if (!hash_v || !prev_v || *prev_v != prev) {
            if (err) *err = "line " + std::to_string(lineno) + ": chain_prev mismatch";
            return false;
        }
        json_object_object_del(d.root, "chain_hash");
        json_object_object_del(d.root, "chain_prev");
        if (hash::sha256_hex(prev + canonical(d.root)) != *hash_v) {
            if (err) *err = "line " + std::to_string(lineno) + ": chain_hash mismatch";
            return false;
        }
        prev = *hash_v;
    }
    return true;
}

} // namespace codeloop
