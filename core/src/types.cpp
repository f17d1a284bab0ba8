#include "codeloop/types.h"

namespace codeloop {

const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE: return "NONE";
        case ErrorKind::UNSUPPORTED_LANGUAGE: return "UNSUPPORTED_LANGUAGE";
        case ErrorKind::COMPILE_FAILURE: return "COMPILE_FAILURE";
        case ErrorKind::RUNTIME_FAILURE: return "RUNTIME_FAILURE";
        case ErrorKind::TIMEOUT: return "TIMEOUT";
        case ErrorKind::SERVICE_UNAVAILABLE: return "SERVICE_UNAVAILABLE";
        case ErrorKind::TOOLCHAIN_UNAVAILABLE: return "TOOLCHAIN_UNAVAILABLE";
        case ErrorKind::CANCELLED: return "CANCELLED";
        case ErrorKind::INTERNAL: return "INTERNAL";
    }
    return "INTERNAL";
}

bool parse_error_kind(const std::string& s, ErrorKind* out) {
    static const ErrorKind all[] = {
        ErrorKind::NONE, ErrorKind::UNSUPPORTED_LANGUAGE, ErrorKind::COMPILE_FAILURE,
        ErrorKind::RUNTIME_FAILURE, ErrorKind::TIMEOUT, ErrorKind::SERVICE_UNAVAILABLE,
        ErrorKind::TOOLCHAIN_UNAVAILABLE, ErrorKind::CANCELLED, ErrorKind::INTERNAL,
    };
    for (ErrorKind k : all) {
        if (s == error_kind_name(k)) {
            if (out) *out = k;
            return true;
        }
    }
    return false;
}

const char* timeout_phase_name(TimeoutPhase p) {
    switch (p) {
        case TimeoutPhase::NONE: return "NONE";
        case TimeoutPhase::COMPILE: return "COMPILE";
        case TimeoutPhase::RUN: return "RUN";
        case TimeoutPhase::WORKFLOW: return "WORKFLOW";
    }
    return "NONE";
}

bool parse_timeout_phase(const std::string& s, TimeoutPhase* out) {
    static const TimeoutPhase all[] = {
        TimeoutPhase::NONE, TimeoutPhase::COMPILE, TimeoutPhase::RUN, TimeoutPhase::WORKFLOW,
    };
    for (TimeoutPhase p : all) {
        if (s == timeout_phase_name(p)) {
            if (out) *out = p;
            return true;
        }
    }
    return false;
}

const ExecutionResult* BatchResult::find(const std::string& key) const {
    for (const auto& kv : results) {
        if (kv.first == key) return &kv.second;
    }
    return nullptr;
}

} // namespace codeloop
