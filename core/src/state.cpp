#include "codeloop/state.h"

namespace codeloop {

const char* phase_name(Phase p) {
    switch (p) {
        case Phase::GENERATE: return "generate";
        case Phase::EXECUTE: return "execute";
        case Phase::EVALUATE: return "evaluate";
        case Phase::DONE: return "done";
    }
    return "done";
}

const char* exec_status_name(ExecStatus s) {
    switch (s) {
        case ExecStatus::NONE: return "none";
        case ExecStatus::SUCCESS: return "success";
        case ExecStatus::FAILURE: return "failure";
    }
    return "none";
}

const char* outcome_name(Outcome o) {
    switch (o) {
        case Outcome::RUNNING: return "running";
        case Outcome::SATISFIED: return "satisfied";
        case Outcome::EXHAUSTED: return "exhausted";
        case Outcome::CANCELLED: return "cancelled";
        case Outcome::ABORTED: return "aborted";
    }
    return "aborted";
}

} // namespace codeloop
