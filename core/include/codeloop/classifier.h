#pragma once

#include <string>

namespace codeloop {

enum class Verdict {
    MATCHED_FAILURE,
    MATCHED_SUCCESS,
    MATCHED_REFUSAL,
    AMBIGUOUS,       // nothing matched; reported as success
};

struct Classification {
    bool succeeded{true};
    std::string text;      // the input, unchanged
    Verdict verdict{Verdict::AMBIGUOUS};
    std::string matched;   // the phrase that decided, empty when AMBIGUOUS
};

const char* verdict_name(Verdict v);

// Decide success or failure of free-text output. Failure tokens are checked
// first, then success phrases, then refusal phrases. Pure and deterministic.
Classification classify(const std::string& text);

} // namespace codeloop
