#include "codeloop/classifier.h"

#include <algorithm>
#include <cctype>

namespace codeloop {

namespace {

const char* const kFailureTokens[] = {
    "traceback",
    "exception",
    "error",
    "failed",
    "failure",
    "timed out",
    "segmentation fault",
    "core dumped",
    "panic",
};

const char* const kSuccessPhrases[] = {
    "executed successfully",
    "completed successfully",
    "all tests passed",
    "success",
    "passed",
};

const char* const kRefusalPhrases[] = {
    "i'm sorry",
    "i am sorry",
    "i cannot",
    "i can't",
    "unable to",
    "i apologize",
    "as an ai",
};

template <size_t N>
const char* first_match(const std::string& hay, const char* const (&needles)[N]) {
    for (const char* n : needles) {
        if (hay.find(n) != std::string::npos) return n;
    }
    return nullptr;
}

} // namespace

const char* verdict_name(Verdict v) {
    switch (v) {
        case Verdict::MATCHED_FAILURE: return "MATCHED_FAILURE";
        case Verdict::MATCHED_SUCCESS: return "MATCHED_SUCCESS";
        case Verdict::MATCHED_REFUSAL: return "MATCHED_REFUSAL";
        case Verdict::AMBIGUOUS: return "AMBIGUOUS";
    }
    return "AMBIGUOUS";
}

Classification classify(const std::string& text) {
    Classification c;
    c.text = text;

    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return (char)std::tolower(ch); });

    if (const char* m = first_match(lower, kFailureTokens)) {
        c.succeeded = false;
        c.verdict = Verdict::MATCHED_FAILURE;
        c.matched = m;
    } else if (const char* m2 = first_match(lower, kSuccessPhrases)) {
        c.succeeded = true;
        c.verdict = Verdict::MATCHED_SUCCESS;
        c.matched = m2;
    } else if (const char* m3 = first_match(lower, kRefusalPhrases)) {
        c.succeeded = false;
        c.verdict = Verdict::MATCHED_REFUSAL;
        c.matched = m3;
    } else {
        c.succeeded = true;
        c.verdict = Verdict::AMBIGUOUS;
    }
    return c;
}

} // namespace codeloop
