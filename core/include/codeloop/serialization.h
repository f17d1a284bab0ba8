#pragma once

#include "codeloop/state.h"
#include "codeloop/types.h"

#include <json-c/json.h>

#include <string>
#include <vector>

namespace codeloop {

// --- ExecutionResult ---
// Wire keys: success, output, error, execution_time, language, plus stderr,
// exit_code, error_kind, timeout_phase, output_truncated.

json_object* execution_result_to_json(const ExecutionResult& r);
bool execution_result_from_json(json_object* o, ExecutionResult* out);

// --- Batch ---

// {"success":true,"results":{"snippet_0":{...},...},"summary":{total,successful,failed}}
json_object* batch_result_to_json(const BatchResult& b);

// Decode the "code_snippets" array of a batch request. Elements that are not
// objects or lack code/language come back with invalid_reason set.
std::vector<BatchSnippet> batch_snippets_from_json(json_object* arr);

// --- Other sandbox replies ---

json_object* syntax_check_to_json(const SyntaxCheck& s);
json_object* language_info_to_json(const LanguageInfo& info);

// --- Workflow report ---

json_object* workflow_state_to_json(const WorkflowState& st);

// Serialize and release.
std::string json_take_string(json_object* o);

} // namespace codeloop
