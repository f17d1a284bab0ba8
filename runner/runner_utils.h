#pragma once

#include <json-c/json.h>

#include <atomic>
#include <string>

namespace codeloop {

void set_env_if_missing(const char* key, const std::string& value);

// Whole file; throws std::runtime_error if it cannot be opened.
std::string slurp(const std::string& path);

// Print and release a reply object, newline terminated.
void print_json(json_object* o);

// SIGINT / SIGTERM flip this flag; the workflow polls it.
void install_cancel_handlers();
const std::atomic<bool>* cancel_flag();

} // namespace codeloop
