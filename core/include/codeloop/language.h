#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace codeloop {

// Toolchain description for one canonical language id. Command templates are
// argv vectors; the placeholders {src}, {exe}, {dir} and {class} are expanded
// by the executor for each invocation.
struct LanguageRuntime {
    std::string id;                       // canonical: "python", "java", ...
    std::string extension;                // ".py"
    std::vector<std::string> compile_cmd; // empty: no compile step
    std::vector<std::string> run_cmd;
    bool interpreted{true};
    std::string default_basename;         // "program"; java uses the class name

    // Resource hints. 0 disables the limit; the JVM, node and cc1plus reserve
    // far more address space than they use.
    size_t run_as_mb{512};
    size_t compile_as_mb{0};

    bool compiled() const { return !compile_cmd.empty(); }
};

// Lower-case, trim and fold aliases ("c++" -> "cpp", "py" -> "python", ...).
// Unknown names are returned lower-cased and trimmed.
std::string normalize_language(const std::string& name);

// nullptr when the (normalized) language is not supported.
const LanguageRuntime* find_language_runtime(const std::string& name);

// All runtimes, in registry order.
const std::vector<LanguageRuntime>& language_runtimes();

// Names accepted on the wire: "python, java, javascript, cpp, c++".
const std::vector<std::string>& supported_language_names();

// Comma separated supported_language_names(), for error messages.
std::string supported_languages_csv();

} // namespace codeloop
