#include "codeloop/language.h"

#include <algorithm>
#include <cctype>

namespace codeloop {

namespace {

std::vector<LanguageRuntime> build_registry() {
    std::vector<LanguageRuntime> v;

    LanguageRuntime py;
    py.id = "python";
    py.extension = ".py";
    py.run_cmd = {"python3", "{src}"};
    py.interpreted = true;
    py.default_basename = "program";
    py.run_as_mb = 1024;
    v.push_back(py);

    LanguageRuntime java;
    java.id = "java";
    java.extension = ".java";
    java.compile_cmd = {"javac", "{src}"};
    java.run_cmd = {"java", "-cp", "{dir}", "{class}"};
    java.interpreted = false;
    java.default_basename = "Main";
    java.run_as_mb = 0;
    v.push_back(java);

    LanguageRuntime js;
    js.id = "javascript";
    js.extension = ".js";
    js.run_cmd = {"node", "{src}"};
    js.interpreted = true;
    js.default_basename = "program";
    js.run_as_mb = 0;
    v.push_back(js);

    LanguageRuntime cpp;
    cpp.id = "cpp";
    cpp.extension = ".cpp";
    cpp.compile_cmd = {"g++", "-o", "{exe}", "{src}"};
    cpp.run_cmd = {"{exe}"};
    cpp.interpreted = false;
    cpp.default_basename = "program";
    cpp.run_as_mb = 1024;
    v.push_back(cpp);

    return v;
}

std::string trim_lower(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    std::string out = s.substr(b, e - b);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return out;
}

} // namespace

std::string normalize_language(const std::string& name) {
    std::string n = trim_lower(name);
    if (n == "c++" || n == "cxx") return "cpp";
    if (n == "py" || n == "python3") return "python";
    if (n == "js" || n == "node" || n == "nodejs") return "javascript";
    return n;
}

const std::vector<LanguageRuntime>& language_runtimes() {
    static const std::vector<LanguageRuntime> registry = build_registry();
    return registry;
}

const LanguageRuntime* find_language_runtime(const std::string& name) {
    const std::string id = normalize_language(name);
    for (const auto& rt : language_runtimes()) {
        if (rt.id == id) return &rt;
    }
    return nullptr;
}

const std::vector<std::string>& supported_language_names() {
    static const std::vector<std::string> names = {"python", "java", "javascript", "cpp", "c++"};
    return names;
}

std::string supported_languages_csv() {
    std::string out;
    for (const auto& n : supported_language_names()) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

} // namespace codeloop
