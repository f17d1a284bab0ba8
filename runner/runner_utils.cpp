#include "runner_utils.h"

#include "codeloop/serialization.h"

#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace codeloop {

namespace {
std::atomic<bool> g_cancel{false};

void on_cancel_signal(int) {
    g_cancel.store(true);
}
} // namespace

void set_env_if_missing(const char* key, const std::string& value) {
    if (std::getenv(key) != nullptr) return;
    setenv(key, value.c_str(), 0);
}

std::string slurp(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open: " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void print_json(json_object* o) {
    std::cout << json_take_string(o) << "\n";
    std::cout.flush();
}

void install_cancel_handlers() {
    struct sigaction sa {};
    sa.sa_handler = on_cancel_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

const std::atomic<bool>* cancel_flag() {
    return &g_cancel;
}

} // namespace codeloop
