#include "codeloop/ids.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <sstream>

#if defined(__linux__)
  #include <sys/random.h>
#endif

namespace codeloop {

std::string gen_run_id() {
    const char* det = std::getenv("CODELOOP_DETERMINISTIC_RUN_ID");

    uint64_t seed = 0;
    if (det && std::string(det) == "1") {
        seed = 1234567ULL;
    } else {
        uint64_t t = (uint64_t)std::chrono::high_resolution_clock::now().time_since_epoch().count();
        uint32_t r1 = 0, r2 = 0;
        if (secure_rand32(&r1) && secure_rand32(&r2)) {
            seed = t ^ (((uint64_t)r1 << 32) | r2);
        } else {
            seed = t ^ 0x9e3779b97f4a7c15ULL;
        }
    }

    std::mt19937_64 rng{seed};
    uint64_t a = rng();
    uint64_t b = rng();
    std::ostringstream oss;
    oss << std::hex << a << b;
    return oss.str();
}

bool secure_rand32(uint32_t* out) {
    if (!out) return false;
    uint32_t v = 0;
#if defined(__linux__)
    if (::getrandom(&v, sizeof(v), 0) == (ssize_t)sizeof(v)) {
        *out = v;
        return true;
    }
#endif
    FILE* f = std::fopen("/dev/urandom", "rb");
    if (!f) return false;
    size_t got = std::fread(&v, sizeof(v), 1, f);
    std::fclose(f);
    if (got != 1) return false;
    *out = v;
    return true;
}

} // namespace codeloop
