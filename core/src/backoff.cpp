#include "codeloop/backoff.h"

#include <algorithm>
#include <chrono>
#include <thread>

namespace codeloop {

int64_t backoff_delay_ms(int next_attempt,
                         int64_t base_ms,
                         int64_t mult,
                         int64_t max_ms,
                         int64_t jitter_ms) {
    if (base_ms < 0) base_ms = 0;
    if (mult < 1) mult = 1;
    if (max_ms < 0) max_ms = 0;
    if (jitter_ms < 0) jitter_ms = 0;
    int exp = std::max(0, next_attempt - 2);
    long double d = (long double)base_ms;
    for (int i = 0; i < exp; i++) {
        d *= (long double)mult;
        if (max_ms > 0 && d > (long double)max_ms) break;
    }
    int64_t delay = (int64_t)d;
    if (max_ms > 0 && delay > max_ms) delay = max_ms;
    if (jitter_ms > 0) {
        uint64_t seed = (uint64_t)std::chrono::steady_clock::now().time_since_epoch().count();
        seed ^= (seed << 13);
        seed ^= (seed >> 7);
        seed ^= (seed << 17);
        delay += (int64_t)(seed % (uint64_t)(jitter_ms + 1));
    }
    return delay;
}

bool sleep_interruptible_ms(int64_t ms, const std::atomic<bool>* cancel) {
    using namespace std::chrono;
    const auto until = steady_clock::now() + milliseconds(std::max<int64_t>(0, ms));
    while (true) {
        if (cancel && cancel->load()) return false;
        auto now = steady_clock::now();
        if (now >= until) return true;
        auto slice = std::min<steady_clock::duration>(until - now, milliseconds(20));
        std::this_thread::sleep_for(slice);
    }
}

} // namespace codeloop
