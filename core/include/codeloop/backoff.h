#pragma once

#include <atomic>
#include <cstdint>

namespace codeloop {

// Delay before attempt `next_attempt` (2 = first retry):
// base * mult^(next_attempt - 2), capped at max_ms (when > 0), plus up to
// jitter_ms of jitter.
int64_t backoff_delay_ms(int next_attempt,
                         int64_t base_ms,
                         int64_t mult,
                         int64_t max_ms,
                         int64_t jitter_ms = 0);

// Sleep in short slices. Returns false if *cancel became true first.
bool sleep_interruptible_ms(int64_t ms, const std::atomic<bool>* cancel);

} // namespace codeloop
