#pragma once
#include <cstdint>
#include <string>

namespace codeloop {

// Hex run identifier. CODELOOP_DETERMINISTIC_RUN_ID=1 pins the seed (tests, replays).
std::string gen_run_id();

// Cryptographically secure 32-bit random (getrandom, then /dev/urandom).
// Returns false only if neither source is usable.
bool secure_rand32(uint32_t* out);

} // namespace codeloop
