#pragma once
#include <array>
#include <cstdint>
#include <string>

namespace codeloop::hash {

// SHA-256, used for the run log hash chain.
std::array<uint8_t, 32> sha256_bytes(const uint8_t* data, size_t n);
std::string sha256_hex(const std::string& s);

} // namespace codeloop::hash
