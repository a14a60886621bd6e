#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace rauth {
namespace codec {

inline constexpr std::size_t kSeedSize = 4;

using Seed = std::array<std::uint8_t, kSeedSize>;

// Derives the 4 seed bytes from a timestamp. The result depends on nothing
// else, so the verifier can recompute it from the decoded timestamp field.
//
//   r = ts; r = (r << 21) ^ (r << 19) ^ r; r = r * 251 + 19   (int32, wrapping)
//   b0..b3 = big-endian bytes of r
//   b0 ^= b1; b1 ^= b2; b2 ^= b3; b3 ^= original b0
Seed derive_seed(std::int32_t timestamp);

// Lower-case hex, 8 characters.
std::string seed_hex(const Seed &seed);

} // namespace codec
} // namespace rauth
