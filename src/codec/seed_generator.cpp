#include "codec/seed_generator.hpp"

#include <fmt/format.h>

#include "codec/wrapping_int32.hpp"

namespace rauth {
namespace codec {

Seed derive_seed(std::int32_t timestamp) {
  WrappingInt32 r(timestamp);
  r = (r << 21) ^ (r << 19) ^ r;
  r = r * 251 + 19;

  std::uint8_t b0 = r.byte_be(0);
  std::uint8_t b1 = r.byte_be(1);
  std::uint8_t b2 = r.byte_be(2);
  std::uint8_t b3 = r.byte_be(3);

  const std::uint8_t tmp = b0;
  b0 = b0 ^ b1;
  b1 = b1 ^ b2;
  b2 = b2 ^ b3;
  b3 = b3 ^ tmp;

  return Seed{b0, b1, b2, b3};
}

std::string seed_hex(const Seed &seed) {
  return fmt::format("{:02x}{:02x}{:02x}{:02x}", seed[0], seed[1], seed[2],
                     seed[3]);
}

} // namespace codec
} // namespace rauth
