#pragma once

#include <string>

#include "codec/seed_generator.hpp"
#include "codec/token_input.hpp"

namespace rauth {
namespace codec {

// Intermediate values of one encoding, for diagnostics.
struct TokenTrace {
  Seed seed{};
  std::string field_string;
  std::string token;
};

// seed -> plaintext -> cipher -> base64. Pure; identical input gives an
// identical token.
std::string encode_token(const TokenInput &input);

// Resolves defaults first, then encodes.
std::string encode_token(const TokenRequest &request,
                         const ResolveContext &ctx);

TokenTrace trace_token(const TokenInput &input);

// Length of the token for a field string of `field_bytes` bytes:
// ceil((4 + field_bytes) / 3) * 4.
constexpr std::size_t token_length_for(std::size_t field_bytes) {
  return ((kSeedSize + field_bytes + 2) / 3) * 4;
}

} // namespace codec
} // namespace rauth
