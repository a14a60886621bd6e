#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include "codec/seed_generator.hpp"

namespace rauth {
namespace codec {

class TokenFormatError : public std::runtime_error {
public:
  TokenFormatError(int code, const std::string &what)
      : std::runtime_error(what), code_(code) {}

  int code() const noexcept { return code_; }

private:
  int code_;
};

// What the verifier recovers from a token.
struct DecodedToken {
  Seed seed{};
  std::string field_string;
  std::string device_identifier;
  std::string serial_number;
  std::int32_t timestamp{0};
  std::string device_model;
  std::string os;
  std::string platform_tag;
  std::string api_version;
  bool is_development{false};
  // derive_seed(timestamp) equals the embedded seed.
  bool seed_matches{false};
};

// Inverse of encode_token. Throws TokenFormatError (codes in
// my_errors::TOKEN) when the token cannot be decoded.
DecodedToken decode_token(std::string_view token);

} // namespace codec
} // namespace rauth
