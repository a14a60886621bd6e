#include "codec/token_decoder.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <vector>

#include "codec/payload_builder.hpp"
#include "codec/stream_cipher.hpp"
#include "my_error_codes.hpp"
#include "openssl/openssl_raii.hpp"

namespace rauth {
namespace codec {

namespace {

std::vector<std::string> split_fields(const std::string &s) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t pos = s.find(kFieldDelimiter, start);
    if (pos == std::string::npos) {
      parts.push_back(s.substr(start));
      break;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
  return parts;
}

std::int32_t parse_timestamp_field(const std::string &field) {
  std::int32_t value = 0;
  const char *first = field.data();
  const char *last = field.data() + field.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (field.empty() || ec != std::errc{} || ptr != last) {
    throw TokenFormatError(
        my_errors::TOKEN::BAD_TIMESTAMP,
        fmt::format("timestamp field '{}' is not a 32-bit integer", field));
  }
  return value;
}

} // namespace

DecodedToken decode_token(std::string_view token) {
  auto bytes = opensslutil::base64_decode(token);
  if (!bytes) {
    throw TokenFormatError(my_errors::TOKEN::MALFORMED_BASE64,
                           "token is not valid base64");
  }
  if (bytes->size() <= kSeedSize) {
    throw TokenFormatError(
        my_errors::TOKEN::TOO_SHORT,
        fmt::format("token holds {} bytes, need more than {}", bytes->size(),
                    kSeedSize));
  }

  // The seed prefix is left untouched by the cipher, so the same transform
  // recovers the plaintext.
  apply_stream_cipher(*bytes);

  DecodedToken out;
  std::copy_n(bytes->begin(), kSeedSize, out.seed.begin());
  out.field_string.assign(bytes->begin() + kSeedSize, bytes->end());

  auto fields = split_fields(out.field_string);
  if (fields.size() != kFieldCount) {
    throw TokenFormatError(
        my_errors::TOKEN::FIELD_COUNT,
        fmt::format("payload has {} fields, expected {}", fields.size(),
                    kFieldCount));
  }
  out.device_identifier = fields[0];
  out.serial_number = fields[1];
  out.timestamp = parse_timestamp_field(fields[2]);
  out.device_model = fields[3];
  out.os = fields[4];
  out.platform_tag = fields[5];
  out.api_version = fields[6];
  out.is_development = fields[7] == "true";
  out.seed_matches = derive_seed(out.timestamp) == out.seed;
  return out;
}

} // namespace codec
} // namespace rauth
