#include "codec/payload_builder.hpp"

#include <fmt/format.h>

namespace rauth {
namespace codec {

std::string build_field_string(const TokenInput &input) {
  return fmt::format("{1}{0}{2}{0}{3}{0}{4}{0}{5}{0}{6}{0}{7}{0}{8}",
                     kFieldDelimiter, input.device_identifier,
                     input.serial_number, input.timestamp, input.device_model,
                     input.os, kPlatformTag, kApiVersion,
                     input.is_development ? "true" : "false");
}

std::vector<std::uint8_t> build_plaintext(const Seed &seed,
                                          std::string_view field_string) {
  std::vector<std::uint8_t> buffer;
  buffer.reserve(seed.size() + field_string.size());
  buffer.insert(buffer.end(), seed.begin(), seed.end());
  // std::string already holds UTF-8; copy the code units verbatim.
  for (char c : field_string) {
    buffer.push_back(static_cast<std::uint8_t>(c));
  }
  return buffer;
}

} // namespace codec
} // namespace rauth
