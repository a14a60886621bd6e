#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "codec/seed_generator.hpp"
#include "codec/token_input.hpp"

namespace rauth {
namespace codec {

inline constexpr char kFieldDelimiter = '|';
inline constexpr std::string_view kPlatformTag = "Web";
inline constexpr int kApiVersion = 3;
inline constexpr std::size_t kFieldCount = 8;

// deviceIdentifier|serialNumber|timestamp|deviceModel|os|Web|3|true_or_false
std::string build_field_string(const TokenInput &input);

// Seed bytes followed by the UTF-8 bytes of the field string, nothing else.
std::vector<std::uint8_t> build_plaintext(const Seed &seed,
                                          std::string_view field_string);

} // namespace codec
} // namespace rauth
