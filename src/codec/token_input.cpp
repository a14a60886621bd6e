#include "codec/token_input.hpp"

#include <cctype>
#include <chrono>

#include "codec/wrapping_int32.hpp"

namespace rauth {
namespace codec {

namespace {

bool has_text(const std::optional<std::string> &v) {
  return v.has_value() && !v->empty();
}

// First non-empty candidate wins.
std::string pick(const std::optional<std::string> &first,
                 const std::optional<std::string> &second,
                 const std::string &fallback) {
  if (has_text(first)) {
    return *first;
  }
  if (has_text(second)) {
    return *second;
  }
  return fallback;
}

} // namespace

std::int64_t system_unix_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::optional<std::int32_t> parse_timestamp(std::string_view text) {
  std::size_t pos = 0;
  while (pos < text.size() &&
         std::isspace(static_cast<unsigned char>(text[pos]))) {
    ++pos;
  }
  bool negative = false;
  if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    negative = text[pos] == '-';
    ++pos;
  }
  // Accumulate modulo 2^32; the result is the wrapped value of the full
  // decimal number whatever its length.
  std::uint32_t acc = 0;
  std::size_t digits = 0;
  while (pos < text.size() &&
         std::isdigit(static_cast<unsigned char>(text[pos]))) {
    acc = acc * 10u + static_cast<std::uint32_t>(text[pos] - '0');
    ++pos;
    ++digits;
  }
  if (digits == 0) {
    return std::nullopt;
  }
  if (negative) {
    acc = 0u - acc;
  }
  return WrappingInt32::from_bits(acc).value();
}

TokenInput resolve_token_input(const TokenRequest &request,
                               const ResolveContext &ctx) {
  const ClientData client = ctx.client.value_or(ClientData{});

  TokenInput input;
  if (has_text(client.fingerprint)) {
    input.device_identifier =
        std::string(kFingerprintPrefix) + *client.fingerprint;
  } else if (has_text(request.device_identifier)) {
    input.device_identifier =
        std::string(kFingerprintPrefix) + *request.device_identifier;
  } else {
    input.device_identifier = ctx.defaults.device_identifier;
  }

  input.serial_number =
      pick(request.serial_number, std::nullopt, ctx.defaults.serial_number);
  input.device_model =
      pick(client.device_model, request.device_model, ctx.defaults.device_model);
  input.os = pick(client.os, request.os, ctx.defaults.os);
  input.is_development = ctx.is_development;

  std::optional<std::int32_t> ts;
  if (has_text(request.timestamp)) {
    ts = parse_timestamp(*request.timestamp);
  }
  if (!ts) {
    const std::int64_t now =
        ctx.now_seconds ? ctx.now_seconds() : system_unix_seconds();
    ts = WrappingInt32::wrap(now).value();
  }
  input.timestamp = *ts;
  return input;
}

} // namespace codec
} // namespace rauth
