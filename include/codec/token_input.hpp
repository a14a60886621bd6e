#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace rauth {
namespace codec {

inline constexpr std::string_view kFingerprintPrefix = "web-fingerprint-";

// Fallback literals the verifier expects when no real device metadata is
// available. Overridable through configuration, but these values must stay
// the defaults.
struct TokenDefaults {
  std::string device_identifier{"web-fingerprint-fb9cd3a645fe5jim"};
  std::string serial_number{"sn-85845426"};
  std::string device_model{"device_model-65656565"};
  std::string os{"windows"};
};

// Device metadata supplied from outside the codec (a fingerprint cookie, the
// local device probe, ...). Takes precedence over caller-supplied values.
struct ClientData {
  std::optional<std::string> fingerprint;
  std::optional<std::string> device_model;
  std::optional<std::string> os;
};

// Caller inputs; any of them may be missing. Empty strings count as missing.
// device_identifier is the bare fingerprint; kFingerprintPrefix is prepended
// on resolution.
struct TokenRequest {
  std::optional<std::string> device_identifier;
  std::optional<std::string> serial_number;
  std::optional<std::string> timestamp;
  std::optional<std::string> device_model;
  std::optional<std::string> os;
};

// Fully resolved codec input.
struct TokenInput {
  std::string device_identifier;
  std::string serial_number;
  std::int32_t timestamp{0};
  std::string device_model;
  std::string os;
  bool is_development{false};
};

using SecondsClock = std::function<std::int64_t()>;

struct ResolveContext {
  std::optional<ClientData> client;
  TokenDefaults defaults{};
  bool is_development{false};
  // Wall clock in seconds since the epoch; system clock when empty.
  SecondsClock now_seconds{};
};

std::int64_t system_unix_seconds();

// Parses a base-10 integer prefix: leading whitespace is skipped, an optional
// sign is accepted, at least one digit is required and anything after the
// digits is ignored. The value wraps modulo 2^32 into int32, and the wrapped
// value is what both the seed and the payload carry.
std::optional<std::int32_t> parse_timestamp(std::string_view text);

// Applies the default policy. Pure and silent: an unparsable timestamp becomes
// the current time.
TokenInput resolve_token_input(const TokenRequest &request,
                               const ResolveContext &ctx);

} // namespace codec
} // namespace rauth
