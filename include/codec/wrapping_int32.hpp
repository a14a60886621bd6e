#pragma once

#include <cstdint>

namespace rauth {
namespace codec {

// 32-bit signed integer whose every operation wraps modulo 2^32
// (two's-complement), matching native int32 overflow on the verifier side.
// Bits are held unsigned so shifts and products never overflow a signed type;
// value() reinterprets them as int32_t.
class WrappingInt32 {
public:
  constexpr WrappingInt32() = default;
  constexpr explicit WrappingInt32(std::int32_t v)
      : bits_(static_cast<std::uint32_t>(v)) {}

  static constexpr WrappingInt32 from_bits(std::uint32_t bits) {
    WrappingInt32 w;
    w.bits_ = bits;
    return w;
  }

  // Reduces a wider value modulo 2^32.
  static constexpr WrappingInt32 wrap(std::int64_t v) {
    return from_bits(static_cast<std::uint32_t>(v));
  }

  constexpr std::int32_t value() const {
    return static_cast<std::int32_t>(bits_);
  }
  constexpr std::uint32_t bits() const { return bits_; }

  constexpr WrappingInt32 operator<<(unsigned n) const {
    return from_bits(bits_ << n);
  }
  constexpr WrappingInt32 operator^(WrappingInt32 other) const {
    return from_bits(bits_ ^ other.bits_);
  }
  constexpr WrappingInt32 operator*(std::int32_t factor) const {
    return from_bits(bits_ * static_cast<std::uint32_t>(factor));
  }
  constexpr WrappingInt32 operator+(std::int32_t addend) const {
    return from_bits(bits_ + static_cast<std::uint32_t>(addend));
  }

  // n = 0 is the most significant byte.
  constexpr std::uint8_t byte_be(unsigned n) const {
    return static_cast<std::uint8_t>((bits_ >> (24 - 8 * n)) & 0xFFu);
  }

  friend constexpr bool operator==(WrappingInt32, WrappingInt32) = default;

private:
  std::uint32_t bits_{0};
};

} // namespace codec
} // namespace rauth
