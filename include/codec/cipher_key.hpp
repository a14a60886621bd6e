#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace rauth {
namespace codec {

inline constexpr std::size_t kCipherKeySize = 64;

// Shared with the remote verifier. Must never change.
inline constexpr std::array<std::uint8_t, kCipherKeySize> kCipherKey{
    0x09, 0x9d, 0xc8, 0x96, 0x3f, 0x9b, 0x5e, 0x0c, //
    0xce, 0xc8, 0xa5, 0xef, 0xa4, 0x21, 0xbe, 0x7c, //
    0xb0, 0xc2, 0xb0, 0xc9, 0xd5, 0x5c, 0xcc, 0x33, //
    0x79, 0x52, 0xe7, 0x83, 0x3c, 0xd2, 0x79, 0xd3, //
    0x49, 0xc0, 0xf9, 0x70, 0xe9, 0xa6, 0x34, 0x42, //
    0x2b, 0x13, 0xfb, 0xd0, 0x26, 0x34, 0xf2, 0xd8, //
    0x86, 0xb5, 0x72, 0xd5, 0x13, 0x74, 0x5d, 0xc5, //
    0xb2, 0xaa, 0x4d, 0x68, 0x3f, 0x1a, 0xaa, 0x6e};

} // namespace codec
} // namespace rauth
