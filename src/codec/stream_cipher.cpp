#include "codec/stream_cipher.hpp"

#include "codec/cipher_key.hpp"
#include "codec/seed_generator.hpp"

namespace rauth {
namespace codec {

void apply_stream_cipher(std::vector<std::uint8_t> &buffer) {
  for (std::size_t i = kSeedSize; i < buffer.size(); ++i) {
    buffer[i] = static_cast<std::uint8_t>(
        buffer[i] ^ kCipherKey[i % kCipherKeySize] ^ buffer[i % kSeedSize]);
  }
}

} // namespace codec
} // namespace rauth
