#pragma once

#include <openssl/evp.h>
#include <stddef.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rauth {
namespace opensslutil {

using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

// Hex-encoded SHA-256 digest. Throws std::runtime_error on OpenSSL failure.
std::string sha256_hex(const std::string &data);

// Standard alphabet (RFC 4648 section 4) with '=' padding, no line breaks.
std::string base64_encode(const std::uint8_t *data, size_t len);
std::string base64_encode(const std::vector<std::uint8_t> &data);

// Strict decoder for the same alphabet: length must be a multiple of 4,
// padding only at the end, no whitespace. Returns std::nullopt on any
// malformed input.
std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view text);

} // namespace opensslutil
} // namespace rauth
