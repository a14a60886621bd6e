#include "openssl/openssl_raii.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace rauth {
namespace opensslutil {

namespace {

bool is_base64_char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
         (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace

std::string sha256_hex(const std::string &data) {
  EVP_MD_CTX_ptr context{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!context) throw std::runtime_error("Failed to create context");

  if (1 != EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr)) {
    throw std::runtime_error("Failed to initialize digest");
  }
  if (1 != EVP_DigestUpdate(context.get(), data.c_str(), data.size())) {
    throw std::runtime_error("Failed to update digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (1 != EVP_DigestFinal_ex(context.get(), hash, &length)) {
    throw std::runtime_error("Failed to finalize digest");
  }

  std::stringstream ss;
  for (unsigned int i = 0; i < length; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
  }
  return ss.str();
}

std::string base64_encode(const std::uint8_t *data, size_t len) {
  if (len == 0) {
    return {};
  }
  // EVP_EncodeBlock writes 4 chars per 3-byte group plus a NUL.
  std::string out(4 * ((len + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                                data, static_cast<int>(len));
  if (written < 0) {
    throw std::runtime_error("EVP_EncodeBlock failed");
  }
  out.resize(static_cast<size_t>(written));
  return out;
}

std::string base64_encode(const std::vector<std::uint8_t> &data) {
  return base64_encode(data.data(), data.size());
}

std::optional<std::vector<std::uint8_t>> base64_decode(std::string_view text) {
  if (text.empty()) {
    return std::vector<std::uint8_t>{};
  }
  if (text.size() % 4 != 0) {
    return std::nullopt;
  }
  size_t padding = 0;
  if (text.back() == '=') {
    ++padding;
    if (text[text.size() - 2] == '=') {
      ++padding;
    }
  }
  for (size_t i = 0; i < text.size() - padding; ++i) {
    if (!is_base64_char(text[i])) {
      return std::nullopt;
    }
  }

  // EVP_DecodeBlock keeps the zero bytes produced by padding; trim them.
  std::vector<std::uint8_t> out(3 * (text.size() / 4));
  int written =
      EVP_DecodeBlock(out.data(),
                      reinterpret_cast<const unsigned char *>(text.data()),
                      static_cast<int>(text.size()));
  if (written < 0 || static_cast<size_t>(written) < padding) {
    return std::nullopt;
  }
  out.resize(static_cast<size_t>(written) - padding);
  return out;
}

} // namespace opensslutil
} // namespace rauth
