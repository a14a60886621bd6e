#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "codec/payload_builder.hpp"
#include "codec/rauth_token.hpp"
#include "codec/stream_cipher.hpp"
#include "codec/token_decoder.hpp"
#include "my_error_codes.hpp"
#include "openssl/openssl_raii.hpp"

namespace {

using namespace rauth::codec;

// Encodes an arbitrary field string the way the generator would, so malformed
// payloads can be produced.
std::string encode_raw(const Seed &seed, const std::string &fields) {
  auto buf = build_plaintext(seed, fields);
  apply_stream_cipher(buf);
  return rauth::opensslutil::base64_encode(buf);
}

int decode_error_code(const std::string &token) {
  try {
    decode_token(token);
  } catch (const TokenFormatError &ex) {
    return ex.code();
  }
  return 0;
}

TEST(TokenDecoderTest, RecoversFieldsOfKnownToken) {
  auto decoded = decode_token(
      "AAATE0j+LzKoodibwVPdHdms1/ehOaxUBSGavQ2uWrwkr44GhYsWLUd6hrZeSLau5MlSumcGO7M=");
  EXPECT_EQ(decoded.seed, (Seed{0, 0, 19, 19}));
  EXPECT_EQ(decoded.device_identifier, "web-fingerprint-test");
  EXPECT_EQ(decoded.serial_number, "sn-1");
  EXPECT_EQ(decoded.timestamp, 0);
  EXPECT_EQ(decoded.device_model, "model-1");
  EXPECT_EQ(decoded.os, "linux");
  EXPECT_EQ(decoded.platform_tag, "Web");
  EXPECT_EQ(decoded.api_version, "3");
  EXPECT_TRUE(decoded.is_development);
  EXPECT_TRUE(decoded.seed_matches);
}

TEST(TokenDecoderTest, InvertsEncoder) {
  TokenInput input{.device_identifier = "web-fingerprint-0f1e2d3c4b5a6978",
                   .serial_number = "sn-85845426",
                   .timestamp = -123456,
                   .device_model = "ThinkPad X1",
                   .os = "Ubuntu 22.04.4 LTS",
                   .is_development = false};
  auto decoded = decode_token(encode_token(input));
  EXPECT_EQ(decoded.field_string, build_field_string(input));
  EXPECT_EQ(decoded.timestamp, input.timestamp);
  EXPECT_EQ(decoded.device_model, input.device_model);
  EXPECT_FALSE(decoded.is_development);
  EXPECT_TRUE(decoded.seed_matches);
}

TEST(TokenDecoderTest, ReportsSeedMismatch) {
  auto token = encode_raw(Seed{1, 2, 3, 4},
                          "id|sn|1700000000|model|os|Web|3|false");
  auto decoded = decode_token(token);
  EXPECT_EQ(decoded.timestamp, 1700000000);
  EXPECT_FALSE(decoded.seed_matches);
}

TEST(TokenDecoderTest, RejectsMalformedBase64) {
  EXPECT_EQ(decode_error_code("not base64!"),
            my_errors::TOKEN::MALFORMED_BASE64);
  EXPECT_EQ(decode_error_code("AAATE0j"), my_errors::TOKEN::MALFORMED_BASE64);
}

TEST(TokenDecoderTest, RejectsSeedOnlyToken) {
  EXPECT_EQ(decode_error_code(""), my_errors::TOKEN::TOO_SHORT);
  EXPECT_EQ(decode_error_code("AAATEw=="), my_errors::TOKEN::TOO_SHORT);
}

TEST(TokenDecoderTest, RejectsWrongFieldCount) {
  auto token = encode_raw(derive_seed(0), "id|sn|0|model|os|Web|3");
  EXPECT_EQ(decode_error_code(token), my_errors::TOKEN::FIELD_COUNT);
}

TEST(TokenDecoderTest, RejectsNonNumericTimestamp) {
  auto token = encode_raw(derive_seed(0), "id|sn|soon|model|os|Web|3|false");
  EXPECT_EQ(decode_error_code(token), my_errors::TOKEN::BAD_TIMESTAMP);
}

} // namespace
