#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "openssl/openssl_raii.hpp"
#include "util/device_fingerprint.hpp"

namespace {

rauth::device::DeviceInfo make_base_info() {
  rauth::device::DeviceInfo info;
  info.platform = "Linux";
  info.os_version = "Ubuntu 22.04";
  info.model = "Ubuntu";
  info.cpu_model = "Intel(R) Xeon(R)";
  info.memory_info = "MemTotal: 32785472 kB";
  info.hostname = "mail-gateway-01";
  info.user_agent = "rauth-ctl/1.0.0";
  return info;
}

TEST(DeviceFingerprintTest, StableAcrossUserAgentChanges) {
  auto info_v1 = make_base_info();
  auto fingerprint_v1 = rauth::device::generate_device_fingerprint_hex(info_v1);

  auto info_v2 = info_v1;
  info_v2.user_agent = "rauth-ctl/2.0.0";
  auto fingerprint_v2 = rauth::device::generate_device_fingerprint_hex(info_v2);

  EXPECT_EQ(fingerprint_v1, fingerprint_v2);
  EXPECT_EQ(rauth::device::device_public_id_from_fingerprint(fingerprint_v1),
            rauth::device::device_public_id_from_fingerprint(fingerprint_v2));
}

TEST(DeviceFingerprintTest, ChangesWhenStableTraitChanges) {
  auto base_info = make_base_info();
  auto baseline = rauth::device::generate_device_fingerprint_hex(base_info);

  auto moved_host = base_info;
  moved_host.hostname = "mail-gateway-02";
  auto moved_fp = rauth::device::generate_device_fingerprint_hex(moved_host);

  EXPECT_NE(baseline, moved_fp);
  EXPECT_NE(rauth::device::device_public_id_from_fingerprint(baseline),
            rauth::device::device_public_id_from_fingerprint(moved_fp));
}

TEST(DeviceFingerprintTest, EntropyChangesFingerprint) {
  auto info = make_base_info();
  EXPECT_NE(rauth::device::generate_device_fingerprint_hex(info),
            rauth::device::generate_device_fingerprint_hex(info, "salt"));
}

TEST(DeviceFingerprintTest, PublicIdLayout) {
  auto id = rauth::device::device_public_id_from_fingerprint(
      "0123456789abcdef0123456789abcdefffff");
  EXPECT_EQ(id, "01234567-89ab-cdef-0123-456789abcdef");
  EXPECT_EQ(rauth::device::device_public_id_from_fingerprint("ab"),
            "ab000000-0000-0000-0000-000000000000");
}

TEST(DeviceFingerprintTest, ClientDataForCodec) {
  auto info = make_base_info();
  auto client = rauth::device::client_data_from_device(info);
  ASSERT_TRUE(client.fingerprint.has_value());
  EXPECT_EQ(client.fingerprint->size(), rauth::device::kShortFingerprintLength);
  EXPECT_EQ(*client.fingerprint,
            rauth::device::generate_device_fingerprint_hex(info).substr(
                0, rauth::device::kShortFingerprintLength));
  EXPECT_EQ(client.device_model, "Ubuntu");
  EXPECT_EQ(client.os, "Ubuntu 22.04");
}

TEST(DeviceFingerprintTest, ClientDataLeavesUnknownTraitsEmpty) {
  rauth::device::DeviceInfo info;
  info.hostname = "h";
  auto client = rauth::device::client_data_from_device(info);
  EXPECT_TRUE(client.fingerprint.has_value());
  EXPECT_FALSE(client.device_model.has_value());
  EXPECT_FALSE(client.os.has_value());
}

TEST(OpensslUtilTest, Sha256Hex) {
  EXPECT_EQ(rauth::opensslutil::sha256_hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(OpensslUtilTest, Base64StandardAlphabetWithPadding) {
  std::vector<std::uint8_t> bytes{0xfb, 0xff, 0xbf, 0x41};
  EXPECT_EQ(rauth::opensslutil::base64_encode(bytes), "+/+/QQ==");
  auto back = rauth::opensslutil::base64_decode("+/+/QQ==");
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(*back, bytes);
}

TEST(OpensslUtilTest, Base64RejectsUrlSafeAlphabetAndBadLength) {
  EXPECT_FALSE(rauth::opensslutil::base64_decode("-_-_QQ==").has_value());
  EXPECT_FALSE(rauth::opensslutil::base64_decode("QQ=").has_value());
  EXPECT_FALSE(rauth::opensslutil::base64_decode("Q=Q=").has_value());
}

} // namespace
