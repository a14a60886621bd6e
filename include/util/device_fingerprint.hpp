#pragma once

#include <cstddef>
#include <string>

#include "codec/token_input.hpp"

namespace rauth {
namespace device {

// Local traits the fingerprint is derived from.
struct DeviceInfo {
  std::string platform;     // Linux, macOS, Windows, Android
  std::string os_version;   // pretty OS name when available
  std::string model;        // model or distro name where applicable
  std::string cpu_model;
  std::string memory_info;  // e.g. "MemTotal: 32785472 kB" on Linux
  std::string hostname;
  std::string user_agent;   // not part of the fingerprint
};

// Number of hex digits of the digest used as the short client fingerprint.
inline constexpr std::size_t kShortFingerprintLength = 16;

// Best-effort probe (Linux-focused; graceful fallbacks elsewhere).
DeviceInfo gather_device_info(const std::string &user_agent = {});

// Hex-encoded SHA-256 over the stable traits plus optional entropy. The user
// agent is left out so upgrades do not rotate the fingerprint.
std::string generate_device_fingerprint_hex(const DeviceInfo &info,
                                            const std::string &additional_entropy = {});

// 8-4-4-4-12 id built from the first 32 hex chars of the fingerprint.
std::string device_public_id_from_fingerprint(const std::string &fingerprint_hex);

// Client data for the token codec: short fingerprint, model and OS string.
codec::ClientData client_data_from_device(const DeviceInfo &info,
                                          const std::string &additional_entropy = {});

}  // namespace device
}  // namespace rauth
