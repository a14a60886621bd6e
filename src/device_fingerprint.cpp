#include "util/device_fingerprint.hpp"

#include <fstream>
#include <sstream>
#ifdef _WIN32
#include <winsock2.h>
#pragma comment(lib, "ws2_32.lib")
#else
#include <unistd.h>
#endif

#include "openssl/openssl_raii.hpp"  // for sha256_hex

namespace rauth {
namespace device {

namespace {

// Value of the first line in `path` starting with `key_prefix`, prefix
// stripped. Empty when the file or key is missing.
std::string read_keyed_value(const std::string &path,
                             const std::string &key_prefix) {
  std::ifstream ifs(path);
  if (!ifs.is_open()) return {};
  std::string line;
  while (std::getline(ifs, line)) {
    if (line.rfind(key_prefix, 0) == 0) {
      return line.substr(key_prefix.size());
    }
  }
  return {};
}

std::string unquote(std::string v) {
  if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
    return v.substr(1, v.size() - 2);
  }
  return v;
}

std::string os_pretty_name() {
#if defined(__linux__)
  auto v = unquote(read_keyed_value("/etc/os-release", "PRETTY_NAME="));
  return v.empty() ? "Linux (unknown)" : v;
#elif defined(__APPLE__)
  return "macOS";
#elif defined(_WIN32) || defined(_WIN64)
  return "Windows";
#elif defined(__ANDROID__)
  return "Android";
#else
  return "Unknown";
#endif
}

std::string platform_name() {
#if defined(__linux__)
  return "Linux";
#elif defined(__APPLE__)
  return "macOS";
#elif defined(_WIN32) || defined(_WIN64)
  return "Windows";
#elif defined(__ANDROID__)
  return "Android";
#else
  return "Unknown";
#endif
}

std::string model_name() {
#if defined(__linux__)
  // DMI product name when exposed, else the distro id.
  std::ifstream dmi("/sys/class/dmi/id/product_name");
  std::string product;
  if (dmi.is_open() && std::getline(dmi, product) && !product.empty()) {
    return product;
  }
  auto id = unquote(read_keyed_value("/etc/os-release", "ID="));
  return id.empty() ? "Linux" : id;
#else
  return platform_name();
#endif
}

std::string cpu_model() {
#if defined(__linux__)
  auto line = read_keyed_value("/proc/cpuinfo", "model name");
  auto pos = line.find(':');
  if (pos != std::string::npos && pos + 2 <= line.size()) {
    return line.substr(pos + 2);
  }
#endif
  return "Unknown CPU";
}

std::string memory_info() {
#if defined(__linux__)
  auto v = read_keyed_value("/proc/meminfo", "MemTotal:");
  if (!v.empty()) {
    return "MemTotal:" + v;
  }
#endif
  return "Unknown Memory";
}

std::string hostname() {
  char buf[256] = {0};
  if (::gethostname(buf, sizeof(buf)) == 0) {
    return std::string(buf);
  }
  return "unknown-host";
}

}  // namespace

DeviceInfo gather_device_info(const std::string &user_agent) {
  DeviceInfo info;
  info.platform = platform_name();
  info.os_version = os_pretty_name();
  info.model = model_name();
  info.cpu_model = cpu_model();
  info.memory_info = memory_info();
  info.hostname = hostname();
  info.user_agent = user_agent;
  return info;
}

std::string generate_device_fingerprint_hex(const DeviceInfo &info,
                                            const std::string &additional_entropy) {
  std::ostringstream oss;
  oss << info.platform << '|' << info.model << '|' << info.os_version << '|'
      << info.cpu_model << '|' << info.memory_info << '|' << info.hostname
      << '|' << additional_entropy;
  return rauth::opensslutil::sha256_hex(oss.str());
}

std::string device_public_id_from_fingerprint(const std::string &fingerprint_hex) {
  std::string hex32 = fingerprint_hex.size() >= 32 ? fingerprint_hex.substr(0, 32)
                                                   : fingerprint_hex;
  if (hex32.size() < 32) hex32.append(32 - hex32.size(), '0');
  std::ostringstream id;
  id << hex32.substr(0, 8) << '-'
     << hex32.substr(8, 4) << '-'
     << hex32.substr(12, 4) << '-'
     << hex32.substr(16, 4) << '-'
     << hex32.substr(20, 12);
  return id.str();
}

codec::ClientData client_data_from_device(const DeviceInfo &info,
                                          const std::string &additional_entropy) {
  codec::ClientData client;
  client.fingerprint = generate_device_fingerprint_hex(info, additional_entropy)
                           .substr(0, kShortFingerprintLength);
  if (!info.model.empty()) client.device_model = info.model;
  if (!info.os_version.empty()) client.os = info.os_version;
  return client;
}

}  // namespace device
}  // namespace rauth
