#pragma once

#include <optional>
#include <string>

#include "codec/token_input.hpp"
#include "util/device_fingerprint.hpp"

namespace rauth {
namespace device {

// Source of the externally supplied client data handed to the codec.
class IClientDataProvider {
public:
  virtual ~IClientDataProvider() = default;

  virtual DeviceInfo device_info() = 0;
  virtual codec::ClientData client_data() = 0;
};

// Probes the local machine once and caches the result.
class SystemClientDataProvider : public IClientDataProvider {
  std::optional<DeviceInfo> info_;

public:
  DeviceInfo device_info() override {
    if (!info_) {
      info_ = gather_device_info();
    }
    return *info_;
  }

  codec::ClientData client_data() override {
    return client_data_from_device(device_info());
  }
};

}  // namespace device
}  // namespace rauth
