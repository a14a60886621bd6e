#include "handlers/info_handler.hpp"

#include <fmt/format.h>

#include "codec/token_input.hpp"
#include "util/device_fingerprint.hpp"
#include "version.h"

namespace rauthctl {

InfoHandler::InfoHandler(
    rauthctl::IRauthctlConfigProvider &config_provider,
    rauth::device::IClientDataProvider &client_data_provider,
    customio::ConsoleOutput &output_hub)
    : config_provider_(config_provider),
      client_data_provider_(client_data_provider), output_hub_(output_hub) {}

HandlerResult InfoHandler::start() {
  const auto info = client_data_provider_.device_info();
  const auto fingerprint = rauth::device::generate_device_fingerprint_hex(info);
  const auto client = client_data_provider_.client_data();
  const auto &config = config_provider_.get();

  auto &out = output_hub_.out();
  out << fmt::format("rauth-ctl {}\n", MYAPP_VERSION)
      << fmt::format("platform:          {}\n", info.platform)
      << fmt::format("os_version:        {}\n", info.os_version)
      << fmt::format("model:             {}\n", info.model)
      << fmt::format("cpu_model:         {}\n", info.cpu_model)
      << fmt::format("memory:            {}\n", info.memory_info)
      << fmt::format("hostname:          {}\n", info.hostname)
      << fmt::format("fingerprint:       {}\n", fingerprint)
      << fmt::format("device_public_id:  {}\n",
                     rauth::device::device_public_id_from_fingerprint(fingerprint))
      << fmt::format("device_identifier: {}{}\n",
                     rauth::codec::kFingerprintPrefix,
                     client.fingerprint.value_or(""))
      << fmt::format("development:       {}\n", resolve_development_mode(config))
      << fmt::format("api_base_url:      {}", config.api_base_url) << std::endl;
  return std::nullopt;
}

} // namespace rauthctl
