#pragma once

#include <string>

#include "conf/rauthctl_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "util/client_data_provider.hpp"

namespace rauthctl {

// `info`: device traits and the identifiers derived from them.
class InfoHandler : public IHandler {
  rauthctl::IRauthctlConfigProvider &config_provider_;
  rauth::device::IClientDataProvider &client_data_provider_;
  customio::ConsoleOutput &output_hub_;

public:
  InfoHandler(rauthctl::IRauthctlConfigProvider &config_provider,
              rauth::device::IClientDataProvider &client_data_provider,
              customio::ConsoleOutput &output_hub);

  std::string command() const override { return "info"; }

  HandlerResult start() override;
};

} // namespace rauthctl
