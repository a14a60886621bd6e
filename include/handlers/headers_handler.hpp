#pragma once

#include <boost/program_options.hpp>

#include <optional>
#include <string>

#include "conf/rauthctl_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "handlers/token_cli_options.hpp"
#include "rauthctl_common.hpp"
#include "util/client_data_provider.hpp"

namespace rauthctl {

// `headers --jwt <token>`: prints the header set a client sends to the API
// and the broadcasting auth endpoint.
class HeadersHandler : public IHandler {
  rauthctl::IRauthctlConfigProvider &config_provider_;
  rauth::device::IClientDataProvider &client_data_provider_;
  customio::ConsoleOutput &output_hub_;
  CliCtx &cli_ctx_;

  po::options_description opt_desc_;
  TokenCliOptions options_;
  std::optional<std::string> jwt_;
  std::optional<std::string> rauth_token_;

public:
  HeadersHandler(rauthctl::IRauthctlConfigProvider &config_provider,
                 rauth::device::IClientDataProvider &client_data_provider,
                 customio::ConsoleOutput &output_hub, CliCtx &cli_ctx);

  std::string command() const override { return "headers"; }

  std::string print_opt_desc() const;

  HandlerResult start() override;
};

} // namespace rauthctl
