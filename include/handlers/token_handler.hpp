#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/program_options.hpp>

#include <string>

#include "conf/rauthctl_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "handlers/token_cli_options.hpp"
#include "rauthctl_common.hpp"
#include "util/client_data_provider.hpp"

namespace rauthctl {

// `token`: prints an R-Auth token for the given (or default) device metadata.
class TokenHandler : public IHandler {
  rauthctl::IRauthctlConfigProvider &config_provider_;
  rauth::device::IClientDataProvider &client_data_provider_;
  customio::ConsoleOutput &output_hub_;
  CliCtx &cli_ctx_;
  boost::log::sources::severity_logger<boost::log::trivial::severity_level> lg;

  po::options_description opt_desc_;
  TokenCliOptions options_;
  bool show_plaintext_{false};

public:
  TokenHandler(rauthctl::IRauthctlConfigProvider &config_provider,
               rauth::device::IClientDataProvider &client_data_provider,
               customio::ConsoleOutput &output_hub, CliCtx &cli_ctx);

  std::string command() const override { return "token"; }

  HandlerResult start() override;
};

} // namespace rauthctl
