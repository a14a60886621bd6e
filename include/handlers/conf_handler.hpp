#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <array>
#include <string>
#include <string_view>

#include "conf/config_sources.hpp"
#include "conf/rauthctl_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "rauthctl_common.hpp"

namespace rauthctl {

// Top-level application.json keys `conf set` accepts.
inline constexpr std::array<std::string_view, 6> kConfigurableKeys{
    "verbose",        "api_base_url",           "auth_header_name",
    "is_development", "use_device_fingerprint", "token_defaults"};

class ConfHandler : public IHandler {
  rauth::ConfigSources &config_sources_;
  rauthctl::IRauthctlConfigProvider &config_provider_;
  customio::ConsoleOutput &output_hub_;
  CliCtx &cli_ctx_;
  boost::log::sources::severity_logger<boost::log::trivial::severity_level> lg;

public:
  ConfHandler(rauth::ConfigSources &config_sources,
              rauthctl::IRauthctlConfigProvider &config_provider,
              customio::ConsoleOutput &output_hub, CliCtx &cli_ctx);

  std::string command() const override { return "conf"; }

  std::string print_opt_desc() const {
    return "Usage: \nrauth-ctl conf get <key>\nrauth-ctl conf set <key> "
           "<value>\n";
  }

  HandlerResult start() override;

private:
  HandlerResult get_value(const std::string &key);
  HandlerResult set_value(const std::string &key, const std::string &value);
};

} // namespace rauthctl
