#pragma once

#include <boost/program_options.hpp>

#include <optional>
#include <string>

#include "codec/token_input.hpp"
#include "conf/rauthctl_config.hpp"
#include "util/client_data_provider.hpp"

namespace po = boost::program_options;

namespace rauthctl {

// Token inputs shared by the `token` and `headers` subcommands.
struct TokenCliOptions {
  rauth::codec::TokenRequest request;
  std::optional<std::string> fingerprint;
  bool detect_device{false};
  bool development{false};
};

// Options bound to `options`; call collect_token_options after parsing.
po::options_description token_options_description(TokenCliOptions &options);

void collect_token_options(const po::variables_map &vm,
                           TokenCliOptions &options);

// Client data: the local device probe when requested (flag or config), with
// an explicit --fingerprint taking precedence over the probed one.
rauth::codec::ResolveContext
make_resolve_context(const TokenCliOptions &options,
                     const RauthctlConfig &config,
                     rauth::device::IClientDataProvider &client_data_provider);

} // namespace rauthctl
