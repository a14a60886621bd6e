#pragma once

#include <boost/program_options.hpp>

#include <optional>
#include <string>

#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "rauthctl_common.hpp"

namespace rauthctl {

// `decode <token>`: runs the verifier side of the codec and prints the
// recovered fields.
class DecodeHandler : public IHandler {
  customio::ConsoleOutput &output_hub_;
  CliCtx &cli_ctx_;
  po::options_description opt_desc_;
  std::optional<std::string> token_;

public:
  DecodeHandler(customio::ConsoleOutput &output_hub, CliCtx &cli_ctx);

  std::string command() const override { return "decode"; }

  std::string print_opt_desc() const;

  HandlerResult start() override;
};

} // namespace rauthctl
