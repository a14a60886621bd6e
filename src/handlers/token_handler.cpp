#include "handlers/token_handler.hpp"

#include <boost/log/sources/record_ostream.hpp>

#include "codec/rauth_token.hpp"

namespace rauthctl {

namespace trivial = boost::log::trivial;

TokenHandler::TokenHandler(
    rauthctl::IRauthctlConfigProvider &config_provider,
    rauth::device::IClientDataProvider &client_data_provider,
    customio::ConsoleOutput &output_hub, CliCtx &cli_ctx)
    : config_provider_(config_provider),
      client_data_provider_(client_data_provider), output_hub_(output_hub),
      cli_ctx_(cli_ctx), opt_desc_("token subcommand options") {
  opt_desc_.add(token_options_description(options_));
  opt_desc_.add_options()(
      "plaintext", po::bool_switch(&show_plaintext_)->default_value(false),
      "also print the seed and the field string");

  po::variables_map vm;
  po::store(po::command_line_parser(cli_ctx_.unrecognized)
                .options(opt_desc_)
                .allow_unregistered()
                .run(),
            vm);
  po::notify(vm);
  collect_token_options(vm, options_);
  output_hub_.trace() << "TokenHandler initialized with options: "
                      << opt_desc_ << std::endl;
}

HandlerResult TokenHandler::start() {
  auto ctx = make_resolve_context(options_, config_provider_.get(),
                                  client_data_provider_);
  auto input = rauth::codec::resolve_token_input(options_.request, ctx);
  auto trace = rauth::codec::trace_token(input);

  BOOST_LOG_SEV(lg, trivial::trace)
      << "resolved token input: sn=" << input.serial_number
      << " model=" << input.device_model << " os=" << input.os
      << " dev=" << input.is_development;
  BOOST_LOG_SEV(lg, trivial::info)
      << "issued token for " << input.device_identifier << " at "
      << input.timestamp;

  if (show_plaintext_) {
    output_hub_.out() << "seed:   " << rauth::codec::seed_hex(trace.seed)
                      << '\n'
                      << "fields: " << trace.field_string << '\n'
                      << "token:  " << trace.token << std::endl;
  } else {
    output_hub_.out() << trace.token << std::endl;
  }
  return std::nullopt;
}

} // namespace rauthctl
