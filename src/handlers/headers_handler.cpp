#include "handlers/headers_handler.hpp"

#include <boost/beast/http/fields.hpp>

#include <sstream>

#include "codec/auth_headers.hpp"
#include "codec/rauth_token.hpp"
#include "my_error_codes.hpp"

namespace rauthctl {

namespace http = boost::beast::http;

HeadersHandler::HeadersHandler(
    rauthctl::IRauthctlConfigProvider &config_provider,
    rauth::device::IClientDataProvider &client_data_provider,
    customio::ConsoleOutput &output_hub, CliCtx &cli_ctx)
    : config_provider_(config_provider),
      client_data_provider_(client_data_provider), output_hub_(output_hub),
      cli_ctx_(cli_ctx), opt_desc_("headers subcommand options") {
  po::options_description header_opts("Header Options");
  header_opts.add_options()
      ("jwt", po::value<std::string>(), "bearer credential from the login exchange")
      ("rauth", po::value<std::string>(),
       "use this R-Auth token instead of generating one");
  opt_desc_.add(header_opts).add(token_options_description(options_));

  po::variables_map vm;
  po::store(po::command_line_parser(cli_ctx_.unrecognized)
                .options(opt_desc_)
                .allow_unregistered()
                .run(),
            vm);
  po::notify(vm);
  collect_token_options(vm, options_);
  if (vm.count("jwt")) {
    jwt_ = vm["jwt"].as<std::string>();
  }
  if (vm.count("rauth")) {
    rauth_token_ = vm["rauth"].as<std::string>();
  }
}

std::string HeadersHandler::print_opt_desc() const {
  std::ostringstream oss;
  oss << "Usage: \nrauth-ctl headers --jwt <token> [token options]\n"
      << opt_desc_ << std::endl;
  return oss.str();
}

HandlerResult HeadersHandler::start() {
  if (!jwt_ || jwt_->empty()) {
    return HandlerError{my_errors::GENERAL::SHOW_OPT_DESC, print_opt_desc()};
  }
  const auto &config = config_provider_.get();
  std::string rauth_token;
  if (rauth_token_ && !rauth_token_->empty()) {
    rauth_token = *rauth_token_;
  } else {
    auto ctx = make_resolve_context(options_, config, client_data_provider_);
    rauth_token = rauth::codec::encode_token(options_.request, ctx);
  }

  http::fields fields;
  rauth::codec::apply_auth_headers(
      fields, rauth::codec::make_auth_headers(*jwt_, rauth_token),
      config.auth_header_name);
  for (const auto &f : fields) {
    output_hub_.out() << f.name_string() << ": " << f.value() << '\n';
  }
  output_hub_.out().flush();
  return std::nullopt;
}

} // namespace rauthctl
