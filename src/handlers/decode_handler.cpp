#include "handlers/decode_handler.hpp"

#include <boost/log/trivial.hpp>
#include <fmt/format.h>

#include <sstream>

#include "codec/token_decoder.hpp"
#include "my_error_codes.hpp"

namespace rauthctl {

DecodeHandler::DecodeHandler(customio::ConsoleOutput &output_hub,
                             CliCtx &cli_ctx)
    : output_hub_(output_hub), cli_ctx_(cli_ctx),
      opt_desc_("decode subcommand options") {
  opt_desc_.add_options()("token", po::value<std::string>(),
                          "token to decode (or pass it positionally)");
  po::variables_map vm;
  po::store(po::command_line_parser(cli_ctx_.unrecognized)
                .options(opt_desc_)
                .allow_unregistered()
                .run(),
            vm);
  po::notify(vm);
  if (vm.count("token")) {
    token_ = vm["token"].as<std::string>();
  } else {
    token_ = cli_ctx_.subcommand_argument();
  }
}

std::string DecodeHandler::print_opt_desc() const {
  std::ostringstream oss;
  oss << "Usage: \nrauth-ctl decode <token>\n" << opt_desc_ << std::endl;
  return oss.str();
}

HandlerResult DecodeHandler::start() {
  if (!token_ || token_->empty()) {
    return HandlerError{my_errors::GENERAL::SHOW_OPT_DESC, print_opt_desc()};
  }
  try {
    auto decoded = rauth::codec::decode_token(*token_);
    auto &out = output_hub_.out();
    out << fmt::format("seed:              {}\n",
                       rauth::codec::seed_hex(decoded.seed))
        << fmt::format("device_identifier: {}\n", decoded.device_identifier)
        << fmt::format("serial_number:     {}\n", decoded.serial_number)
        << fmt::format("timestamp:         {}\n", decoded.timestamp)
        << fmt::format("device_model:      {}\n", decoded.device_model)
        << fmt::format("os:                {}\n", decoded.os)
        << fmt::format("platform:          {}\n", decoded.platform_tag)
        << fmt::format("api_version:       {}\n", decoded.api_version)
        << fmt::format("is_development:    {}\n", decoded.is_development)
        << fmt::format("seed_check:        {}",
                       decoded.seed_matches ? "ok" : "MISMATCH")
        << std::endl;
    if (!decoded.seed_matches) {
      return HandlerError{my_errors::GENERAL::UNEXPECTED_RESULT,
                          "seed does not match the embedded timestamp"};
    }
    return std::nullopt;
  } catch (const rauth::codec::TokenFormatError &ex) {
    BOOST_LOG_TRIVIAL(warning) << "decode failed: " << ex.what();
    return HandlerError{ex.code(), ex.what()};
  }
}

} // namespace rauthctl
