#pragma once

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include "boost/di.hpp"
#include "conf/config_sources.hpp"
#include "conf/rauthctl_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/conf_handler.hpp"
#include "handlers/decode_handler.hpp"
#include "handlers/handler_dispatcher.hpp"
#include "handlers/headers_handler.hpp"
#include "handlers/i_handler.hpp"
#include "handlers/info_handler.hpp"
#include "handlers/token_handler.hpp"
#include "my_error_codes.hpp"
#include "rauthctl_common.hpp"
#include "util/client_data_provider.hpp"

namespace di = boost::di;
namespace rauthctl {

// Handlers are created per dispatch; the factory resolves a subcommand name
// through the injector that owns it.
inline auto make_handler_module() {
  return di::make_injector(
      di::bind<rauthctl::TokenHandler>().in(di::unique),
      di::bind<rauthctl::DecodeHandler>().in(di::unique),
      di::bind<rauthctl::HeadersHandler>().in(di::unique),
      di::bind<rauthctl::InfoHandler>().in(di::unique),
      di::bind<rauthctl::ConfHandler>().in(di::unique),
      di::bind<rauthctl::IHandlerFactory>().to(
          [](const auto &inj) -> rauthctl::IHandlerFactory & {
            static rauthctl::HandlerFactoryImpl factory(
                [&inj](const std::string &subcmd)
                    -> std::shared_ptr<rauthctl::IHandler> {
                  if (subcmd == "token") {
                    return inj.template create<
                        std::shared_ptr<rauthctl::TokenHandler>>();
                  } else if (subcmd == "decode") {
                    return inj.template create<
                        std::shared_ptr<rauthctl::DecodeHandler>>();
                  } else if (subcmd == "headers") {
                    return inj.template create<
                        std::shared_ptr<rauthctl::HeadersHandler>>();
                  } else if (subcmd == "info") {
                    return inj.template create<
                        std::shared_ptr<rauthctl::InfoHandler>>();
                  } else if (subcmd == "conf") {
                    return inj.template create<
                        std::shared_ptr<rauthctl::ConfHandler>>();
                  }
                  throw rauthctl::UnknownSubcommand(subcmd);
                });
            return factory;
          }));
}

class App : public std::enable_shared_from_this<App> {
  rauthctl::CliCtx &cli_ctx_;
  rauth::ConfigSources &config_sources_;
  customio::ConsoleOutput *output_hub_{nullptr};
  int exit_code_{EXIT_SUCCESS};

public:
  App(rauth::ConfigSources &config_sources, rauthctl::CliCtx &cli_ctx)
      : cli_ctx_(cli_ctx), config_sources_(config_sources) {}

  void print_error(const HandlerError &err) {
    if (err.code == my_errors::GENERAL::SHOW_OPT_DESC) {
      std::cerr << err.what << std::endl;
    } else {
      output_hub_->error() << err << std::endl;
    }
  }

  int start() {
    static customio::ConsoleOutput output_hub(cli_ctx_.verbosity_level());

    auto injector = di::make_injector(
        make_handler_module(),
        di::bind<rauth::ConfigSources>().to(config_sources_),
        di::bind<rauthctl::IRauthctlConfigProvider>()
            .to<rauthctl::RauthctlConfigProviderFile>(),
        di::bind<rauth::device::IClientDataProvider>()
            .to<rauth::device::SystemClientDataProvider>(),
        di::bind<customio::ConsoleOutput>().to(output_hub),
        di::bind<rauthctl::CliCtx>().to(cli_ctx_));

    output_hub_ = &injector.template create<customio::ConsoleOutput &>();

    output_hub_->debug() << "Config source directories:" << std::endl;
    for (const auto &source : config_sources_.paths_) {
      output_hub_->debug() << " - " << source.string() << std::endl;
    }

    auto &dispatcher =
        injector.template create<rauthctl::HandlerDispatcher &>();

    auto self = this->shared_from_this();
    bool dispatched =
        dispatcher.dispatch_run(cli_ctx_.params.subcmd, [self](auto &&r) {
          if (r) {
            self->print_error(*r);
            self->exit_code_ = EXIT_FAILURE;
          } else {
            self->output_hub_->debug()
                << "Handler completed successfully." << std::endl;
          }
        });

    if (!dispatched) {
      output_hub_->error()
          << fmt::format("No valid subcommand provided{}. Available: token, "
                         "decode, headers, info, conf.",
                         cli_ctx_.params.subcmd.empty()
                             ? std::string{}
                             : " ('" + cli_ctx_.params.subcmd + "')")
          << std::endl;
      return EXIT_FAILURE;
    }
    return exit_code_;
  }
};

inline int launch(rauth::ConfigSources &config, rauthctl::CliCtx &ctx) {
  auto app = std::make_shared<rauthctl::App>(config, ctx);
  return app->start();
}

} // namespace rauthctl
