#pragma once

#include <boost/log/trivial.hpp>

#include <exception>
#include <functional>
#include <string>
#include <utility>

#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "my_error_codes.hpp"

namespace rauthctl {

// Lifetime: created through DI inside App::start and kept for the duration
// of the CLI session. Handler instances come from the factory per dispatch.
class HandlerDispatcher {
  customio::ConsoleOutput &output_;
  IHandlerFactory &handler_factory_;

public:
  HandlerDispatcher(customio::ConsoleOutput &out,
                    IHandlerFactory &handler_factory)
      : output_(out), handler_factory_(handler_factory) {}

  // Returns false when no handler exists for `subcmd`; otherwise runs it and
  // hands the result to `cont`.
  bool dispatch_run(const std::string &subcmd,
                    std::function<void(HandlerResult &&)> cont) {
    std::shared_ptr<IHandler> handler;
    try {
      handler = handler_factory_.create(subcmd);
    } catch (const UnknownSubcommand &ex) {
      BOOST_LOG_TRIVIAL(debug) << ex.what();
      return false;
    } catch (const std::exception &ex) {
      // Option parsing in a handler constructor failed.
      cont(HandlerError{my_errors::GENERAL::INVALID_ARGUMENT, ex.what()});
      return true;
    }
    output_.debug() << "dispatching to handler: " << handler->command()
                    << std::endl;
    cont(handler->start());
    return true;
  }
};

} // namespace rauthctl
