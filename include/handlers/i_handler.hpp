#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace rauthctl {

struct HandlerError {
  int code;
  std::string what;
};

inline std::ostream &operator<<(std::ostream &os, const HandlerError &err) {
  return os << "[" << err.code << "] " << err.what;
}

using HandlerResult = std::optional<HandlerError>;

// Thrown by a handler factory for a subcommand it does not know.
struct UnknownSubcommand : std::runtime_error {
  explicit UnknownSubcommand(const std::string &subcmd)
      : std::runtime_error("Unsupported subcommand: " + subcmd) {}
};

// IHandlerFactory
struct IHandlerFactory {
  virtual ~IHandlerFactory() = default;
  // Create a new instance of the handler
  virtual std::shared_ptr<class IHandler> create(const std::string &subcmd) = 0;
};

// Minimal common contract for subcommand handlers
struct IHandler {
  virtual ~IHandler() = default;
  // The subcommand name this handler responds to (e.g., "token", "decode")
  virtual std::string command() const = 0;
  // Execute the handler's main work; std::nullopt on success.
  virtual HandlerResult start() = 0;
};

struct HandlerFactoryImpl : public IHandlerFactory {
  using CreatorFunc =
      std::function<std::shared_ptr<IHandler>(const std::string &subcmd)>;
  CreatorFunc creator_;

  explicit HandlerFactoryImpl(CreatorFunc creator)
      : creator_(std::move(creator)) {}

  std::shared_ptr<IHandler> create(const std::string &subcmd) override {
    return creator_(subcmd);
  }
};

} // namespace rauthctl
