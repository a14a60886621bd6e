// Checks the object graph the App builds with Boost.DI:
// - handlers are bound in di::unique scope, so each dispatch gets a fresh one;
// - providers bound to interfaces are shared by every handler of an injector;
// - the handler factory maps subcommand names to handler types and rejects
//   anything else with UnknownSubcommand.
//
// Interface bindings default to di::singleton, which Boost.DI caches per type
// for the whole process, so the config sources they reference are shared by
// every test here. The factory lives in a function-local static that captures
// the first injector asking for it, so only one test requests it.

#include <gtest/gtest.h>

#include <boost/di.hpp>
#include <boost/program_options.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "rauthctl_entry.hpp"
#include "test_config_utils.hpp"

namespace {

namespace di = boost::di;
namespace json = boost::json;

struct CountingClientDataProvider : rauth::device::IClientDataProvider {
  inline static int constructions = 0;
  CountingClientDataProvider() { ++constructions; }

  rauth::device::DeviceInfo device_info() override { return {}; }
  rauth::codec::ClientData client_data() override {
    return rauth::codec::ClientData{.fingerprint = "di"};
  }
};

rauthctl::CliCtx make_ctx(std::vector<std::string> positionals) {
  rauthctl::CliParams params;
  if (!positionals.empty()) {
    params.subcmd = positionals.front();
  }
  std::vector<std::string> unrecognized = positionals;
  return rauthctl::CliCtx(po::variables_map{}, std::move(positionals),
                          std::move(unrecognized), std::move(params));
}

rauth::ConfigSources &shared_sources() {
  static testinfra::ScopedTempDir dir{"di"};
  static rauth::ConfigSources sources = [] {
    testinfra::write_basic_config_files(
        dir.path, json::object{{"api_base_url", "https://di.example"}});
    return rauth::ConfigSources({dir.path}, {"default"});
  }();
  return sources;
}

class DiWiringTest : public ::testing::Test {
protected:
  std::ostringstream out;
  std::ostringstream err;
  customio::ConsoleOutput output{out, err, 0};

  auto make_app_injector(rauthctl::CliCtx &ctx) {
    return di::make_injector(
        rauthctl::make_handler_module(),
        di::bind<rauth::ConfigSources>().to(shared_sources()),
        di::bind<rauthctl::IRauthctlConfigProvider>()
            .to<rauthctl::RauthctlConfigProviderFile>(),
        di::bind<rauth::device::IClientDataProvider>()
            .to<CountingClientDataProvider>(),
        di::bind<customio::ConsoleOutput>().to(output),
        di::bind<rauthctl::CliCtx>().to(ctx));
  }
};

TEST_F(DiWiringTest, HandlersAreUniquePerCreation) {
  auto ctx = make_ctx({"token"});
  auto injector = make_app_injector(ctx);
  auto first = injector.create<std::shared_ptr<rauthctl::TokenHandler>>();
  auto second = injector.create<std::shared_ptr<rauthctl::TokenHandler>>();
  ASSERT_NE(first, nullptr);
  EXPECT_NE(first.get(), second.get());
}

TEST_F(DiWiringTest, ProvidersAreSharedWithinInjector) {
  auto ctx = make_ctx({"info"});
  auto injector = make_app_injector(ctx);
  auto &a = injector.create<rauthctl::IRauthctlConfigProvider &>();
  auto &b = injector.create<rauthctl::IRauthctlConfigProvider &>();
  EXPECT_EQ(&a, &b);
  EXPECT_EQ(a.get().api_base_url, "https://di.example");

  auto info = injector.create<std::shared_ptr<rauthctl::InfoHandler>>();
  auto headers = injector.create<std::shared_ptr<rauthctl::HeadersHandler>>();
  EXPECT_NE(info, nullptr);
  EXPECT_NE(headers, nullptr);
  EXPECT_EQ(CountingClientDataProvider::constructions, 1);
}

TEST_F(DiWiringTest, FactoryResolvesSubcommands) {
  auto ctx = make_ctx({"decode", "AAATEw=="});
  auto injector = make_app_injector(ctx);
  auto &factory = injector.create<rauthctl::IHandlerFactory &>();

  for (const char *name : {"token", "decode", "headers", "info", "conf"}) {
    auto handler = factory.create(name);
    ASSERT_NE(handler, nullptr) << name;
    EXPECT_EQ(handler->command(), name);
  }
  EXPECT_THROW(factory.create("login"), rauthctl::UnknownSubcommand);

  auto &dispatcher = injector.create<rauthctl::HandlerDispatcher &>();
  rauthctl::HandlerResult result;
  EXPECT_TRUE(dispatcher.dispatch_run(
      "decode", [&](rauthctl::HandlerResult &&r) { result = std::move(r); }));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->code, my_errors::TOKEN::TOO_SHORT);
  EXPECT_FALSE(dispatcher.dispatch_run("login",
                                       [](rauthctl::HandlerResult &&) {}));
}

} // namespace
