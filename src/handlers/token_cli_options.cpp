#include "handlers/token_cli_options.hpp"

namespace rauthctl {

namespace {

void copy_if_present(const po::variables_map &vm, const char *name,
                     std::optional<std::string> &target) {
  if (vm.count(name)) {
    target = vm[name].as<std::string>();
  }
}

} // namespace

po::options_description token_options_description(TokenCliOptions &options) {
  po::options_description desc("Token Options");
  desc.add_options()
      ("device-identifier", po::value<std::string>(),
       "bare device identifier, sent as web-fingerprint-<value>; ignored when a "
       "client fingerprint is available")
      ("sn", po::value<std::string>(), "device serial number")
      ("timestamp", po::value<std::string>(),
       "unix seconds (base 10); current time when absent or unparsable. "
       "Use --timestamp=-N for negative values.")
      ("device-model", po::value<std::string>(), "device model")
      ("os", po::value<std::string>(), "operating system string")
      ("fingerprint", po::value<std::string>(),
       "client fingerprint; identifier becomes web-fingerprint-<value>")
      ("detect-device",
       po::bool_switch(&options.detect_device)->default_value(false),
       "use the local device fingerprint, model and OS")
      ("development",
       po::bool_switch(&options.development)->default_value(false),
       "mark the token as issued by a development build");
  return desc;
}

void collect_token_options(const po::variables_map &vm,
                           TokenCliOptions &options) {
  copy_if_present(vm, "device-identifier", options.request.device_identifier);
  copy_if_present(vm, "sn", options.request.serial_number);
  copy_if_present(vm, "timestamp", options.request.timestamp);
  copy_if_present(vm, "device-model", options.request.device_model);
  copy_if_present(vm, "os", options.request.os);
  copy_if_present(vm, "fingerprint", options.fingerprint);
}

rauth::codec::ResolveContext
make_resolve_context(const TokenCliOptions &options,
                     const RauthctlConfig &config,
                     rauth::device::IClientDataProvider &client_data_provider) {
  rauth::codec::ResolveContext ctx;
  ctx.defaults = config.token_defaults;
  ctx.is_development = options.development || resolve_development_mode(config);

  if (options.detect_device || config.use_device_fingerprint) {
    ctx.client = client_data_provider.client_data();
  }
  if (options.fingerprint && !options.fingerprint->empty()) {
    if (!ctx.client) {
      ctx.client = rauth::codec::ClientData{};
    }
    ctx.client->fingerprint = options.fingerprint;
  }
  return ctx;
}

} // namespace rauthctl
