#include "handlers/conf_handler.hpp"

#include <boost/json.hpp>
#include <boost/log/sources/record_ostream.hpp>

#include <algorithm>

#include "my_error_codes.hpp"

namespace rauthctl {

namespace json = boost::json;
namespace trivial = boost::log::trivial;

namespace {

bool is_configurable(const std::string &key) {
  return std::find(kConfigurableKeys.begin(), kConfigurableKeys.end(), key) !=
         kConfigurableKeys.end();
}

// Values that parse as JSON (true, 42, {"os":"linux"}) keep their type;
// anything else is stored as a string.
json::value parse_cli_value(const std::string &raw) {
  boost::system::error_code ec;
  auto jv = json::parse(raw, ec);
  if (ec) {
    return json::value(raw);
  }
  return jv;
}

} // namespace

ConfHandler::ConfHandler(rauth::ConfigSources &config_sources,
                         rauthctl::IRauthctlConfigProvider &config_provider,
                         customio::ConsoleOutput &output_hub, CliCtx &cli_ctx)
    : config_sources_(config_sources), config_provider_(config_provider),
      output_hub_(output_hub), cli_ctx_(cli_ctx) {}

HandlerResult ConfHandler::start() {
  if (cli_ctx_.is_get()) {
    if (auto key = cli_ctx_.get_get_k()) {
      return get_value(*key);
    }
    return HandlerError{my_errors::GENERAL::SHOW_OPT_DESC, print_opt_desc()};
  }
  if (cli_ctx_.is_set()) {
    if (auto kv = cli_ctx_.get_set_kv()) {
      return set_value(kv->first, kv->second);
    }
    return HandlerError{my_errors::GENERAL::SHOW_OPT_DESC, print_opt_desc()};
  }
  return HandlerError{my_errors::GENERAL::SHOW_OPT_DESC, print_opt_desc()};
}

HandlerResult ConfHandler::get_value(const std::string &key) {
  auto merged = config_sources_.json_content("application");
  auto *p = merged.if_contains(key);
  if (!p) {
    return HandlerError{my_errors::GENERAL::NOT_FOUND,
                        "Key not found in configuration: " + key};
  }
  output_hub_.out() << json::serialize(*p) << std::endl;
  return std::nullopt;
}

HandlerResult ConfHandler::set_value(const std::string &key,
                                     const std::string &value) {
  if (!is_configurable(key)) {
    return HandlerError{my_errors::CONFIG::UNKNOWN_KEY,
                        "Unknown configuration key: " + key};
  }
  json::object content;
  content[key] = parse_cli_value(value);
  if (auto err = config_provider_.save(content)) {
    BOOST_LOG_SEV(lg, trivial::error) << "conf set failed: " << *err;
    return HandlerError{my_errors::CONFIG::INVALID_VALUE, *err};
  }
  BOOST_LOG_SEV(lg, trivial::info) << "conf set " << key;
  output_hub_.info() << "Set " << key << " = " << json::serialize(content[key])
                     << std::endl;
  return std::nullopt;
}

} // namespace rauthctl
