#pragma once

#include <boost/json.hpp>
#include <boost/log/trivial.hpp>

#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

#include "codec/auth_headers.hpp"
#include "codec/token_input.hpp"
#include "conf/config_sources.hpp"

// Development flag baked in at build time (CMake option RAUTHCTL_DEVELOPMENT).
#ifndef RAUTHCTL_DEVELOPMENT_DEFAULT
#define RAUTHCTL_DEVELOPMENT_DEFAULT 0
#endif

namespace rauthctl {

namespace json = boost::json;

inline std::string json_string_or(const json::object &obj, const char *key,
                                  const std::string &fallback) {
  if (auto *p = obj.if_contains(key)) {
    if (!p->is_string()) {
      throw std::runtime_error(std::string("config key '") + key +
                               "' must be a string");
    }
    return std::string(p->as_string().c_str());
  }
  return fallback;
}

struct RauthctlConfig {
  std::string verbose{};
  std::string api_base_url{"https://api.redstrim.com"};
  std::string auth_header_name{
      std::string(rauth::codec::kDefaultAuthHeaderName)};
  bool is_development{RAUTHCTL_DEVELOPMENT_DEFAULT != 0};
  bool use_device_fingerprint{false};
  rauth::codec::TokenDefaults token_defaults{};

  friend RauthctlConfig tag_invoke(const json::value_to_tag<RauthctlConfig> &,
                                   const json::value &jv) {
    auto *jo_p = jv.if_object();
    if (!jo_p) {
      throw std::runtime_error("RauthctlConfig is not an object");
    }
    RauthctlConfig cc{};
    cc.verbose = json_string_or(*jo_p, "verbose", cc.verbose);
    cc.api_base_url = json_string_or(*jo_p, "api_base_url", cc.api_base_url);
    cc.auth_header_name =
        json_string_or(*jo_p, "auth_header_name", cc.auth_header_name);
    if (!rauth::codec::is_valid_header_name(cc.auth_header_name)) {
      throw std::runtime_error(
          "config key 'auth_header_name' must be a non-empty HTTP token");
    }
    if (auto *p = jo_p->if_contains("is_development")) {
      if (!p->is_bool()) {
        throw std::runtime_error("config key 'is_development' must be a bool");
      }
      cc.is_development = p->as_bool();
    } else {
      BOOST_LOG_TRIVIAL(debug)
          << "is_development not found, using build default "
          << cc.is_development;
    }
    if (auto *p = jo_p->if_contains("use_device_fingerprint")) {
      if (!p->is_bool()) {
        throw std::runtime_error(
            "config key 'use_device_fingerprint' must be a bool");
      }
      cc.use_device_fingerprint = p->as_bool();
    }
    if (auto *p = jo_p->if_contains("token_defaults")) {
      if (!p->is_object()) {
        throw std::runtime_error("config key 'token_defaults' must be an object");
      }
      const auto &td = p->as_object();
      auto &d = cc.token_defaults;
      d.device_identifier =
          json_string_or(td, "device_identifier", d.device_identifier);
      d.serial_number = json_string_or(td, "serial_number", d.serial_number);
      d.device_model = json_string_or(td, "device_model", d.device_model);
      d.os = json_string_or(td, "os", d.os);
    }
    return cc;
  }
};

// RAUTHCTL_ENV=development forces the flag on, any other value forces it off.
inline bool resolve_development_mode(const RauthctlConfig &config) {
  if (const char *env = std::getenv("RAUTHCTL_ENV"); env && *env) {
    return std::string(env) == "development";
  }
  return config.is_development;
}

class IRauthctlConfigProvider {
public:
  virtual ~IRauthctlConfigProvider() = default;

  virtual const RauthctlConfig &get() const = 0;
  virtual RauthctlConfig &get() = 0;

  // Persists `content` into the override layer. Returns an error message on
  // failure.
  virtual std::optional<std::string> save(const json::object &content) = 0;
};

class RauthctlConfigProviderFile : public IRauthctlConfigProvider {
  RauthctlConfig config_;
  rauth::ConfigSources &config_sources_;

public:
  explicit RauthctlConfigProviderFile(rauth::ConfigSources &config_sources);

  const RauthctlConfig &get() const override { return config_; }
  RauthctlConfig &get() override { return config_; }

  std::optional<std::string> save(const json::object &content) override;
};

} // namespace rauthctl
