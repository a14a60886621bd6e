#pragma once

#include <boost/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace rauth {

struct LoggingConfig {
  std::string level{"info"};
  std::string log_dir{"logs"};
  std::string log_file{"rauthctl"};
  std::uint64_t rotation_size{10 * 1024 * 1024};

  friend LoggingConfig tag_invoke(const boost::json::value_to_tag<LoggingConfig> &,
                                  const boost::json::value &jv) {
    if (!jv.is_object()) {
      throw std::runtime_error("LoggingConfig is not an object");
    }
    const auto &obj = jv.as_object();
    LoggingConfig lc{};
    if (auto *p = obj.if_contains("level"); p && p->is_string()) {
      lc.level = std::string(p->as_string().c_str());
    }
    if (auto *p = obj.if_contains("log_dir"); p && p->is_string()) {
      lc.log_dir = std::string(p->as_string().c_str());
    }
    if (auto *p = obj.if_contains("log_file"); p && p->is_string()) {
      lc.log_file = std::string(p->as_string().c_str());
    }
    if (auto *p = obj.if_contains("rotation_size")) {
      if (p->is_uint64()) {
        lc.rotation_size = p->as_uint64();
      } else if (p->is_int64() && p->as_int64() > 0) {
        lc.rotation_size = static_cast<std::uint64_t>(p->as_int64());
      } else {
        throw std::runtime_error("LoggingConfig.rotation_size must be a positive integer");
      }
    }
    return lc;
  }
};

} // namespace rauth
