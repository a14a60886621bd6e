#include "conf/config_sources.hpp"

#include <boost/log/trivial.hpp>
#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <stdexcept>

namespace rauth {

namespace json = boost::json;

namespace {

void apply_file(json::object &merged, const fs::path &file) {
  if (!fs::exists(file)) {
    return;
  }
  std::ifstream ifs(file);
  if (!ifs) {
    throw std::runtime_error("Unable to open configuration file: " +
                             file.string());
  }
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  boost::system::error_code ec;
  auto value = json::parse(content, ec);
  if (ec) {
    throw std::runtime_error(fmt::format(
        "Failed to parse configuration file {}: {}", file.string(), ec.message()));
  }
  if (!value.is_object()) {
    throw std::runtime_error("Configuration file is not a JSON object: " +
                             file.string());
  }
  BOOST_LOG_TRIVIAL(trace) << "config layer: " << file.string();
  merge_json_objects(merged, value.as_object());
}

} // namespace

void merge_json_objects(json::object &base, const json::object &overlay) {
  for (const auto &[key, value] : overlay) {
    auto *existing = base.if_contains(key);
    if (existing && existing->is_object() && value.is_object()) {
      merge_json_objects(existing->as_object(), value.as_object());
    } else {
      base[key] = value;
    }
  }
}

ConfigSources::ConfigSources(std::vector<fs::path> paths,
                             std::vector<std::string> profiles)
    : paths_(std::move(paths)), profiles_(std::move(profiles)) {
  if (paths_.empty()) {
    throw std::runtime_error("ConfigSources requires at least one directory");
  }
}

json::object ConfigSources::json_content(const std::string &name) const {
  json::object merged;
  for (const auto &dir : paths_) {
    apply_file(merged, dir / (name + ".json"));
    for (const auto &profile : profiles_) {
      apply_file(merged, dir / (name + "." + profile + ".json"));
    }
    apply_file(merged, dir / (name + ".override.json"));
  }
  return merged;
}

LoggingConfig ConfigSources::logging_config() const {
  return json::value_to<LoggingConfig>(json::value(json_content("log_config")));
}

const fs::path &ConfigSources::writable_dir() const { return paths_.back(); }

} // namespace rauth
