#pragma once

#include <boost/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

#include "conf/logging_config.hpp"

namespace rauth {

namespace fs = std::filesystem;

// Layered JSON configuration. For every directory in `paths_` (in order) the
// files <name>.json, <name>.<profile>.json (per profile) and
// <name>.override.json are merged into one object; later layers win and
// nested objects merge key by key.
class ConfigSources {
public:
  ConfigSources(std::vector<fs::path> paths, std::vector<std::string> profiles);

  // Merged content of every layer named `name` ("application",
  // "log_config"). Empty object when no layer exists. Throws
  // std::runtime_error when a layer is not a JSON object.
  boost::json::object json_content(const std::string &name) const;

  LoggingConfig logging_config() const;

  // Directory that receives <name>.override.json writes.
  const fs::path &writable_dir() const;

  std::vector<fs::path> paths_;
  std::vector<std::string> profiles_;
};

// Recursively merges `overlay` into `base`.
void merge_json_objects(boost::json::object &base,
                        const boost::json::object &overlay);

} // namespace rauth
