#include "conf/rauthctl_config.hpp"

#include <fstream>
#include <iterator>

namespace rauthctl {

RauthctlConfigProviderFile::RauthctlConfigProviderFile(
    rauth::ConfigSources &config_sources)
    : config_sources_(config_sources) {
  config_ = json::value_to<RauthctlConfig>(
      json::value(config_sources_.json_content("application")));
}

std::optional<std::string>
RauthctlConfigProviderFile::save(const json::object &content) {
  auto f = config_sources_.writable_dir() / "application.override.json";
  json::object jo;
  if (rauth::fs::exists(f)) {
    std::ifstream ifs(f);
    if (!ifs) {
      return "Unable to open configuration file: " + f.string();
    }
    std::string existing((std::istreambuf_iterator<char>(ifs)),
                         std::istreambuf_iterator<char>());
    ifs.close();
    boost::system::error_code ec;
    auto jv = json::parse(existing, ec);
    if (ec || !jv.is_object()) {
      return "Configuration file is not a JSON object: " + f.string();
    }
    jo = std::move(jv.as_object());
  }
  rauth::merge_json_objects(jo, content);

  // Validate before writing so a bad value never lands on disk.
  json::object merged = config_sources_.json_content("application");
  rauth::merge_json_objects(merged, jo);
  RauthctlConfig updated;
  try {
    updated = json::value_to<RauthctlConfig>(json::value(merged));
  } catch (const std::exception &ex) {
    return std::string("Rejected configuration change: ") + ex.what();
  }

  std::ofstream ofs(f);
  if (!ofs) {
    return "Unable to open configuration file for writing: " + f.string();
  }
  ofs << json::serialize(jo) << std::endl;
  ofs.close();
  config_ = std::move(updated);
  return std::nullopt;
}

} // namespace rauthctl
