#pragma once

#include <algorithm>
#include <array>
#include <boost/program_options.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>


namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace rauthctl {

struct CliParams {
  std::vector<fs::path> config_dirs;
  std::vector<std::string> profiles;
  std::string subcmd;
  std::string verbose; // trace|debug|info|warning|error or vvvv
  bool silent = false;
};

struct CliCtx {
  po::variables_map vm;
  std::vector<std::string> positionals;
  std::vector<std::string> unrecognized;
  rauthctl::CliParams params;
  CliCtx(po::variables_map &&vm,                  //
         std::vector<std::string> &&positionals,  //
         std::vector<std::string> &&unrecognized, //
         rauthctl::CliParams &&params_)
      : vm(std::move(vm)), positionals(std::move(positionals)),
        unrecognized(std::move(unrecognized)), params(std::move(params_)) {}

  // True iff the option is present and did not come from a default_value.
  bool is_specified_by_user(const std::string &opt_name) const {
    auto it = vm.find(opt_name);
    if (it == vm.end()) {
      return false;
    }
    return !it->second.defaulted();
  }
  bool positional_contains(const std::string &name) const {
    return std::find(positionals.begin(), positionals.end(), name) !=
           positionals.end();
  }

  size_t verbosity_level() const {
    if (params.silent) {
      return 0;
    }
    if (params.verbose.empty()) {
      return 3;
    }
    if (params.verbose == "trace") {
      return 5;
    } else if (params.verbose == "debug") {
      return 4;
    } else if (params.verbose == "info") {
      return 3;
    } else if (params.verbose == "warning") {
      return 2;
    } else if (params.verbose == "error") {
      return 1;
    }
    return std::count(params.verbose.begin(), params.verbose.end(), 'v');
  }

  bool is_set() const { return positional_contains("set"); }
  bool is_get() const { return positional_contains("get"); }

  // cmd conf set <key> <value>
  std::optional<std::pair<std::string, std::string>> get_set_kv() const {
    auto it = std::find(positionals.begin(), positionals.end(), "set");
    if (it == positionals.end() || std::distance(it, positionals.end()) < 3) {
      return std::nullopt;
    }
    return std::make_pair(*(it + 1), *(it + 2));
  }

  // cmd conf get <key>
  std::optional<std::string> get_get_k() const {
    auto it = std::find(positionals.begin(), positionals.end(), "get");
    if (it == positionals.end() || std::distance(it, positionals.end()) < 2) {
      return std::nullopt;
    }
    return *(it + 1);
  }

  // First positional after the subcommand, e.g. the token for `decode`.
  std::optional<std::string> subcommand_argument() const {
    if (positionals.size() < 2) {
      return std::nullopt;
    }
    return positionals[1];
  }

  size_t positional_count() const { return positionals.size(); }
};

inline bool is_known_subcommand(std::string_view candidate) {
  static constexpr std::array<std::string_view, 5> kKnown{
      "token", "decode", "headers", "info", "conf"};
  return std::find(kKnown.begin(), kKnown.end(), candidate) != kKnown.end();
}

// Moves the first known subcommand to the front of `positionals` and stores it
// in `subcmd`. Leaves both untouched when no known subcommand is present.
inline void normalize_cli_subcommand(std::string &subcmd,
                                     std::vector<std::string> &positionals) {
  auto it = std::find_if(positionals.begin(), positionals.end(),
                         [](const std::string &p) {
                           return is_known_subcommand(p);
                         });
  if (it == positionals.end()) {
    return;
  }
  subcmd = *it;
  if (it != positionals.begin()) {
    std::rotate(positionals.begin(), it, it + 1);
  }
}

} // namespace rauthctl
