#include <boost/json.hpp>
#include <boost/program_options.hpp>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>

#include "conf/config_sources.hpp"
#include "conf/rauthctl_config.hpp"
#include "rauthctl_common.hpp"
#include "rauthctl_entry.hpp"
#include "util/my_logging.hpp"
#include "version.h"

namespace po = boost::program_options;

namespace {

namespace js = boost::json;

struct DefaultPaths {
  fs::path config_dir;
  fs::path runtime_dir;
};

fs::path get_env_path(const char *name) {
  if (const char *value = std::getenv(name); value && *value) {
    return fs::path(value);
  }
  return {};
}

// Resolve default configuration and runtime directory paths.
//
// Environment variable precedence (highest to lowest):
// 1. RAUTHCTL_CONFIG_DIR + RAUTHCTL_RUNTIME_DIR - Direct path overrides
// 2. RAUTHCTL_BASE_DIR - Base directory override (appends /config and /runtime)
// 3. Per-user defaults with individual overrides
//
// Per-user defaults:
// - Linux/macOS: $XDG_CONFIG_HOME/rauthctl (or ~/.config/rauthctl),
//   $XDG_STATE_HOME/rauthctl (or ~/.local/state/rauthctl)
// - Windows: %APPDATA%/rauthctl/{config,runtime}
DefaultPaths resolve_default_paths() {
  fs::path config_override = get_env_path("RAUTHCTL_CONFIG_DIR");
  fs::path runtime_override = get_env_path("RAUTHCTL_RUNTIME_DIR");

  if (!config_override.empty() && !runtime_override.empty()) {
    return {config_override, runtime_override};
  }

  fs::path base_override = get_env_path("RAUTHCTL_BASE_DIR");
  if (!base_override.empty()) {
    fs::path config_dir =
        config_override.empty() ? (base_override / "config") : config_override;
    fs::path runtime_dir = runtime_override.empty()
                               ? (base_override / "runtime")
                               : runtime_override;
    return {config_dir, runtime_dir};
  }

#ifdef _WIN32
  fs::path app_data = get_env_path("APPDATA");
  if (app_data.empty()) {
    app_data = fs::temp_directory_path();
  }
  auto base = app_data / "rauthctl";
  fs::path config_dir =
      config_override.empty() ? (base / "config") : config_override;
  fs::path runtime_dir =
      runtime_override.empty() ? (base / "runtime") : runtime_override;
  return {config_dir, runtime_dir};
#else
  fs::path home = get_env_path("HOME");
  if (home.empty()) {
    home = fs::temp_directory_path();
  }
  fs::path xdg_config = get_env_path("XDG_CONFIG_HOME");
  fs::path xdg_state = get_env_path("XDG_STATE_HOME");
  fs::path config_dir =
      !config_override.empty()
          ? config_override
          : (xdg_config.empty() ? home / ".config" : xdg_config) / "rauthctl";
  fs::path runtime_dir =
      !runtime_override.empty()
          ? runtime_override
          : (xdg_state.empty() ? home / ".local" / "state" : xdg_state) /
                "rauthctl";
  return {config_dir, runtime_dir};
#endif
}

void ensure_directory_exists(const fs::path &dir) {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec && !fs::exists(dir)) {
    throw std::runtime_error(std::string("Failed to create directory '") +
                             dir.string() + "': " + ec.message());
  }
}

void write_json_if_missing(const fs::path &file_path,
                           const js::value &content) {
  if (fs::exists(file_path)) {
    return;
  }
  ensure_directory_exists(file_path.parent_path());
  std::ofstream ofs(file_path);
  if (!ofs) {
    throw std::runtime_error("Unable to write default config file: " +
                             file_path.string());
  }
  ofs << js::serialize(content) << std::endl;
}

bool bootstrap_default_config_dir(const fs::path &config_dir,
                                  const fs::path &runtime_dir) {
  std::error_code ec;
  fs::create_directories(config_dir, ec);
  if (ec && !fs::exists(config_dir)) {
    std::cerr << "Warning: unable to create default config directory '"
              << config_dir << "': " << ec.message() << std::endl;
    return false;
  }

  try {
    rauth::codec::TokenDefaults defaults{};
    js::object application{
        {"verbose", "info"},
        {"api_base_url", "https://api.redstrim.com"},
        {"auth_header_name",
         std::string(rauth::codec::kDefaultAuthHeaderName)},
        {"use_device_fingerprint", false},
        {"token_defaults",
         js::object{{"device_identifier", defaults.device_identifier},
                    {"serial_number", defaults.serial_number},
                    {"device_model", defaults.device_model},
                    {"os", defaults.os}}}};
    write_json_if_missing(config_dir / "application.json", application);

    js::object log{{"level", "info"},
                   {"log_dir", (runtime_dir / "logs").string()},
                   {"log_file", "rauthctl"},
                   {"rotation_size", 10 * 1024 * 1024}};
    write_json_if_missing(config_dir / "log_config.json", log);
  } catch (const std::exception &ex) {
    std::cerr << "Warning: failed to write default configuration files: "
              << ex.what() << std::endl;
    return false;
  }

  return true;
}

void add_unique_path(std::vector<fs::path> &paths, const fs::path &candidate) {
  if (candidate.empty()) {
    return;
  }
  if (std::find(paths.begin(), paths.end(), candidate) == paths.end()) {
    paths.push_back(candidate);
  }
}

} // namespace

int RunRauthCtlApplication(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "-v" || arg == "--version" || arg == "version") {
      std::cout << MYAPP_VERSION << std::endl;
      return EXIT_SUCCESS;
    }
  }

  try {
    po::variables_map vm;
    po::options_description generic_desc("rauth-ctl: R-Auth device token tool");

    rauthctl::CliParams cli_params;
    std::vector<std::string> config_dirs_args;

    generic_desc.add_options() //
        ("config-dirs,c",
         po::value<std::vector<std::string>>(&config_dirs_args)
             ->multitoken()
             ->composing(),
         "paths of the configuration directories.") //
        ("profiles",
         po::value<std::vector<std::string>>(&cli_params.profiles)
             ->default_value(std::vector<std::string>{}, "")
             ->notifier([&](const std::vector<std::string> &profiles) mutable {
               if (profiles.empty()) {
                 cli_params.profiles.push_back("default");
               }
             }),
         "profiles to use from the configuration file.") //
        ("verbose",
         po::value<std::string>(&cli_params.verbose)->default_value("info"),
         "verbosity level, like info, trace, vvvv.") //
        ("silent", po::bool_switch(&cli_params.silent)->default_value(false),
         "suppress all diagnostics.") //
        ("help,h", "Print help");

    po::options_description hidden_desc("Hidden options");
    hidden_desc.add_options() //
        ("positionals",
         po::value<std::vector<std::string>>()->default_value({}, ""),
         "all positional arguments");

    po::options_description cmdline_options("Allowed options");
    cmdline_options.add(generic_desc).add(hidden_desc);

    po::positional_options_description p;
    p.add("positionals", -1);

    // Subcommand options (--timestamp, --jwt, ...) stay unregistered here and
    // are parsed by the handlers.
    po::parsed_options parsed = po::command_line_parser(argc, argv)
                                    .options(cmdline_options)
                                    .positional(p)
                                    .allow_unregistered()
                                    .run();
    po::store(parsed, vm);
    po::notify(vm);

    if (!config_dirs_args.empty()) {
      for (const auto &dir_str : config_dirs_args) {
        fs::path config_dir(dir_str);
        if (!fs::exists(config_dir)) {
          throw std::runtime_error("Config directory does not exist: " +
                                   config_dir.string());
        }
        cli_params.config_dirs.push_back(std::move(config_dir));
      }
    }

    std::vector<std::string> positionals =
        vm["positionals"].as<std::vector<std::string>>();
    if (!positionals.empty()) {
      cli_params.subcmd = positionals[0];
    }

    std::vector<std::string> unrecognized = po::collect_unrecognized(
        parsed.options, po::collect_unrecognized_mode::include_positional);

    rauthctl::normalize_cli_subcommand(cli_params.subcmd, positionals);

    auto showUsage = [&]() {
      std::cerr << generic_desc << std::endl;
      std::cerr << "Subcommands:" << std::endl
                << "  token    Generate an R-Auth device token." << std::endl
                << "  decode   Decode a token and check its seed." << std::endl
                << "  headers  Print the authenticated request headers."
                << std::endl
                << "  info     Show device traits and derived identifiers."
                << std::endl
                << "  conf     Read or write configuration (get/set)."
                << std::endl
                << std::endl;
    };

    if (vm.count("help") || cli_params.subcmd.empty()) {
      showUsage();
      return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    const DefaultPaths defaults = resolve_default_paths();
    const bool default_config_available =
        bootstrap_default_config_dir(defaults.config_dir, defaults.runtime_dir);

    std::vector<fs::path> ordered_config_dirs;
    if (default_config_available && fs::exists(defaults.config_dir)) {
      add_unique_path(ordered_config_dirs, defaults.config_dir);
    }
    for (const auto &dir : cli_params.config_dirs) {
      add_unique_path(ordered_config_dirs, dir);
    }

    try {
      ensure_directory_exists(defaults.runtime_dir);
      ensure_directory_exists(defaults.runtime_dir / "logs");
    } catch (const std::exception &ex) {
      std::cerr << "Failed to prepare runtime directory '"
                << defaults.runtime_dir << "': " << ex.what() << std::endl;
      return EXIT_FAILURE;
    }
    // Last directory receives `conf set` writes.
    add_unique_path(ordered_config_dirs, defaults.runtime_dir);
    cli_params.config_dirs = ordered_config_dirs;

    static rauth::ConfigSources config_sources(cli_params.config_dirs,
                                               cli_params.profiles);
    {
      rauth::LoggingConfig logging_config = config_sources.logging_config();
      init_my_log(logging_config);
      BOOST_LOG_TRIVIAL(debug) << "log dir: " << logging_config.log_dir;
    }

    static rauthctl::CliCtx cli_ctx(std::move(vm), std::move(positionals),
                                    std::move(unrecognized),
                                    std::move(cli_params));

    if (!cli_ctx.is_specified_by_user("verbose")) {
      auto rauthctl_config = js::value_to<rauthctl::RauthctlConfig>(
          js::value(config_sources.json_content("application")));
      if (!rauthctl_config.verbose.empty()) {
        cli_ctx.params.verbose = rauthctl_config.verbose;
      }
    }

    BOOST_LOG_TRIVIAL(info) << "rauth-ctl " << MYAPP_VERSION << " subcommand "
                            << cli_ctx.params.subcmd;
    return rauthctl::launch(config_sources, cli_ctx);
  } catch (const std::exception &e) {
    std::cerr << "error: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}

int main(int argc, char *argv[]) { return RunRauthCtlApplication(argc, argv); }
