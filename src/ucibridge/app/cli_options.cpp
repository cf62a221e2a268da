#include "ucibridge/app/cli_options.hpp"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "ucibridge/errors.hpp"

namespace ucibridge::app {

namespace {

int to_positive_int(const std::string& flag, const std::string& v) {
  int x = 0;
  auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), x);
  if (v.empty() || ec != std::errc() || ptr != v.data() + v.size() || x <= 0)
    throw std::invalid_argument(flag + " expects a positive integer, got '" + v + "'");
  return x;
}

}  // namespace

void print_usage(std::ostream& os) {
  os << "Usage: ucibridge [ENGINE_PATH] [options]\n"
        "Bridges line requests on stdin to a UCI chess engine.\n"
        "Options:\n"
        "  -o, --uci-option <name> <value>  Set a UCI option (repeatable, e.g. -o Threads 4)\n"
        "  --think-time <ms>               Default thinking time (default 1000)\n"
        "  --config <file>                 YAML configuration file (default: first of\n"
        "                                  ./ucibridge.yaml, ./config.yaml,\n"
        "                                  ~/.config/ucibridge/config.yaml,\n"
        "                                  /etc/ucibridge/config.yaml)\n"
        "  --write-config <file>           Write a default configuration file and exit\n"
        "  --debug                         Log every UCI line to stderr\n"
        "  -h, --help                      Show this help\n"
        "\nRequests (one per line):\n"
        "  analyze <fen> [time_ms=<ms>]\n"
        "  get_best_move [fen <fen>] [time_ms=<ms>]\n"
        "  set_position [fen <fen> | startpos] [moves <m1> <m2> ...]\n"
        "  engine_info | get_engine_options | new_game | quit\n"
        "  set_engine_options <name>=<value>[; <name>=<value>...]\n";
}

CliOptions parse_args(int argc, char** argv) {
  CliOptions o;

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto need = [&](int n) {
      if (i + n >= argc) throw std::invalid_argument("missing value for " + a);
    };

    if (a == "-h" || a == "--help") {
      o.help = true;
    } else if (a == "-o" || a == "--uci-option") {
      need(2);
      std::string name = argv[++i];
      std::string value = argv[++i];
      o.uciOptions.emplace_back(std::move(name), std::move(value));
    } else if (a == "--think-time") {
      need(1);
      o.thinkTimeMs = to_positive_int(a, argv[++i]);
    } else if (a == "--config") {
      need(1);
      o.configPath = argv[++i];
    } else if (a == "--write-config") {
      need(1);
      o.writeConfigPath = argv[++i];
    } else if (a == "--debug") {
      o.debug = true;
    } else if (a == "--no-debug") {
      o.debug = false;
    } else if (!a.empty() && a[0] == '-') {
      throw std::invalid_argument("unknown option " + a);
    } else if (!o.enginePath) {
      o.enginePath = a;
    } else {
      throw std::invalid_argument("unexpected argument " + a);
    }
  }
  return o;
}

namespace {

std::optional<config::BridgeConfig> read_config_file(const std::filesystem::path& file) {
  std::ifstream in(file);
  if (!in.good()) return std::nullopt;
  return config::parseConfig(in, file.string());
}

}  // namespace

config::BridgeConfig resolve_config(const CliOptions& cli, const Logger& log) {
  config::BridgeConfig cfg;

  if (cli.configPath) {
    auto loaded = read_config_file(*cli.configPath);
    if (!loaded) throw ConfigError("Configuration file not found: " + *cli.configPath);
    cfg = std::move(*loaded);
  } else if (!cli.enginePath) {
    bool found = false;
    for (const auto& path : config::defaultConfigLocations()) {
      std::error_code ec;
      if (!std::filesystem::is_regular_file(path, ec)) continue;
      try {
        if (auto loaded = read_config_file(path)) {
          cfg = std::move(*loaded);
          log.info("Loaded configuration from " + path.string());
          found = true;
          break;
        }
      } catch (const ConfigError& e) {
        log.warn(std::string("Failed to load configuration from ") + path.string() + ": " + e.what());
      }
    }
    if (!found) {
      log.warn("No configuration file found, using defaults");
      cfg = config::defaultConfig();
    }
  }

  if (cli.enginePath) {
    cfg.enginePath = config::expandUser(*cli.enginePath);
    cfg.engineName = std::filesystem::path(cfg.enginePath).filename().string();
  }
  for (const auto& [name, value] : cli.uciOptions) config::setOption(cfg, name, value);
  if (cli.thinkTimeMs) cfg.defaultThinkTimeMs = *cli.thinkTimeMs;
  if (cli.debug) cfg.logLevel = LogLevel::Debug;

  config::validateEnginePath(cfg);
  return cfg;
}

}  // namespace ucibridge::app
