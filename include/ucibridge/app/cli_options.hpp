#pragma once
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ucibridge/config/bridge_config.hpp"
#include "ucibridge/log.hpp"

namespace ucibridge::app {

struct CliOptions {
  std::optional<std::string> enginePath;
  std::vector<std::pair<std::string, std::string>> uciOptions;  // -o NAME VALUE
  std::optional<int> thinkTimeMs;
  std::optional<std::string> configPath;
  std::optional<std::string> writeConfigPath;
  bool debug = false;
  bool help = false;
};

// Throws std::invalid_argument on malformed arguments.
CliOptions parse_args(int argc, char** argv);

void print_usage(std::ostream& os);

// Config file (explicit, else the first default location that loads, else
// the built-in Stockfish defaults) overlaid with command-line values.
// Throws ConfigError.
config::BridgeConfig resolve_config(const CliOptions& cli, const Logger& log);

}  // namespace ucibridge::app
