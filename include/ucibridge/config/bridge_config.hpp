#pragma once
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ucibridge/log.hpp"

namespace ucibridge::config
{

  struct BridgeConfig
  {
    std::string enginePath;
    std::string engineName; // defaults to the executable's file name

    // UCI option name -> raw text, in file/command-line order. Typed against
    // the engine's advertised metadata once the handshake has run.
    std::vector<std::pair<std::string, std::string>> options;

    int defaultThinkTimeMs{1000};
    int analysisSlackMs{500};
    int bestMoveGraceMs{10000};
    int handshakeTimeoutMs{5000};
    int quitGraceMs{2000};

    LogLevel logLevel{LogLevel::Info};
  };

  // Replaces an existing entry with the same name, else appends.
  void setOption(BridgeConfig &cfg, const std::string &name, const std::string &value);

  // "~/x" -> "$HOME/x"
  std::string expandUser(const std::string &path);

  // Parses the YAML document (engine.path/name/options, default_think_time,
  // server.log_level, optional bridge.* timings). Does not touch the
  // filesystem; `origin` only labels error messages.
  BridgeConfig parseConfig(std::istream &in, const std::string &origin);

  // Used when no configuration file is found: Stockfish at
  // /usr/local/bin/stockfish with Threads 4 and Hash 128.
  BridgeConfig defaultConfig();

  // Throws ConfigError unless the engine path is an executable regular file.
  void validateEnginePath(const BridgeConfig &cfg);

  // parseConfig + validateEnginePath on a file. Throws ConfigError.
  BridgeConfig loadConfig(const std::filesystem::path &path);

  std::vector<std::filesystem::path> defaultConfigLocations();
  std::optional<std::filesystem::path> findConfig();

  // Writes the default configuration as YAML, creating parent directories.
  void writeDefaultConfig(const std::filesystem::path &path);

} // namespace ucibridge::config
