#include "ucibridge/config/bridge_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>

#include <unistd.h>

#include <yaml-cpp/yaml.h>

#include "ucibridge/errors.hpp"

namespace ucibridge::config
{
  namespace fs = std::filesystem;

  static std::string lower(std::string v)
  {
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c)
                   { return (char)std::tolower(c); });
    return v;
  }

  static std::string where(const std::string &origin, const YAML::Node &n)
  {
    const YAML::Mark m = n.Mark();
    if (m.is_null())
      return origin;
    return origin + ":" + std::to_string(m.line + 1);
  }

  static std::string scalar(const YAML::Node &n, const std::string &key, const std::string &origin)
  {
    if (n.IsNull())
      return {};
    if (!n.IsScalar())
      throw ConfigError(where(origin, n) + ": '" + key + "' must be a single value");
    return n.Scalar();
  }

  static int parseMillis(const YAML::Node &n, const std::string &key, const std::string &origin,
                         int minValue)
  {
    const std::string v = scalar(n, key, origin);
    int x = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), x);
    if (v.empty() || ec != std::errc() || ptr != v.data() + v.size())
      throw ConfigError(where(origin, n) + ": " + key +
                        " expects an integer number of milliseconds, got '" + v + "'");
    if (x < minValue)
      throw ConfigError(where(origin, n) + ": " + key + " must be at least " +
                        std::to_string(minValue));
    return x;
  }

  static LogLevel parseLevel(const YAML::Node &n, const std::string &origin)
  {
    const std::string v = scalar(n, "log_level", origin);
    auto lvl = parseLogLevel(lower(v));
    if (!lvl)
      throw ConfigError(where(origin, n) + ": unknown log level '" + v + "'");
    return *lvl;
  }

  void setOption(BridgeConfig &cfg, const std::string &name, const std::string &value)
  {
    for (auto &kv : cfg.options)
    {
      if (kv.first == name)
      {
        kv.second = value;
        return;
      }
    }
    cfg.options.emplace_back(name, value);
  }

  std::string expandUser(const std::string &path)
  {
    if (path.empty() || path[0] != '~')
      return path;
    if (path.size() > 1 && path[1] != '/')
      return path; // ~user is not supported
    const char *home = std::getenv("HOME");
    if (!home || !*home)
      return path;
    return std::string(home) + path.substr(1);
  }

  static BridgeConfig fromYaml(const YAML::Node &root, const std::string &origin)
  {
    if (!root.IsMap() || !root["engine"] || root["engine"].IsNull())
      throw ConfigError(origin + ": Configuration must include 'engine' section");

    const YAML::Node engine = root["engine"];
    if (!engine.IsMap())
      throw ConfigError(where(origin, engine) + ": 'engine' must be a mapping");

    BridgeConfig cfg;
    if (engine["path"])
      cfg.enginePath = expandUser(scalar(engine["path"], "path", origin));
    if (engine["name"])
      cfg.engineName = scalar(engine["name"], "name", origin);

    if (const YAML::Node opts = engine["options"]; opts && !opts.IsNull())
    {
      if (!opts.IsMap())
        throw ConfigError(where(origin, opts) + ": 'options' must map option names to values");
      for (const auto &kv : opts)
      {
        const std::string name = kv.first.as<std::string>();
        setOption(cfg, name, scalar(kv.second, name, origin));
      }
    }

    if (root["default_think_time"])
      cfg.defaultThinkTimeMs = parseMillis(root["default_think_time"], "default_think_time", origin, 1);

    // host/port/timeout belong to a network front end; only log_level applies here.
    if (const YAML::Node server = root["server"]; server && server.IsMap() && server["log_level"])
      cfg.logLevel = parseLevel(server["log_level"], origin);

    if (const YAML::Node bridge = root["bridge"]; bridge && !bridge.IsNull())
    {
      if (!bridge.IsMap())
        throw ConfigError(where(origin, bridge) + ": 'bridge' must be a mapping");
      if (bridge["analysis_slack"])
        cfg.analysisSlackMs = parseMillis(bridge["analysis_slack"], "analysis_slack", origin, 0);
      if (bridge["best_move_grace"])
        cfg.bestMoveGraceMs = parseMillis(bridge["best_move_grace"], "best_move_grace", origin, 0);
      if (bridge["handshake_timeout"])
        cfg.handshakeTimeoutMs =
            parseMillis(bridge["handshake_timeout"], "handshake_timeout", origin, 1);
      if (bridge["quit_grace"])
        cfg.quitGraceMs = parseMillis(bridge["quit_grace"], "quit_grace", origin, 0);
      if (bridge["log_level"])
        cfg.logLevel = parseLevel(bridge["log_level"], origin);
    }

    if (cfg.engineName.empty() && !cfg.enginePath.empty())
      cfg.engineName = fs::path(cfg.enginePath).filename().string();
    return cfg;
  }

  BridgeConfig parseConfig(std::istream &in, const std::string &origin)
  {
    try
    {
      return fromYaml(YAML::Load(in), origin);
    }
    catch (const YAML::Exception &e)
    {
      const std::string at = e.mark.is_null() ? origin : origin + ":" + std::to_string(e.mark.line + 1);
      throw ConfigError(at + ": Failed to load configuration: " + e.msg);
    }
  }

  BridgeConfig defaultConfig()
  {
    BridgeConfig cfg;
    cfg.enginePath = "/usr/local/bin/stockfish";
    cfg.engineName = "Stockfish";
    cfg.options = {{"Threads", "4"}, {"Hash", "128"}};
    return cfg;
  }

  void validateEnginePath(const BridgeConfig &cfg)
  {
    if (cfg.enginePath.empty())
      throw ConfigError("Engine configuration must include 'path'");

    std::error_code ec;
    if (!fs::is_regular_file(cfg.enginePath, ec))
      throw ConfigError("Engine path does not exist: " + cfg.enginePath);
    if (::access(cfg.enginePath.c_str(), X_OK) != 0)
      throw ConfigError("Engine is not executable: " + cfg.enginePath);
  }

  BridgeConfig loadConfig(const fs::path &path)
  {
    std::ifstream in(path);
    if (!in.good())
      throw ConfigError("Configuration file not found: " + path.string());

    BridgeConfig cfg = parseConfig(in, path.string());
    validateEnginePath(cfg);
    return cfg;
  }

  std::vector<fs::path> defaultConfigLocations()
  {
    std::vector<fs::path> out{"./ucibridge.yaml", "./config.yaml"};

    const char *xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg)
      out.push_back(fs::path(xdg) / "ucibridge" / "config.yaml");
    else if (const char *home = std::getenv("HOME"); home && *home)
      out.push_back(fs::path(home) / ".config" / "ucibridge" / "config.yaml");

    out.emplace_back("/etc/ucibridge/config.yaml");
    return out;
  }

  std::optional<fs::path> findConfig()
  {
    std::error_code ec;
    for (auto &p : defaultConfigLocations())
    {
      if (fs::is_regular_file(p, ec))
        return p;
    }
    return std::nullopt;
  }

  void writeDefaultConfig(const fs::path &path)
  {
    std::error_code ec;
    if (path.has_parent_path())
      fs::create_directories(path.parent_path(), ec);
    if (ec)
      throw ConfigError("Cannot create " + path.parent_path().string() + ": " + ec.message());

    const BridgeConfig d = defaultConfig();

    YAML::Emitter y;
    y << YAML::BeginMap;
    y << YAML::Key << "engine" << YAML::Value << YAML::BeginMap;
    y << YAML::Key << "path" << YAML::Value << d.enginePath;
    y << YAML::Key << "name" << YAML::Value << d.engineName;
    y << YAML::Key << "options" << YAML::Value << YAML::BeginMap;
    for (const auto &[name, value] : d.options)
      y << YAML::Key << name << YAML::Value << value;
    y << YAML::EndMap << YAML::EndMap;

    y << YAML::Key << "server" << YAML::Value << YAML::BeginMap;
    y << YAML::Key << "log_level" << YAML::Value << "INFO";
    y << YAML::EndMap;

    y << YAML::Key << "default_think_time" << YAML::Value << d.defaultThinkTimeMs;

    y << YAML::Key << "bridge" << YAML::Value << YAML::BeginMap;
    y << YAML::Key << "analysis_slack" << YAML::Value << d.analysisSlackMs;
    y << YAML::Key << "best_move_grace" << YAML::Value << d.bestMoveGraceMs;
    y << YAML::Key << "handshake_timeout" << YAML::Value << d.handshakeTimeoutMs;
    y << YAML::Key << "quit_grace" << YAML::Value << d.quitGraceMs;
    y << YAML::EndMap;
    y << YAML::EndMap;

    if (!y.good())
      throw ConfigError("Cannot encode default configuration: " + y.GetLastError());

    std::ofstream out(path, std::ios::trunc);
    if (!out)
      throw ConfigError("Cannot write configuration file: " + path.string());
    out << "# ucibridge configuration. All times are in milliseconds.\n" << y.c_str() << "\n";
    if (!out)
      throw ConfigError("Failed writing configuration file: " + path.string());
  }

} // namespace ucibridge::config
