#pragma once

#include <atomic>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace ucibridge
{
  enum class LogLevel
  {
    Debug,
    Info,
    Warning,
    Error,
    Off
  };

  std::optional<LogLevel> parseLogLevel(std::string_view s);
  const char *toString(LogLevel level);

  // Tagged stderr logger ("[Bridge] warning: ..."). Each bridge owns its own;
  // child() shares the sink and level but swaps the tag.
  class Logger
  {
  public:
    explicit Logger(std::string tag, LogLevel level = LogLevel::Info);
    Logger(std::string tag, LogLevel level, std::ostream &out);

    Logger child(std::string tag) const;

    void setLevel(LogLevel level) { m_sink->level.store(level); }
    LogLevel level() const { return m_sink->level.load(); }
    bool enabled(LogLevel level) const { return level != LogLevel::Off && level >= m_sink->level.load(); }

    void log(LogLevel level, std::string_view msg) const;

    void debug(std::string_view msg) const { log(LogLevel::Debug, msg); }
    void info(std::string_view msg) const { log(LogLevel::Info, msg); }
    void warn(std::string_view msg) const { log(LogLevel::Warning, msg); }
    void error(std::string_view msg) const { log(LogLevel::Error, msg); }

  private:
    struct Sink
    {
      std::ostream *out{nullptr};
      std::atomic<LogLevel> level{LogLevel::Info};
      std::mutex mtx;
    };

    Logger(std::string tag, std::shared_ptr<Sink> sink);

    std::string m_tag;
    std::shared_ptr<Sink> m_sink;
  };

} // namespace ucibridge
