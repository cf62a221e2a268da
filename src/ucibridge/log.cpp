#include "ucibridge/log.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace ucibridge
{
  std::optional<LogLevel> parseLogLevel(std::string_view s)
  {
    std::string v(s);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c)
                   { return (char)std::tolower(c); });
    if (v == "debug")
      return LogLevel::Debug;
    if (v == "info")
      return LogLevel::Info;
    if (v == "warning" || v == "warn")
      return LogLevel::Warning;
    if (v == "error")
      return LogLevel::Error;
    if (v == "off" || v == "none")
      return LogLevel::Off;
    return std::nullopt;
  }

  const char *toString(LogLevel level)
  {
    switch (level)
    {
    case LogLevel::Debug:
      return "debug";
    case LogLevel::Info:
      return "info";
    case LogLevel::Warning:
      return "warning";
    case LogLevel::Error:
      return "error";
    case LogLevel::Off:
      return "off";
    }
    return "info";
  }

  Logger::Logger(std::string tag, LogLevel level)
      : Logger(std::move(tag), level, std::cerr)
  {
  }

  Logger::Logger(std::string tag, LogLevel level, std::ostream &out)
      : m_tag(std::move(tag)), m_sink(std::make_shared<Sink>())
  {
    m_sink->out = &out;
    m_sink->level = level;
  }

  Logger::Logger(std::string tag, std::shared_ptr<Sink> sink)
      : m_tag(std::move(tag)), m_sink(std::move(sink))
  {
  }

  Logger Logger::child(std::string tag) const
  {
    return Logger(std::move(tag), m_sink);
  }

  void Logger::log(LogLevel level, std::string_view msg) const
  {
    if (!enabled(level))
      return;

    std::lock_guard lk(m_sink->mtx);
    auto &os = *m_sink->out;
    os << '[' << m_tag << "] ";
    if (level != LogLevel::Info)
      os << toString(level) << ": ";
    os << msg << '\n';
    os.flush();
  }

} // namespace ucibridge
