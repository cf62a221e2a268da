#include "ucibridge/engine/line_channel.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include "ucibridge/errors.hpp"

namespace ucibridge::engine
{
  LineChannel::LineChannel(int writeFd, int readFd, Logger log, LineSink sink)
      : m_writeFd(writeFd), m_readFd(readFd), m_log(std::move(log)), m_sink(std::move(sink))
  {
    if (::pipe2(m_wake, O_CLOEXEC) != 0)
      throw BridgeError(std::string("pipe(wake) failed: ") + std::strerror(errno));

    if (m_readFd >= 0)
      m_reader = std::thread([this]
                             { readerLoop(); });
    else
      m_eof = true;
  }

  LineChannel::~LineChannel()
  {
    close();
  }

  void LineChannel::writeLine(const std::string &text)
  {
    std::lock_guard lk(m_writeMtx);
    if (m_writeFd < 0 || closed())
      throw WriteError("engine stdin is closed");

    m_log.debug("> " + text);

    // UCI requires \n; one write() call per line keeps lines whole for a pipe.
    const std::string s = text + "\n";
    const char *p = s.data();
    size_t remaining = s.size();
    while (remaining > 0)
    {
      ssize_t n = ::write(m_writeFd, p, remaining);
      if (n < 0)
      {
        if (errno == EINTR)
          continue;
        throw WriteError(std::string("write to engine failed: ") + std::strerror(errno));
      }
      p += n;
      remaining -= (size_t)n;
    }
  }

  ReadStatus LineChannel::readLine(std::string &out, std::optional<Clock::time_point> deadline)
  {
    std::unique_lock lk(m_mtx);
    auto ready = [&]
    { return m_closed || !m_lines.empty() || m_eof; };

    if (deadline)
      m_cv.wait_until(lk, *deadline, ready);
    else
      m_cv.wait(lk, ready);

    if (m_closed)
      return ReadStatus::Closed;
    if (!m_lines.empty())
    {
      out = std::move(m_lines.front());
      m_lines.pop_front();
      return ReadStatus::Line;
    }
    if (m_eof)
      return ReadStatus::Closed;
    return ReadStatus::Timeout;
  }

  size_t LineChannel::drain()
  {
    std::lock_guard lk(m_mtx);
    const size_t n = m_lines.size();
    for (auto &l : m_lines)
      m_log.debug("discarding stale line: " + l);
    m_lines.clear();
    return n;
  }

  void LineChannel::shutdownWrites()
  {
    std::lock_guard lk(m_writeMtx);
    m_writeFd = -1;
  }

  void LineChannel::close()
  {
    std::lock_guard closeLk(m_closeMtx);
    {
      std::lock_guard lk(m_mtx);
      if (m_closed && !m_reader.joinable() && m_wake[0] < 0)
        return;
      m_closed = true;
      m_lines.clear();
    }
    m_cv.notify_all();

    shutdownWrites();

    if (m_wake[1] >= 0)
    {
      const char b = 1;
      (void)!::write(m_wake[1], &b, 1);
    }
    if (m_reader.joinable())
      m_reader.join();

    for (int &fd : m_wake)
    {
      if (fd >= 0)
      {
        ::close(fd);
        fd = -1;
      }
    }
  }

  bool LineChannel::eof() const
  {
    std::lock_guard lk(m_mtx);
    return m_eof;
  }

  bool LineChannel::closed() const
  {
    std::lock_guard lk(m_mtx);
    return m_closed;
  }

  void LineChannel::deliver(std::string line)
  {
    // Normalize CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
      line.pop_back();

    if (m_sink)
    {
      m_sink(line);
      return;
    }

    m_log.debug("< " + line);
    {
      std::lock_guard lk(m_mtx);
      if (m_closed)
        return;
      m_lines.push_back(std::move(line));
    }
    m_cv.notify_all();
  }

  void LineChannel::readerLoop()
  {
    std::string buf;
    char tmp[4096];

    for (;;)
    {
      pollfd fds[2] = {{m_readFd, POLLIN, 0}, {m_wake[0], POLLIN, 0}};
      int r = ::poll(fds, 2, -1);
      if (r < 0)
      {
        if (errno == EINTR)
          continue;
        m_log.error(std::string("poll failed: ") + std::strerror(errno));
        break;
      }
      if (fds[1].revents != 0)
        return; // close() requested

      if (fds[0].revents == 0)
        continue;

      ssize_t n = ::read(m_readFd, tmp, sizeof(tmp));
      if (n < 0)
      {
        if (errno == EINTR || errno == EAGAIN)
          continue;
        m_log.error(std::string("read from engine failed: ") + std::strerror(errno));
        break;
      }
      if (n == 0)
      {
        // Unterminated tail before EOF still counts as a line.
        if (!buf.empty())
          deliver(std::move(buf));
        break;
      }

      buf.append(tmp, tmp + n);
      size_t start = 0;
      for (size_t pos = buf.find('\n', start); pos != std::string::npos; pos = buf.find('\n', start))
      {
        deliver(buf.substr(start, pos - start));
        start = pos + 1;
      }
      buf.erase(0, start);
    }

    {
      std::lock_guard lk(m_mtx);
      m_eof = true;
    }
    m_cv.notify_all();
  }

} // namespace ucibridge::engine
