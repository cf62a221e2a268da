#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "ucibridge/log.hpp"

namespace ucibridge::engine
{
  enum class ReadStatus
  {
    Line,
    Timeout,
    Closed
  };

  // Newline framing over a pair of pipe descriptors. A reader thread splits the
  // read side into lines; readLine() races a deadline against the queue.
  // The descriptors are borrowed, never closed here.
  class LineChannel
  {
  public:
    using Clock = std::chrono::steady_clock;
    // When set, lines go to the sink instead of the read queue.
    using LineSink = std::function<void(const std::string &)>;

    LineChannel(int writeFd, int readFd, Logger log, LineSink sink = {});
    ~LineChannel();

    LineChannel(const LineChannel &) = delete;
    LineChannel &operator=(const LineChannel &) = delete;

    // Throws WriteError if writes were shut down or the peer is gone.
    void writeLine(const std::string &text);

    // Buffered lines are still handed out after EOF; after close() every read
    // returns Closed immediately.
    ReadStatus readLine(std::string &out, std::optional<Clock::time_point> deadline = std::nullopt);

    // Discards everything already queued; returns the number of lines dropped.
    size_t drain();

    void shutdownWrites();
    void close();

    bool eof() const;
    bool closed() const;

  private:
    void readerLoop();
    void deliver(std::string line);

    int m_writeFd{-1};
    int m_readFd{-1};
    int m_wake[2]{-1, -1};

    Logger m_log;
    LineSink m_sink;

    std::mutex m_writeMtx;
    std::mutex m_closeMtx;

    mutable std::mutex m_mtx;
    std::condition_variable m_cv;
    std::deque<std::string> m_lines;
    bool m_eof{false};
    bool m_closed{false};

    std::thread m_reader;
  };

} // namespace ucibridge::engine
