#pragma once

#include <chrono>
#include <string>

#include <sys/types.h>

namespace ucibridge::engine
{
  // Owns one child process and the parent ends of its stdin/stdout/stderr pipes.
  class EngineProcess
  {
  public:
    EngineProcess() = default;
    ~EngineProcess(); // kills and reaps a still-running child

    EngineProcess(const EngineProcess &) = delete;
    EngineProcess &operator=(const EngineProcess &) = delete;
    EngineProcess(EngineProcess &&) = delete;
    EngineProcess &operator=(EngineProcess &&) = delete;

    // Throws SpawnError when the path is missing, not executable, or exec fails.
    void spawn(const std::string &exePath);

    bool running() const { return m_pid > 0; }
    pid_t pid() const { return m_pid; }

    int stdinFd() const { return m_stdinWrite; }
    int stdoutFd() const { return m_stdoutRead; }
    int stderrFd() const { return m_stderrRead; }

    // Polls for exit up to `timeout`; true once the child has been reaped.
    bool waitExit(std::chrono::milliseconds timeout);

    // SIGKILL then blocking wait. No-op once the child is reaped.
    void kill();

    bool killed() const { return m_killed; }
    int exitStatus() const { return m_status; }

    void closeStdin();
    void closeOutputs();

  private:
    pid_t m_pid{-1};
    int m_stdinWrite{-1};  // parent -> child stdin
    int m_stdoutRead{-1};  // child stdout -> parent
    int m_stderrRead{-1};  // child stderr -> parent
    int m_status{0};
    bool m_killed{false};
  };

} // namespace ucibridge::engine
