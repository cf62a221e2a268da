#include "ucibridge/engine/engine_process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <string>
#include <thread>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "ucibridge/errors.hpp"

namespace ucibridge::engine
{
  namespace
  {
    void closeFd(int &fd)
    {
      if (fd >= 0)
      {
        ::close(fd);
        fd = -1;
      }
    }

    void closePipe(int (&p)[2])
    {
      closeFd(p[0]);
      closeFd(p[1]);
    }

    std::string errnoText(const char *what, int err)
    {
      return std::string(what) + ": " + std::strerror(err);
    }
  } // namespace

  EngineProcess::~EngineProcess()
  {
    closeStdin();
    if (running())
      kill();
    closeOutputs();
  }

  void EngineProcess::spawn(const std::string &exePath)
  {
    if (running())
      throw SpawnError("engine process already running");

    std::error_code ec;
    if (exePath.empty() || !std::filesystem::exists(exePath, ec))
      throw SpawnError("Engine not found at " + exePath);
    if (!std::filesystem::is_regular_file(exePath, ec))
      throw SpawnError("Engine path is not a regular file: " + exePath);
    if (::access(exePath.c_str(), X_OK) != 0)
      throw SpawnError("Engine is not executable: " + exePath);

    // A dead engine must surface as EPIPE on write, not kill the host.
    ::signal(SIGPIPE, SIG_IGN);

    int inPipe[2] = {-1, -1};   // child reads [0], parent writes [1]
    int outPipe[2] = {-1, -1};  // parent reads [0], child writes [1]
    int errPipe[2] = {-1, -1};  // parent reads [0], child writes [1]
    int execPipe[2] = {-1, -1}; // child reports exec errno; EOF means exec succeeded

    if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
        ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(execPipe, O_CLOEXEC) != 0)
    {
      const int err = errno;
      closePipe(inPipe);
      closePipe(outPipe);
      closePipe(errPipe);
      closePipe(execPipe);
      throw SpawnError(errnoText("pipe failed", err));
    }

    pid_t pid = ::fork();
    if (pid < 0)
    {
      const int err = errno;
      closePipe(inPipe);
      closePipe(outPipe);
      closePipe(errPipe);
      closePipe(execPipe);
      throw SpawnError(errnoText("fork failed", err));
    }

    if (pid == 0)
    {
      // Child: dup2 clears O_CLOEXEC on the std descriptors; everything else
      // is closed by exec.
      ::signal(SIGPIPE, SIG_DFL);
      (void)::dup2(inPipe[0], STDIN_FILENO);
      (void)::dup2(outPipe[1], STDOUT_FILENO);
      (void)::dup2(errPipe[1], STDERR_FILENO);

      ::execl(exePath.c_str(), exePath.c_str(), (char *)nullptr);

      const int err = errno;
      (void)!::write(execPipe[1], &err, sizeof(err));
      _exit(127);
    }

    // Parent
    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    int childErr = 0;
    ssize_t n = 0;
    do
    {
      n = ::read(execPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe[0]);

    if (n > 0)
    {
      int status = 0;
      ::waitpid(pid, &status, 0);
      closeFd(inPipe[1]);
      closeFd(outPipe[0]);
      closeFd(errPipe[0]);
      throw SpawnError(errnoText(("exec " + exePath + " failed").c_str(), childErr));
    }

    m_pid = pid;
    m_stdinWrite = inPipe[1];
    m_stdoutRead = outPipe[0];
    m_stderrRead = errPipe[0];
    m_status = 0;
    m_killed = false;
  }

  bool EngineProcess::waitExit(std::chrono::milliseconds timeout)
  {
    if (!running())
      return true;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;)
    {
      int status = 0;
      pid_t r = ::waitpid(m_pid, &status, WNOHANG);
      if (r == m_pid || (r < 0 && errno == ECHILD))
      {
        m_status = status;
        m_pid = -1;
        return true;
      }
      if (std::chrono::steady_clock::now() >= deadline)
        return false;
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }

  void EngineProcess::kill()
  {
    if (!running())
      return;

    ::kill(m_pid, SIGKILL);
    m_killed = true;

    int status = 0;
    while (::waitpid(m_pid, &status, 0) < 0 && errno == EINTR)
    {
    }
    m_status = status;
    m_pid = -1;
  }

  void EngineProcess::closeStdin()
  {
    closeFd(m_stdinWrite);
  }

  void EngineProcess::closeOutputs()
  {
    closeFd(m_stdoutRead);
    closeFd(m_stderrRead);
  }

} // namespace ucibridge::engine
