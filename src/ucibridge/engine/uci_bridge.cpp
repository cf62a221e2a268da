#include "ucibridge/engine/uci_bridge.hpp"

#include <algorithm>
#include <cstdint>
#include <set>
#include <stdexcept>

#include "ucibridge/errors.hpp"

namespace ucibridge::engine
{
  using namespace std::chrono_literals;
  using std::chrono::milliseconds;

  UciBridge::UciBridge(config::BridgeConfig cfg)
      : UciBridge(std::move(cfg), Logger("Bridge"))
  {
    m_log.setLevel(m_cfg.logLevel);
  }

  UciBridge::UciBridge(config::BridgeConfig cfg, Logger log)
      : m_cfg(std::move(cfg)), m_log(std::move(log))
  {
  }

  UciBridge::~UciBridge()
  {
    stop();
  }

  void UciBridge::start()
  {
    std::uint64_t generation = 0;
    {
      std::scoped_lock lk(m_lifecycleMtx, m_opMtx);
      if (m_process)
        throw BridgeError("bridge already started");

      m_forcedKill.store(false);
      m_id = {};
      m_options = {};
      m_searchPending = false;

      m_log.info("Starting engine: " + m_cfg.enginePath);

      auto proc = std::make_unique<EngineProcess>();
      try
      {
        proc->spawn(m_cfg.enginePath);
      }
      catch (const SpawnError &e)
      {
        m_state.store(HandshakeState::Stopped);
        m_log.error(std::string("Failed to start engine: ") + e.what());
        throw;
      }
      m_process = std::move(proc);
      generation = ++m_generation;

      try
      {
        Logger errLog = m_log.child("Engine:stderr");
        m_err = std::make_unique<LineChannel>(-1, m_process->stderrFd(), errLog,
                                              [errLog](const std::string &l)
                                              { errLog.debug(l); });
        m_out = std::make_unique<LineChannel>(m_process->stdinFd(), m_process->stdoutFd(),
                                              m_log.child("Engine"));
        send("uci");
        m_state.store(HandshakeState::AwaitingUciOk);
      }
      catch (const std::exception &e)
      {
        m_log.error(std::string("Failed to start engine: ") + e.what());
        teardown();
        throw HandshakeError(std::string("Failed to start engine: ") + e.what());
      }
    }

    // The handshake runs without the lifecycle lock so stop() can interrupt it.
    const auto timeout = milliseconds(m_cfg.handshakeTimeoutMs);
    try
    {
      std::lock_guard opLk(m_opMtx);
      if (m_generation != generation || !m_out)
        throw HandshakeError("Engine stopped during startup");

      uci::HandshakeAccumulator acc = awaitUciOk(Clock::now() + timeout);
      m_id = acc.id;
      m_options = OptionRegistry(std::move(acc.options));
      m_state.store(HandshakeState::AwaitingReadyOk);
      m_log.debug("uciok: " + std::to_string(acc.optionOrder.size()) + " options advertised");

      applyConfiguredOptions();
      syncReady(Clock::now() + timeout);

      m_state.store(HandshakeState::Ready);
      m_log.info("Engine " + m_id.name.value_or(m_cfg.engineName) + " started and ready");
    }
    catch (const HandshakeError &e)
    {
      abortStart(generation, e.what());
      throw;
    }
    catch (const BridgeError &e)
    {
      abortStart(generation, e.what());
      throw HandshakeError(std::string("Failed to start engine: ") + e.what());
    }
  }

  void UciBridge::abortStart(std::uint64_t generation, const char *why)
  {
    m_log.error(std::string("Failed to start engine: ") + why);
    std::scoped_lock lk(m_lifecycleMtx, m_opMtx);
    // stop() may already have torn this process down, or a new one started.
    if (m_generation == generation)
      teardown();
  }

  void UciBridge::stop()
  {
    std::lock_guard lk(m_lifecycleMtx);
    if (!m_process)
      return;

    m_log.info("Stopping engine: " + m_cfg.enginePath);
    m_state.store(HandshakeState::Stopped);
    m_forcedKill.store(false);

    // best-effort graceful shutdown
    if (m_out)
    {
      try
      {
        m_out->writeLine("quit");
      }
      catch (const WriteError &e)
      {
        m_log.debug(std::string("quit not delivered: ") + e.what());
      }
      m_out->shutdownWrites();
    }
    m_process->closeStdin();

    if (!m_process->waitExit(milliseconds(m_cfg.quitGraceMs)))
    {
      m_log.warn("Engine " + m_cfg.enginePath + " did not exit, terminating");
      m_process->kill();
      m_forcedKill.store(true);
    }

    // Wakes any reader still blocked in an operation.
    if (m_out)
      m_out->close();
    if (m_err)
      m_err->close();

    std::lock_guard opLk(m_opMtx);
    teardown();
  }

  // Caller holds m_opMtx. Safe to call on a half-started bridge.
  void UciBridge::teardown()
  {
    m_state.store(HandshakeState::Stopped);
    if (m_out)
      m_out->close();
    if (m_err)
      m_err->close();
    if (m_process)
    {
      m_process->closeStdin();
      if (!m_process->waitExit(0ms))
        m_process->kill();
      m_process->closeOutputs();
    }
    m_out.reset();
    m_err.reset();
    m_process.reset();
    m_searchPending = false;
  }

  void UciBridge::requireReady(const char *op) const
  {
    const auto s = state();
    if (s != HandshakeState::Ready)
      throw EngineNotReadyError(std::string("Engine not ready for ") + op + " (state: " +
                                toString(s) + ")");
  }

  void UciBridge::send(const std::string &line)
  {
    try
    {
      m_out->writeLine(line);
    }
    catch (const WriteError &e)
    {
      m_state.store(HandshakeState::Stopped);
      m_log.error(e.what());
      throw;
    }
  }

  void UciBridge::channelClosed(const char *phase)
  {
    m_state.store(HandshakeState::Stopped);
    if (m_out->closed())
      m_log.info(std::string("bridge stopped during ") + phase);
    else
      m_log.error(std::string("engine closed its output during ") + phase);
    throw ProcessClosedError(std::string("Engine process closed during ") + phase);
  }

  std::string UciBridge::readLineOrThrow(Clock::time_point deadline, const char *phase)
  {
    std::string line;
    switch (m_out->readLine(line, deadline))
    {
    case ReadStatus::Line:
      return line;
    case ReadStatus::Timeout:
      throw TimeoutError(std::string("timed out waiting for engine during ") + phase);
    case ReadStatus::Closed:
      break;
    }
    channelClosed(phase);
  }

  uci::HandshakeAccumulator UciBridge::awaitUciOk(Clock::time_point deadline)
  {
    uci::HandshakeAccumulator acc;
    while (!acc.consume(readLineOrThrow(deadline, "uci handshake")))
    {
    }
    return acc;
  }

  void UciBridge::syncReady(Clock::time_point deadline)
  {
    send("isready");
    while (readLineOrThrow(deadline, "isready") != "readyok")
    {
    }
  }

  void UciBridge::applyConfiguredOptions()
  {
    OptionList typed;
    typed.reserve(m_cfg.options.size());
    for (auto &[name, text] : m_cfg.options)
      typed.emplace_back(name, m_options.coerce(name, text));

    const OptionUpdate upd = m_options.partition(typed);
    for (auto &[name, err] : upd.errors)
      m_log.warn("Skipping configured option " + name + ": " + err);

    std::set<std::string> sent;
    for (auto &kv : typed)
    {
      auto it = upd.applied.find(kv.first);
      if (it == upd.applied.end() || !sent.insert(kv.first).second)
        continue;
      send(uci::formatSetOption(it->first, it->second));
      m_options.record(it->first, it->second);
    }
  }

  // Waits no later than notAfter, so a caller's own deadline still holds.
  void UciBridge::settlePendingSearch(Clock::time_point notAfter)
  {
    if (!m_searchPending)
      return;
    m_searchPending = false;

    // The timed-out search was sent "stop"; its bestmove belongs to nobody.
    const auto deadline =
        std::min(Clock::now() + milliseconds(std::max(m_cfg.analysisSlackMs, 100)), notAfter);
    for (;;)
    {
      std::string line;
      const auto st = m_out->readLine(line, deadline);
      if (st == ReadStatus::Closed)
        channelClosed("late bestmove drain");
      if (st == ReadStatus::Timeout)
      {
        m_log.warn("engine never answered stop for the previous search");
        break;
      }
      if (uci::parseBestmove(line))
      {
        m_log.debug("discarded late " + line);
        break;
      }
    }
    m_out->drain();
  }

  AnalysisResult UciBridge::analyze(const std::string &fen, std::optional<int> timeMs)
  {
    std::lock_guard lk(m_opMtx);
    requireReady("analyze");

    const int t = timeMs.value_or(m_cfg.defaultThinkTimeMs);
    if (t <= 0)
      throw std::invalid_argument("think time must be positive");

    // Engines flush their last lines after their own clock runs out. The
    // bound covers settling a previous search too.
    const auto deadline =
        Clock::now() + milliseconds(t) + milliseconds(m_cfg.analysisSlackMs);

    settlePendingSearch(deadline);
    send(uci::formatPosition(fen, {}));
    send(uci::formatGoMovetime(t));

    AnalysisResult r;
    for (;;)
    {
      std::string line;
      const auto st = m_out->readLine(line, deadline);
      if (st == ReadStatus::Timeout)
      {
        m_log.warn("analysis deadline reached before bestmove; returning depth " +
                   std::to_string(r.depth));
        send("stop");
        m_searchPending = true;
        break;
      }
      if (st == ReadStatus::Closed)
        channelClosed("analysis");

      if (auto bm = uci::parseBestmove(line))
      {
        if (*bm != "(none)")
          r.bestMove = *bm;
        break;
      }
      if (uci::startsWith(line, "info "))
        uci::foldInfoLine(line, r);
    }
    return r;
  }

  void UciBridge::setPosition(const std::optional<std::string> &fen,
                              const std::vector<std::string> &moves)
  {
    for (auto &m : moves)
    {
      if (m.size() < 4 || m.size() > 5)
        throw std::invalid_argument("Invalid UCI move: " + m);
    }

    std::lock_guard lk(m_opMtx);
    requireReady("position");
    settlePendingSearch();
    send(uci::formatPosition(fen, moves));
  }

  std::string UciBridge::getBestMove(std::optional<int> timeMs)
  {
    std::lock_guard lk(m_opMtx);
    requireReady("go");

    const int t = timeMs.value_or(m_cfg.defaultThinkTimeMs);
    if (t <= 0)
      throw std::invalid_argument("think time must be positive");

    settlePendingSearch();
    send(uci::formatGoMovetime(t));

    const milliseconds budget = milliseconds(t) + milliseconds(m_cfg.bestMoveGraceMs);
    auto deadline = Clock::now() + budget;
    bool stopSent = false;
    for (;;)
    {
      std::string line;
      const auto st = m_out->readLine(line, deadline);
      if (st == ReadStatus::Closed)
        channelClosed("best move search");
      if (st == ReadStatus::Timeout)
      {
        if (!stopSent)
        {
          m_log.warn("no bestmove after " + std::to_string(budget.count()) +
                     " ms, sending stop");
          send("stop");
          stopSent = true;
          deadline = Clock::now() + milliseconds(std::max(m_cfg.analysisSlackMs, 100));
          continue;
        }
        m_searchPending = true;
        throw TimeoutError("Engine did not report a best move");
      }

      if (auto bm = uci::parseBestmove(line))
        return *bm;
    }
  }

  void UciBridge::newGame()
  {
    std::lock_guard lk(m_opMtx);
    requireReady("ucinewgame");
    settlePendingSearch();
    send("ucinewgame");
    syncReady(Clock::now() + milliseconds(m_cfg.handshakeTimeoutMs));
  }

  EngineId UciBridge::getEngineId() const
  {
    std::lock_guard lk(m_opMtx);
    return m_id;
  }

  std::map<std::string, UciOption> UciBridge::getAvailableOptions() const
  {
    std::lock_guard lk(m_opMtx);
    return m_options.available();
  }

  OptionValues UciBridge::getCurrentOptionValues() const
  {
    std::lock_guard lk(m_opMtx);
    return m_options.currentValues();
  }

  UciValue UciBridge::coerceOptionValue(const std::string &name, const std::string &text) const
  {
    std::lock_guard lk(m_opMtx);
    return m_options.coerce(name, text);
  }

  OptionUpdate UciBridge::setOptions(const OptionList &values)
  {
    std::lock_guard lk(m_opMtx);
    requireReady("setoption");

    OptionUpdate upd = m_options.partition(values);
    for (auto &[name, err] : upd.errors)
      m_log.warn("Rejected option " + name + ": " + err);
    if (upd.applied.empty())
      return upd;

    settlePendingSearch();

    std::set<std::string> sent;
    for (auto &kv : values)
    {
      auto it = upd.applied.find(kv.first);
      if (it == upd.applied.end() || !sent.insert(kv.first).second)
        continue;
      send(uci::formatSetOption(it->first, it->second));
    }
    syncReady(Clock::now() + milliseconds(m_cfg.handshakeTimeoutMs));

    for (auto &[name, v] : upd.applied)
      m_options.record(name, v);
    return upd;
  }

} // namespace ucibridge::engine
