// Drives UciBridge against the scripted fake engine.
#include <atomic>
#include <cassert>
#include <chrono>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>
#include <vector>

#include <sys/stat.h>
#include <unistd.h>

#include "ucibridge/engine/uci_bridge.hpp"
#include "ucibridge/errors.hpp"
#include "ucibridge/log.hpp"

#ifndef UCIBRIDGE_FAKE_ENGINE
#error "UCIBRIDGE_FAKE_ENGINE must name the fake engine executable"
#endif

using namespace ucibridge;
using namespace ucibridge::engine;
using namespace std::chrono_literals;
using Clock = std::chrono::steady_clock;

static const std::string kFen = "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq - 0 1";

static config::BridgeConfig fakeConfig(const char *mode)
{
  ::setenv("UCIBRIDGE_FAKE_MODE", mode, 1);
  config::BridgeConfig cfg;
  cfg.enginePath = UCIBRIDGE_FAKE_ENGINE;
  cfg.engineName = "fake";
  cfg.analysisSlackMs = 200;
  cfg.bestMoveGraceMs = 2000;
  cfg.handshakeTimeoutMs = 3000;
  cfg.quitGraceMs = 1000;
  return cfg;
}

static Logger quietLog()
{
  return Logger("BridgeTest", LogLevel::Off);
}

template <class E, class F>
static bool throwsAs(F &&f)
{
  try
  {
    f();
  }
  catch (const E &)
  {
    return true;
  }
  return false;
}

int main()
{
  // Handshake, identity, advertised options
  {
    UciBridge bridge(fakeConfig("normal"), quietLog());
    assert(bridge.state() == HandshakeState::Uninitialized);
    bridge.start();
    assert(bridge.isReady());

    const auto id = bridge.getEngineId();
    assert(id.name == std::string("FakeEngine 1.0"));
    assert(id.author == std::string("Bridge Tests"));

    const auto opts = bridge.getAvailableOptions();
    assert(opts.size() == 7);
    assert(opts.at("Hash").type == UciOption::Type::Spin);
    assert(*opts.at("Hash").max == 33554432);
    assert(opts.at("Clear Hash").type == UciOption::Type::Button);
    assert(opts.at("Skill Level").min && *opts.at("Skill Level").min == 0);
    assert(bridge.getCurrentOptionValues().empty());

    bridge.stop();
    assert(bridge.state() == HandshakeState::Stopped);
    assert(!bridge.forcedTermination());
    bridge.stop(); // idempotent
  }

  // Analysis folds out-of-order info lines
  {
    UciBridge bridge(fakeConfig("normal"), quietLog());
    bridge.start();

    const auto t0 = Clock::now();
    const AnalysisResult r = bridge.analyze(kFen, 100);
    assert(Clock::now() - t0 < 100ms + 200ms + 500ms);
    assert(r.depth == 3);
    assert(r.score && r.score->kind == Score::Kind::Centipawns);
    assert(std::fabs(r.score->pawns - (-0.15)) < 1e-9);
    assert((r.pv == std::vector<std::string>{"d2d4", "d7d5"}));
    assert(r.bestMove == std::string("d2d4"));

    // back-to-back searches see fresh results
    const AnalysisResult again = bridge.analyze(kFen, 50);
    assert(again.depth == 3 && again.bestMove == std::string("d2d4"));

    bridge.setPosition(std::nullopt, {"e2e4", "e7e5", "e7e8q"});
    assert(bridge.getBestMove(50) == "d2d4");
    assert(throwsAs<std::invalid_argument>([&]
                                           { bridge.setPosition(std::nullopt, {"e2"}); }));
    assert(throwsAs<std::invalid_argument>([&]
                                           { bridge.analyze(kFen, 0); }));
    assert(bridge.isReady());

    bridge.newGame();
    assert(bridge.isReady());
  }

  // No legal move: bestmove (none)
  {
    UciBridge bridge(fakeConfig("normal"), quietLog());
    bridge.start();
    const AnalysisResult r = bridge.analyze("mated position", 50);
    assert(!r.bestMove);
    assert(r.score && r.score->kind == Score::Kind::Mate && r.score->mateIn == 0);

    bridge.setPosition(std::string("mated position"));
    assert(bridge.getBestMove(50) == "(none)");
  }

  // Options: validation, delivery, cache
  {
    UciBridge bridge(fakeConfig("normal"), quietLog());
    bridge.start();

    auto bad = bridge.setOptions({{"Hash", std::int64_t{33554432 + 1000000}}});
    assert(bad.applied.empty());
    assert(bad.errors.at("Hash").find("above maximum") != std::string::npos);
    assert(bridge.getCurrentOptionValues().count("Hash") == 0);

    auto good = bridge.setOptions({{"Hash", std::int64_t{64}},
                                   {"Ponder", true},
                                   {"Clear Hash", UciValue{}},
                                   {"Nope", std::string("x")}});
    assert(good.applied.size() == 3);
    assert(good.errors.count("Nope") == 1);

    const auto cur = bridge.getCurrentOptionValues();
    assert(std::get<std::int64_t>(cur.at("Hash")) == 64);
    assert(std::get<bool>(cur.at("Ponder")));
    assert(cur.count("Clear Hash") == 0);

    assert(std::get<std::int64_t>(bridge.coerceOptionValue("Threads", "4")) == 4);
    assert(bridge.isReady());
  }

  // Configured options are typed, validated and applied during start
  {
    auto cfg = fakeConfig("normal");
    cfg.options = {{"Hash", "64"}, {"Threads", "999999"}, {"Bogus", "1"}, {"Style", "Risky"}};
    UciBridge bridge(cfg, quietLog());
    bridge.start();
    const auto cur = bridge.getCurrentOptionValues();
    assert(cur.size() == 2);
    assert(std::get<std::int64_t>(cur.at("Hash")) == 64);
    assert(std::get<std::string>(cur.at("Style")) == "Risky");
  }

  // Operations before start
  {
    UciBridge bridge(fakeConfig("normal"), quietLog());
    assert(throwsAs<EngineNotReadyError>([&]
                                         { bridge.analyze(kFen, 50); }));
    assert(throwsAs<EngineNotReadyError>([&]
                                         { bridge.getBestMove(50); }));
    assert(throwsAs<EngineNotReadyError>([&]
                                         { bridge.setOptions({{"Hash", std::int64_t{1}}}); }));
    bridge.stop();
  }

  // Spawn failures
  {
    auto cfg = fakeConfig("normal");
    cfg.enginePath = "/nonexistent/engine";
    UciBridge missing(cfg, quietLog());
    assert(throwsAs<SpawnError>([&]
                                { missing.start(); }));
    assert(missing.state() != HandshakeState::Ready);

    const auto path = std::filesystem::temp_directory_path() /
                      ("ucibridge_noexec_" + std::to_string(::getpid()));
    std::ofstream(path) << "not an engine\n";
    ::chmod(path.c_str(), 0644);
    cfg.enginePath = path.string();
    UciBridge noexec(cfg, quietLog());
    assert(throwsAs<SpawnError>([&]
                                { noexec.start(); }));
    std::filesystem::remove(path);
  }

  // Handshake passes through AwaitingReadyOk
  {
    UciBridge bridge(fakeConfig("slow_ready"), quietLog());
    std::atomic_bool sawReadyOkWait{false};
    std::atomic_bool done{false};
    std::thread watcher([&]
                        {
      while (!done.load()) {
        if (bridge.state() == HandshakeState::AwaitingReadyOk)
          sawReadyOkWait.store(true);
        std::this_thread::sleep_for(1ms);
      } });
    bridge.start();
    done.store(true);
    watcher.join();
    assert(sawReadyOkWait.load());
    assert(bridge.isReady());
  }

  // Engine never sends uciok
  {
    auto cfg = fakeConfig("no_uciok");
    cfg.handshakeTimeoutMs = 200;
    UciBridge bridge(cfg, quietLog());
    assert(throwsAs<HandshakeError>([&]
                                    { bridge.start(); }));
    assert(bridge.state() == HandshakeState::Stopped);
  }

  // Analysis is bounded by time + slack even if the engine stays silent
  {
    auto cfg = fakeConfig("silent");
    cfg.analysisSlackMs = 100;
    cfg.bestMoveGraceMs = 100;
    UciBridge bridge(cfg, quietLog());
    bridge.start();

    const auto t0 = Clock::now();
    const AnalysisResult r = bridge.analyze(kFen, 100);
    const auto took = Clock::now() - t0;
    assert(took >= 200ms);
    assert(took < 200ms + 300ms);
    assert(r.depth == 0 && !r.score && !r.bestMove);
    assert(bridge.isReady());

    // The late bestmove of the abandoned search is not mistaken for this one;
    // "stop" forces the silent engine to answer.
    assert(bridge.getBestMove(50) == "a2a3");
  }

  // An engine that ignores "stop" too
  {
    auto cfg = fakeConfig("mute");
    cfg.analysisSlackMs = 100;
    cfg.bestMoveGraceMs = 100;
    UciBridge bridge(cfg, quietLog());
    bridge.start();
    assert(throwsAs<TimeoutError>([&]
                                  { bridge.getBestMove(50); }));
    bridge.stop();
  }

  // Back-to-back timed-out analyses each stay within time + slack, including
  // the wait for the previous search's bestmove
  {
    auto cfg = fakeConfig("mute");
    cfg.analysisSlackMs = 200;
    UciBridge bridge(cfg, quietLog());
    bridge.start();
    for (int i = 0; i < 3; ++i)
    {
      const auto t0 = Clock::now();
      const AnalysisResult r = bridge.analyze(kFen, 100);
      const auto took = Clock::now() - t0;
      assert(took >= 300ms);
      assert(took < 300ms + 150ms);
      assert(r.depth == 0 && !r.bestMove);
    }
    bridge.stop();
  }

  // Think times near INT_MAX do not wrap the deadline into the past
  {
    UciBridge bridge(fakeConfig("normal"), quietLog());
    bridge.start();
    const AnalysisResult r = bridge.analyze(kFen, INT_MAX - 100);
    assert(r.depth == 3);
    assert(r.bestMove == std::string("d2d4"));
    assert(bridge.getBestMove(INT_MAX) == "d2d4");
  }

  // Engine exits mid-search
  {
    UciBridge bridge(fakeConfig("crash_on_go"), quietLog());
    bridge.start();
    assert(throwsAs<ProcessClosedError>([&]
                                        { bridge.analyze(kFen, 100); }));
    assert(bridge.state() == HandshakeState::Stopped);
    assert(throwsAs<EngineNotReadyError>([&]
                                         { bridge.getBestMove(50); }));
    bridge.stop();
  }

  // quit ignored: forced kill after the grace period
  {
    auto cfg = fakeConfig("ignore_quit");
    cfg.quitGraceMs = 200;
    UciBridge bridge(cfg, quietLog());
    bridge.start();
    const auto t0 = Clock::now();
    bridge.stop();
    assert(Clock::now() - t0 >= 200ms);
    assert(bridge.forcedTermination());
    assert(bridge.state() == HandshakeState::Stopped);
  }

  // stop() from another thread interrupts a blocked search
  {
    auto cfg = fakeConfig("mute");
    cfg.bestMoveGraceMs = 10000;
    UciBridge bridge(cfg, quietLog());
    bridge.start();

    std::atomic_bool closed{false};
    std::thread searcher([&]
                         {
      try {
        bridge.getBestMove(5000);
      } catch (const ProcessClosedError &) {
        closed.store(true);
      } });
    std::this_thread::sleep_for(100ms);
    const auto t0 = Clock::now();
    bridge.stop();
    searcher.join();
    assert(closed.load());
    assert(Clock::now() - t0 < 3s);
  }

  // stop() interrupts a stalled handshake; the bridge stays usable afterwards
  {
    auto cfg = fakeConfig("no_uciok");
    cfg.handshakeTimeoutMs = 5000;
    UciBridge bridge(cfg, quietLog());

    std::atomic_bool failed{false};
    std::thread starter([&]
                        {
      try {
        bridge.start();
      } catch (const HandshakeError &) {
        failed.store(true);
      } });
    std::this_thread::sleep_for(100ms);
    const auto t0 = Clock::now();
    bridge.stop();
    starter.join();
    assert(failed.load());
    assert(Clock::now() - t0 < 2s);
    assert(bridge.state() == HandshakeState::Stopped);
    bridge.stop();

    ::setenv("UCIBRIDGE_FAKE_MODE", "normal", 1);
    bridge.start();
    assert(bridge.isReady());
    assert(bridge.getBestMove(20) == "d2d4");
  }

  // A failed start leaves nothing half-open: stop() is a no-op, start() works
  {
    auto cfg = fakeConfig("no_uciok");
    cfg.handshakeTimeoutMs = 200;
    UciBridge bridge(cfg, quietLog());
    assert(throwsAs<HandshakeError>([&]
                                    { bridge.start(); }));
    bridge.stop();
    assert(!bridge.forcedTermination());

    ::setenv("UCIBRIDGE_FAKE_MODE", "normal", 1);
    bridge.start();
    assert(bridge.isReady());
  }

  // The bridge can be started again after stop
  {
    UciBridge bridge(fakeConfig("normal"), quietLog());
    bridge.start();
    bridge.stop();
    bridge.start();
    assert(bridge.isReady());
    assert(bridge.getBestMove(20) == "d2d4");
  }

  return 0;
}
