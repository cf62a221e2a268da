#include <cassert>
#include <cstdlib>
#include <sstream>
#include <string>

#include "ucibridge/app/request_dispatcher.hpp"
#include "ucibridge/engine/uci_bridge.hpp"
#include "ucibridge/log.hpp"

#ifndef UCIBRIDGE_FAKE_ENGINE
#error "UCIBRIDGE_FAKE_ENGINE must name the fake engine executable"
#endif

using namespace ucibridge;

static bool has(const std::string &s, const char *needle)
{
  return s.find(needle) != std::string::npos;
}

int main()
{
  ::setenv("UCIBRIDGE_FAKE_MODE", "normal", 1);

  config::BridgeConfig cfg;
  cfg.enginePath = UCIBRIDGE_FAKE_ENGINE;
  cfg.engineName = "fake";
  cfg.defaultThinkTimeMs = 50;
  cfg.analysisSlackMs = 200;

  engine::UciBridge bridge(cfg, Logger("DispatcherTest", LogLevel::Off));
  bridge.start();
  app::RequestDispatcher d(bridge, Logger("Request", LogLevel::Off));

  auto call = [&](const std::string &line)
  {
    std::ostringstream out;
    const bool more = d.handle(line, out);
    assert(more || line == "quit");
    return out.str();
  };

  {
    const auto r = call("analyze rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1 time_ms=60");
    assert(r == "ok depth=3 score=-0.15 best_move=d2d4 pv=d2d4 d7d5\n");
  }

  {
    const auto r = call("analyze 8/8/8/8/8/8/8/K6k w - - 0 1 time_ms=2147483647");
    assert(r == "ok depth=3 score=-0.15 best_move=d2d4 pv=d2d4 d7d5\n");
  }

  {
    assert(has(call("analyze time_ms=60"), "error Missing required parameter 'fen'"));
    assert(has(call("analyze startpos time_ms=abc"), "error time_ms"));
  }

  {
    assert(call("set_position startpos moves e2e4 e7e5") == "ok\n");
    assert(call("set_position fen 8/8/8/8/8/8/8/K6k w - - 0 1") == "ok\n");
    assert(has(call("set_position moves e2"), "error Invalid UCI move: e2"));
    assert(has(call("set_position bogus"), "error"));
    assert(call("get_best_move time_ms=20") == "ok move=d2d4\n");
    assert(call("get_best_move fen mated now") == "ok move=(none)\n");
  }

  {
    const auto r = call("set_engine_options Hash=64; Ponder=on; Threads=5000; Foo=1");
    assert(r.rfind("ok 4\n", 0) == 0);
    assert(has(r, "applied Hash = 64\n"));
    assert(has(r, "applied Ponder = true\n"));
    assert(has(r, "rejected Threads: "));
    assert(has(r, "rejected Foo: Unsupported option: Foo"));
    assert(has(call("set_engine_options"), "error"));
  }

  {
    const auto r = call("get_engine_options");
    assert(r.rfind("ok 7\n", 0) == 0);
    assert(has(r, "option name Hash type spin default 16 min 1 max 33554432 current 64\n"));
    assert(has(r, "option name Clear Hash type button\n"));
  }

  {
    const auto r = call("engine_info");
    assert(r.rfind("ok name=fake ", 0) == 0);
    assert(has(r, "state=ready"));
    assert(has(r, "id_name=\"FakeEngine 1.0\""));
    assert(has(r, "options=Hash=64;Ponder=true"));
  }

  assert(call("new_game") == "ok\n");
  assert(call("teleport now") == "error Unsupported method: teleport\n");
  assert(call("   ") == "");

  {
    std::istringstream in("new_game\nquit\nnew_game\n");
    std::ostringstream out;
    assert(d.run(in, out) == 0);
    assert(out.str() == "ok\nok\n");
  }

  bridge.stop();
  return 0;
}
