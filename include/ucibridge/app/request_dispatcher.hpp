#pragma once
#include <iosfwd>
#include <map>
#include <string>

#include "ucibridge/engine/uci_bridge.hpp"
#include "ucibridge/log.hpp"

namespace ucibridge::app {

// Line-oriented request channel in front of a started bridge. Every request
// gets "ok ..." or "error <message>"; list-valued replies are "ok <n>"
// followed by n lines.
class RequestDispatcher {
 public:
  RequestDispatcher(engine::UciBridge& bridge, Logger log);

  // Returns false once the session is over (quit, or the engine died).
  bool handle(const std::string& line, std::ostream& out);

  // Reads requests until EOF or quit.
  int run(std::istream& in, std::ostream& out);

 private:
  using Handler = void (RequestDispatcher::*)(const std::string& args, std::ostream& out);

  void analyze(const std::string& args, std::ostream& out);
  void getBestMove(const std::string& args, std::ostream& out);
  void setPosition(const std::string& args, std::ostream& out);
  void engineInfo(const std::string& args, std::ostream& out);
  void engineOptions(const std::string& args, std::ostream& out);
  void setEngineOptions(const std::string& args, std::ostream& out);
  void newGame(const std::string& args, std::ostream& out);

  engine::UciBridge& m_bridge;
  Logger m_log;
  std::map<std::string, Handler> m_handlers;
};

}  // namespace ucibridge::app
