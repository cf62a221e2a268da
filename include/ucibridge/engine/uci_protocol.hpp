#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ucibridge/engine/uci_types.hpp"

namespace ucibridge::engine::uci
{
  inline bool startsWith(const std::string &s, const char *pfx)
  {
    return s.rfind(pfx, 0) == 0;
  }

  std::vector<std::string> splitWs(const std::string &s);

  // option name <N> type <T> [default <D>] [min <m>] [max <M>] [var <V>]*
  // Keyword values run up to the next keyword, so "Skill Level" survives.
  bool parseOptionLine(const std::string &line, UciOption &out);
  std::string serializeOptionLine(const UciOption &opt);

  // Accumulates identity and option metadata over the lines that precede
  // "uciok". consume() returns true once "uciok" has been seen.
  struct HandshakeAccumulator
  {
    EngineId id;
    std::map<std::string, UciOption> options;
    std::vector<std::string> optionOrder;
    bool complete{false};

    bool consume(const std::string &line);
  };

  // Folds one "info ..." line into the running result: depth only ratchets
  // upwards, score is overwritten, pv is replaced as a whole.
  void foldInfoLine(const std::string &line, AnalysisResult &acc);

  // "bestmove e2e4 [ponder e7e5]" -> "e2e4"; nullopt for any other line.
  std::optional<std::string> parseBestmove(const std::string &line);

  std::string formatSetOption(const std::string &name, const UciValue &v);
  std::string formatPosition(const std::optional<std::string> &fen,
                             const std::vector<std::string> &movesUci);
  std::string formatGoMovetime(int movetimeMs);

} // namespace ucibridge::engine::uci
