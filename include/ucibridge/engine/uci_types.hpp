#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ucibridge::engine
{

  enum class HandshakeState
  {
    Uninitialized,
    AwaitingUciOk,
    AwaitingReadyOk,
    Ready,
    Stopped
  };

  const char *toString(HandshakeState s);

  // std::monostate is "no value" (buttons, unset strings).
  using UciValue = std::variant<std::monostate, bool, std::int64_t, std::string>;

  std::string toString(const UciValue &v);

  // Ordered name/value pairs; order is the order commands are sent in.
  using OptionList = std::vector<std::pair<std::string, UciValue>>;
  using OptionValues = std::map<std::string, UciValue>;

  struct UciOption
  {
    enum class Type
    {
      Check,
      Spin,
      Combo,
      String,
      Button
    };
    std::string name;
    Type type{Type::String};
    UciValue defaultValue;
    std::optional<std::int64_t> min, max; // spin only
    std::vector<std::string> vars;        // combo only
  };

  const char *toString(UciOption::Type t);

  struct EngineId
  {
    std::optional<std::string> name, author;
  };

  struct Score
  {
    enum class Kind
    {
      Centipawns,
      Mate
    };
    Kind kind{Kind::Centipawns};
    double pawns{0.0}; // centipawns / 100
    int mateIn{0};     // negative: side to move gets mated

    static Score fromCentipawns(int cp) { return Score{Kind::Centipawns, cp / 100.0, 0}; }
    static Score mate(int n) { return Score{Kind::Mate, 0.0, n}; }
  };

  // "0.35" or "mate3"
  std::string toString(const Score &s);

  struct AnalysisResult
  {
    int depth{0};
    std::optional<Score> score;
    std::vector<std::string> pv;
    std::optional<std::string> bestMove;
  };

} // namespace ucibridge::engine
