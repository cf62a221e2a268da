#include "ucibridge/engine/uci_types.hpp"

#include <iomanip>
#include <sstream>

namespace ucibridge::engine
{
  const char *toString(HandshakeState s)
  {
    switch (s)
    {
    case HandshakeState::Uninitialized:
      return "uninitialized";
    case HandshakeState::AwaitingUciOk:
      return "awaiting-uciok";
    case HandshakeState::AwaitingReadyOk:
      return "awaiting-readyok";
    case HandshakeState::Ready:
      return "ready";
    case HandshakeState::Stopped:
      return "stopped";
    }
    return "unknown";
  }

  const char *toString(UciOption::Type t)
  {
    using T = UciOption::Type;
    switch (t)
    {
    case T::Check:
      return "check";
    case T::Spin:
      return "spin";
    case T::Combo:
      return "combo";
    case T::String:
      return "string";
    case T::Button:
      return "button";
    }
    return "string";
  }

  std::string toString(const UciValue &v)
  {
    if (std::holds_alternative<bool>(v))
      return std::get<bool>(v) ? "true" : "false";
    if (std::holds_alternative<std::int64_t>(v))
      return std::to_string(std::get<std::int64_t>(v));
    if (std::holds_alternative<std::string>(v))
      return std::get<std::string>(v);
    return {};
  }

  std::string toString(const Score &s)
  {
    if (s.kind == Score::Kind::Mate)
      return "mate" + std::to_string(s.mateIn);

    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << s.pawns;
    return os.str();
  }

} // namespace ucibridge::engine
