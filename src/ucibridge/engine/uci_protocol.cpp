#include "ucibridge/engine/uci_protocol.hpp"

#include <charconv>
#include <sstream>
#include <string_view>

namespace ucibridge::engine::uci
{
  namespace
  {
    bool isOptionKeyword(const std::string &tok)
    {
      return tok == "name" || tok == "type" || tok == "default" || tok == "min" || tok == "max" ||
             tok == "var";
    }

    std::string join(const std::vector<std::string> &t, size_t from, size_t toExcl)
    {
      std::string out;
      for (size_t i = from; i < toExcl; ++i)
      {
        if (!out.empty())
          out += ' ';
        out += t[i];
      }
      return out;
    }

    std::optional<std::int64_t> parseInteger(std::string_view sv)
    {
      if (!sv.empty() && sv.front() == '+')
        sv.remove_prefix(1);
      std::int64_t v = 0;
      auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
      if (ec != std::errc() || ptr != sv.data() + sv.size() || sv.empty())
        return std::nullopt;
      return v;
    }

    UciOption::Type parseType(const std::string &tok)
    {
      using T = UciOption::Type;
      if (tok == "check")
        return T::Check;
      if (tok == "spin")
        return T::Spin;
      if (tok == "combo")
        return T::Combo;
      if (tok == "button")
        return T::Button;
      return T::String;
    }
  } // namespace

  std::vector<std::string> splitWs(const std::string &s)
  {
    std::vector<std::string> v;
    std::istringstream is(s);
    std::string t;
    while (is >> t)
      v.push_back(std::move(t));
    return v;
  }

  bool parseOptionLine(const std::string &line, UciOption &out)
  {
    const auto tok = splitWs(line);
    if (tok.size() < 2 || tok[0] != "option" || tok[1] != "name")
      return false;

    // Walk keyword by keyword; each keyword owns the tokens up to the next one.
    // A name only ends at "type" because names may contain other keywords.
    std::string name, typeTok, defaultTok;
    std::optional<std::int64_t> min, max;
    std::vector<std::string> vars;
    bool haveDefault = false;

    size_t i = 1;
    while (i < tok.size())
    {
      const std::string kw = tok[i];
      size_t j = i + 1;
      if (kw == "name")
      {
        while (j < tok.size() && tok[j] != "type")
          ++j;
      }
      else
      {
        while (j < tok.size() && !isOptionKeyword(tok[j]))
          ++j;
      }

      const std::string value = join(tok, i + 1, j);
      if (kw == "name")
        name = value;
      else if (kw == "type")
        typeTok = value;
      else if (kw == "default")
      {
        defaultTok = value;
        haveDefault = true;
      }
      else if (kw == "min")
        min = parseInteger(value);
      else if (kw == "max")
        max = parseInteger(value);
      else if (kw == "var")
        vars.push_back(value);
      // anything else is an unknown leading token; skip it

      i = j;
    }

    if (name.empty() || typeTok.empty())
      return false;

    using T = UciOption::Type;
    out = {};
    out.name = std::move(name);
    out.type = parseType(typeTok);

    if (defaultTok == "<empty>")
      defaultTok.clear();

    switch (out.type)
    {
    case T::Check:
      out.defaultValue = haveDefault && defaultTok == "true";
      break;
    case T::Spin:
      if (auto v = parseInteger(defaultTok))
        out.defaultValue = *v;
      out.min = min;
      out.max = max;
      break;
    case T::Combo:
      if (haveDefault)
        out.defaultValue = defaultTok;
      out.vars = std::move(vars);
      break;
    case T::String:
      if (haveDefault)
        out.defaultValue = defaultTok;
      break;
    case T::Button:
      break;
    }
    return true;
  }

  std::string serializeOptionLine(const UciOption &opt)
  {
    using T = UciOption::Type;
    std::ostringstream os;
    os << "option name " << opt.name << " type " << toString(opt.type);
    if (opt.type != T::Button && !std::holds_alternative<std::monostate>(opt.defaultValue))
    {
      const std::string d = toString(opt.defaultValue);
      os << " default " << (d.empty() ? "<empty>" : d);
    }
    if (opt.min)
      os << " min " << *opt.min;
    if (opt.max)
      os << " max " << *opt.max;
    for (auto &v : opt.vars)
      os << " var " << v;
    return os.str();
  }

  bool HandshakeAccumulator::consume(const std::string &line)
  {
    if (complete)
      return true;

    if (line == "uciok")
    {
      complete = true;
    }
    else if (startsWith(line, "id name "))
    {
      id.name = line.substr(std::string("id name ").size());
    }
    else if (startsWith(line, "id author "))
    {
      id.author = line.substr(std::string("id author ").size());
    }
    else if (startsWith(line, "option name "))
    {
      UciOption opt;
      if (parseOptionLine(line, opt))
      {
        auto [it, inserted] = options.insert_or_assign(opt.name, opt);
        if (inserted)
          optionOrder.push_back(it->first);
      }
    }
    return complete;
  }

  void foldInfoLine(const std::string &line, AnalysisResult &acc)
  {
    const auto parts = splitWs(line);
    if (parts.empty() || parts[0] != "info")
      return;

    size_t i = 1;
    while (i < parts.size())
    {
      const std::string &tok = parts[i];
      if (tok == "depth" && i + 1 < parts.size())
      {
        if (auto d = parseInteger(parts[i + 1]); d && *d > acc.depth)
          acc.depth = static_cast<int>(*d);
        i += 2;
      }
      else if (tok == "score" && i + 2 < parts.size())
      {
        auto v = parseInteger(parts[i + 2]);
        if (v && parts[i + 1] == "cp")
          acc.score = Score::fromCentipawns(static_cast<int>(*v));
        else if (v && parts[i + 1] == "mate")
          acc.score = Score::mate(static_cast<int>(*v));
        i += 3;
      }
      else if (tok == "pv" && i + 1 < parts.size())
      {
        std::vector<std::string> pv;
        ++i;
        while (i < parts.size() && parts[i] != "depth" && parts[i] != "score" &&
               parts[i] != "time")
          pv.push_back(parts[i++]);
        if (!pv.empty())
          acc.pv = std::move(pv);
      }
      else if (tok == "string")
      {
        // free text to end of line
        break;
      }
      else
      {
        ++i;
      }
    }
  }

  std::optional<std::string> parseBestmove(const std::string &line)
  {
    if (line != "bestmove" && !startsWith(line, "bestmove "))
      return std::nullopt;

    const auto parts = splitWs(line);
    if (parts.size() < 2)
      return std::string("(none)");
    return parts[1];
  }

  std::string formatSetOption(const std::string &name, const UciValue &v)
  {
    std::ostringstream os;
    os << "setoption name " << name;
    if (std::holds_alternative<std::monostate>(v))
      return os.str();

    const std::string s = toString(v);
    os << " value " << (s.empty() ? "<empty>" : s);
    return os.str();
  }

  std::string formatPosition(const std::optional<std::string> &fen,
                             const std::vector<std::string> &movesUci)
  {
    std::ostringstream os;
    os << "position";
    if (fen && !fen->empty())
      os << " fen " << *fen;
    else
      os << " startpos";
    if (!movesUci.empty())
    {
      os << " moves";
      for (auto &m : movesUci)
        os << ' ' << m;
    }
    return os.str();
  }

  std::string formatGoMovetime(int movetimeMs)
  {
    std::ostringstream os;
    os << "go movetime " << movetimeMs;
    return os.str();
  }

} // namespace ucibridge::engine::uci
