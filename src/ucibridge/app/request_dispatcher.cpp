#include "ucibridge/app/request_dispatcher.hpp"

#include <cctype>
#include <charconv>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "ucibridge/engine/uci_protocol.hpp"
#include "ucibridge/errors.hpp"

namespace ucibridge::app {

namespace {

std::string trim(std::string s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.erase(s.begin());
  while (!s.empty() && std::isspace((unsigned char)s.back())) s.pop_back();
  return s;
}

std::string join_tokens(const std::vector<std::string>& t, size_t from, size_t to_excl) {
  std::string out;
  for (size_t i = from; i < to_excl && i < t.size(); ++i) {
    if (!out.empty()) out += ' ';
    out += t[i];
  }
  return out;
}

std::string quote(const std::string& v) {
  if (!v.empty() && v.find_first_of(" \t\"") == std::string::npos) return v;
  std::string out = "\"";
  for (char c : v) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  return out + '"';
}

// Pulls "time_ms=<n>" out of the token list.
std::optional<int> take_time_ms(std::vector<std::string>& tok) {
  std::optional<int> t;
  for (auto it = tok.begin(); it != tok.end();) {
    if (it->rfind("time_ms=", 0) == 0) {
      const std::string v = it->substr(8);
      int x = 0;
      auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), x);
      if (v.empty() || ec != std::errc() || ptr != v.data() + v.size() || x <= 0)
        throw std::invalid_argument("time_ms must be a positive integer");
      t = x;
      it = tok.erase(it);
    } else {
      ++it;
    }
  }
  return t;
}

}  // namespace

RequestDispatcher::RequestDispatcher(engine::UciBridge& bridge, Logger log)
    : m_bridge(bridge), m_log(std::move(log)) {
  m_handlers = {
      {"analyze", &RequestDispatcher::analyze},
      {"get_best_move", &RequestDispatcher::getBestMove},
      {"set_position", &RequestDispatcher::setPosition},
      {"engine_info", &RequestDispatcher::engineInfo},
      {"get_engine_options", &RequestDispatcher::engineOptions},
      {"set_engine_options", &RequestDispatcher::setEngineOptions},
      {"new_game", &RequestDispatcher::newGame},
  };
}

bool RequestDispatcher::handle(const std::string& raw, std::ostream& out) {
  const std::string line = trim(raw);
  if (line.empty()) return true;

  const auto sp = line.find(' ');
  const std::string method = line.substr(0, sp);
  const std::string args = sp == std::string::npos ? std::string() : trim(line.substr(sp + 1));

  m_log.debug("request: " + line);

  if (method == "quit") {
    out << "ok" << std::endl;
    return false;
  }

  auto it = m_handlers.find(method);
  if (it == m_handlers.end()) {
    out << "error Unsupported method: " << method << std::endl;
    return true;
  }

  try {
    (this->*(it->second))(args, out);
  } catch (const ProcessClosedError& e) {
    m_log.error("Error handling request " + method + ": " + e.what());
    out << "error " << e.what() << std::endl;
    return false;
  } catch (const std::exception& e) {
    m_log.error("Error handling request " + method + ": " + e.what());
    out << "error " << e.what() << std::endl;
  }
  return true;
}

int RequestDispatcher::run(std::istream& in, std::ostream& out) {
  std::string line;
  while (std::getline(in, line)) {
    if (!handle(line, out)) break;
  }
  return 0;
}

void RequestDispatcher::analyze(const std::string& args, std::ostream& out) {
  auto tok = engine::uci::splitWs(args);
  const auto timeMs = take_time_ms(tok);
  const std::string fen = join_tokens(tok, 0, tok.size());
  if (fen.empty()) throw std::invalid_argument("Missing required parameter 'fen'");

  const auto r = m_bridge.analyze(fen, timeMs);

  out << "ok depth=" << r.depth << " score=" << (r.score ? engine::toString(*r.score) : "none")
      << " best_move=" << r.bestMove.value_or("none") << " pv=" << join_tokens(r.pv, 0, r.pv.size())
      << std::endl;
}

void RequestDispatcher::getBestMove(const std::string& args, std::ostream& out) {
  auto tok = engine::uci::splitWs(args);
  const auto timeMs = take_time_ms(tok);
  if (!tok.empty()) {
    if (tok[0] != "fen" || tok.size() < 2)
      throw std::invalid_argument("expected 'fen <fen>' before time_ms");
    m_bridge.setPosition(join_tokens(tok, 1, tok.size()));
  }

  out << "ok move=" << m_bridge.getBestMove(timeMs) << std::endl;
}

void RequestDispatcher::setPosition(const std::string& args, std::ostream& out) {
  const auto tok = engine::uci::splitWs(args);

  size_t movesAt = tok.size();
  for (size_t i = 0; i < tok.size(); ++i) {
    if (tok[i] == "moves") {
      movesAt = i;
      break;
    }
  }

  std::optional<std::string> fen;
  if (movesAt > 0) {
    if (tok[0] == "fen") {
      fen = join_tokens(tok, 1, movesAt);
      if (fen->empty()) throw std::invalid_argument("Missing FEN after 'fen'");
    } else if (tok[0] != "startpos" || movesAt != 1) {
      throw std::invalid_argument("expected 'fen <fen>' or 'startpos'");
    }
  }

  std::vector<std::string> moves;
  if (movesAt < tok.size()) moves.assign(tok.begin() + movesAt + 1, tok.end());

  m_bridge.setPosition(fen, moves);
  out << "ok" << std::endl;
}

void RequestDispatcher::engineInfo(const std::string&, std::ostream& out) {
  const auto& cfg = m_bridge.config();
  const auto id = m_bridge.getEngineId();

  out << "ok name=" << quote(cfg.engineName) << " path=" << quote(cfg.enginePath)
      << " state=" << engine::toString(m_bridge.state());
  if (id.name) out << " id_name=" << quote(*id.name);
  if (id.author) out << " id_author=" << quote(*id.author);

  std::string opts;
  for (const auto& [name, v] : m_bridge.getCurrentOptionValues()) {
    if (!opts.empty()) opts += ';';
    opts += name + '=' + engine::toString(v);
  }
  out << " options=" << quote(opts) << std::endl;
}

void RequestDispatcher::engineOptions(const std::string&, std::ostream& out) {
  const auto options = m_bridge.getAvailableOptions();
  const auto current = m_bridge.getCurrentOptionValues();

  out << "ok " << options.size() << '\n';
  for (const auto& [name, opt] : options) {
    out << engine::uci::serializeOptionLine(opt);
    if (auto it = current.find(name); it != current.end())
      out << " current " << engine::toString(it->second);
    out << '\n';
  }
  out.flush();
}

void RequestDispatcher::setEngineOptions(const std::string& args, std::ostream& out) {
  engine::OptionList values;
  std::istringstream is(args);
  std::string entry;
  while (std::getline(is, entry, ';')) {
    entry = trim(entry);
    if (entry.empty()) continue;
    const auto eq = entry.find('=');
    const std::string name = trim(entry.substr(0, eq));
    const std::string text = eq == std::string::npos ? std::string() : trim(entry.substr(eq + 1));
    if (name.empty()) throw std::invalid_argument("option entry without a name: " + entry);
    values.emplace_back(name, m_bridge.coerceOptionValue(name, text));
  }
  if (values.empty()) throw std::invalid_argument("expected <name>=<value>[; ...]");

  const auto upd = m_bridge.setOptions(values);

  out << "ok " << upd.applied.size() + upd.errors.size() << '\n';
  for (const auto& [name, v] : upd.applied) out << "applied " << name << " = " << engine::toString(v) << '\n';
  for (const auto& [name, msg] : upd.errors) out << "rejected " << name << ": " << msg << '\n';
  out.flush();
}

void RequestDispatcher::newGame(const std::string&, std::ostream& out) {
  m_bridge.newGame();
  out << "ok" << std::endl;
}

}  // namespace ucibridge::app
