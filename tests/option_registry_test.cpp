#include <cassert>
#include <map>
#include <string>
#include <variant>

#include "ucibridge/engine/option_registry.hpp"
#include "ucibridge/engine/uci_protocol.hpp"
#include "ucibridge/errors.hpp"

using namespace ucibridge;
using namespace ucibridge::engine;

static OptionRegistry makeRegistry()
{
  uci::HandshakeAccumulator acc;
  acc.consume("option name Hash type spin default 16 min 1 max 33554432");
  acc.consume("option name Ponder type check default false");
  acc.consume("option name Style type combo default Normal var Solid var Normal var Risky");
  acc.consume("option name Clear Hash type button");
  acc.consume("option name SyzygyPath type string default <empty>");
  acc.consume("uciok");
  return OptionRegistry(acc.options);
}

static bool contains(const std::string &haystack, const char *needle)
{
  return haystack.find(needle) != std::string::npos;
}

int main()
{
  // Hash above its maximum is rejected; a valid value is applied and cached
  {
    OptionRegistry reg = makeRegistry();

    auto bad = reg.partition({{"Hash", std::int64_t{33554432 + 1000000}}});
    assert(bad.applied.empty());
    assert(bad.errors.size() == 1);
    assert(contains(bad.errors.at("Hash"), "above maximum"));

    auto good = reg.partition({{"Hash", std::int64_t{64}}});
    assert(good.errors.empty());
    assert(std::get<std::int64_t>(good.applied.at("Hash")) == 64);
    for (auto &[name, v] : good.applied)
      reg.record(name, v);
    assert(std::get<std::int64_t>(reg.currentValues().at("Hash")) == 64);
  }

  // applied and errors are disjoint and cover every input key exactly once
  {
    OptionRegistry reg = makeRegistry();
    OptionList in = {
        {"Hash", std::int64_t{0}},
        {"Ponder", true},
        {"Style", std::string("Risky")},
        {"Style2", std::string("x")},
        {"Clear Hash", UciValue{}},
        {"SyzygyPath", std::string("/tb")},
        {"Ponder", std::string("yes")}, // later entry for the same key wins
    };
    auto upd = reg.partition(in);

    std::map<std::string, int> seen;
    for (auto &kv : upd.applied)
      ++seen[kv.first];
    for (auto &kv : upd.errors)
      ++seen[kv.first];
    assert(seen.size() == 6);
    for (auto &kv : seen)
      assert(kv.second == 1);

    assert(contains(upd.errors.at("Hash"), "below minimum"));
    assert(contains(upd.errors.at("Style2"), "Unsupported option"));
    assert(contains(upd.errors.at("Ponder"), "boolean"));
    assert(upd.applied.count("Style") == 1);
    assert(upd.applied.count("Clear Hash") == 1);
    assert(upd.applied.count("SyzygyPath") == 1);
  }

  // Type checks per option kind
  {
    OptionRegistry reg = makeRegistry();
    bool threw = false;
    try
    {
      reg.validate("Style", std::string("Wild"));
    }
    catch (const InvalidOptionValueError &)
    {
      threw = true;
    }
    assert(threw);

    threw = false;
    try
    {
      reg.validate("Nope", true);
    }
    catch (const UnsupportedOptionError &)
    {
      threw = true;
    }
    assert(threw);

    reg.validate("SyzygyPath", UciValue{});
    reg.validate("Clear Hash", std::int64_t{5}); // buttons carry no value
    reg.validate("Hash", std::int64_t{33554432});
  }

  // Text coercion follows the advertised type
  {
    OptionRegistry reg = makeRegistry();
    assert(std::get<std::int64_t>(reg.coerce("Hash", "128")) == 128);
    assert(std::holds_alternative<std::string>(reg.coerce("Hash", "lots")));
    assert(std::get<bool>(reg.coerce("Ponder", "true")));
    assert(!std::get<bool>(reg.coerce("Ponder", "off")));
    assert(std::get<std::string>(reg.coerce("Style", "Solid")) == "Solid");
    assert(std::holds_alternative<std::monostate>(reg.coerce("Clear Hash", "")));
    assert(std::get<std::string>(reg.coerce("Unknown", "1")) == "1");
  }

  // Buttons are never cached
  {
    OptionRegistry reg = makeRegistry();
    reg.record("Clear Hash", UciValue{});
    assert(reg.currentValues().empty());
  }

  return 0;
}
