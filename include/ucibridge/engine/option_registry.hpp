#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ucibridge/engine/uci_types.hpp"

namespace ucibridge::engine
{
  struct OptionUpdate
  {
    OptionValues applied;
    std::map<std::string, std::string> errors; // option name -> message
  };

  // Option metadata advertised during the handshake, plus the values the
  // bridge has sent since. The value cache is advisory: UCI cannot read back.
  class OptionRegistry
  {
  public:
    OptionRegistry() = default;
    explicit OptionRegistry(std::map<std::string, UciOption> metadata);

    const std::map<std::string, UciOption> &available() const { return m_meta; }
    const UciOption *find(const std::string &name) const;

    // Throws UnsupportedOptionError / InvalidOptionValueError.
    void validate(const std::string &name, const UciValue &v) const;

    // Per-key validation; a bad entry never blocks its siblings.
    OptionUpdate partition(const OptionList &values) const;

    // Text from config files and the request channel, typed by the option's
    // metadata. Unknown names and unparsable text come back as strings so
    // validate() reports them.
    UciValue coerce(const std::string &name, const std::string &text) const;

    void record(const std::string &name, const UciValue &v);
    const OptionValues &currentValues() const { return m_current; }

  private:
    std::map<std::string, UciOption> m_meta;
    OptionValues m_current;
  };

} // namespace ucibridge::engine
