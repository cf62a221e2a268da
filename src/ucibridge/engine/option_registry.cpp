#include "ucibridge/engine/option_registry.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <string_view>

#include "ucibridge/errors.hpp"

namespace ucibridge::engine
{
  namespace
  {
    std::string lower(std::string v)
    {
      std::transform(v.begin(), v.end(), v.begin(),
                     [](unsigned char c)
                     { return (char)std::tolower(c); });
      return v;
    }

    std::string quoted(const std::string &name)
    {
      return "'" + name + "'";
    }
  } // namespace

  OptionRegistry::OptionRegistry(std::map<std::string, UciOption> metadata)
      : m_meta(std::move(metadata))
  {
  }

  const UciOption *OptionRegistry::find(const std::string &name) const
  {
    auto it = m_meta.find(name);
    return it == m_meta.end() ? nullptr : &it->second;
  }

  void OptionRegistry::validate(const std::string &name, const UciValue &v) const
  {
    const UciOption *opt = find(name);
    if (!opt)
      throw UnsupportedOptionError("Unsupported option: " + name);

    using T = UciOption::Type;
    switch (opt->type)
    {
    case T::Check:
      if (!std::holds_alternative<bool>(v))
        throw InvalidOptionValueError("Option " + quoted(name) + " requires a boolean value");
      break;

    case T::Spin:
    {
      if (!std::holds_alternative<std::int64_t>(v))
        throw InvalidOptionValueError("Option " + quoted(name) + " requires an integer value");
      const auto x = std::get<std::int64_t>(v);
      if (opt->min && x < *opt->min)
        throw InvalidOptionValueError("Value " + std::to_string(x) + " is below minimum " +
                                      std::to_string(*opt->min) + " for option " + quoted(name));
      if (opt->max && x > *opt->max)
        throw InvalidOptionValueError("Value " + std::to_string(x) + " is above maximum " +
                                      std::to_string(*opt->max) + " for option " + quoted(name));
      break;
    }

    case T::Combo:
    {
      if (!std::holds_alternative<std::string>(v))
        throw InvalidOptionValueError("Option " + quoted(name) + " requires one of its listed values");
      const auto &s = std::get<std::string>(v);
      if (std::find(opt->vars.begin(), opt->vars.end(), s) == opt->vars.end())
      {
        std::ostringstream os;
        os << "Value " << quoted(s) << " is not allowed for option " << quoted(name) << " (allowed:";
        for (auto &a : opt->vars)
          os << ' ' << a;
        os << ')';
        throw InvalidOptionValueError(os.str());
      }
      break;
    }

    case T::String:
      if (!std::holds_alternative<std::string>(v) && !std::holds_alternative<std::monostate>(v))
        throw InvalidOptionValueError("Option " + quoted(name) + " requires a string value");
      break;

    case T::Button:
      break;
    }
  }

  OptionUpdate OptionRegistry::partition(const OptionList &values) const
  {
    OptionUpdate out;
    for (const auto &[name, value] : values)
    {
      try
      {
        validate(name, value);
        const UciOption *opt = find(name);
        out.applied[name] = opt->type == UciOption::Type::Button ? UciValue{} : value;
        out.errors.erase(name);
      }
      catch (const UnsupportedOptionError &e)
      {
        out.errors[name] = e.what();
        out.applied.erase(name);
      }
      catch (const InvalidOptionValueError &e)
      {
        out.errors[name] = e.what();
        out.applied.erase(name);
      }
    }
    return out;
  }

  UciValue OptionRegistry::coerce(const std::string &name, const std::string &text) const
  {
    const UciOption *opt = find(name);
    if (!opt)
      return text;

    using T = UciOption::Type;
    switch (opt->type)
    {
    case T::Check:
    {
      const std::string v = lower(text);
      if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
      if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
      return text;
    }
    case T::Spin:
    {
      std::string_view sv(text);
      if (!sv.empty() && sv.front() == '+')
        sv.remove_prefix(1);
      std::int64_t x = 0;
      auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), x);
      if (!sv.empty() && ec == std::errc() && ptr == sv.data() + sv.size())
        return x;
      return text;
    }
    case T::Button:
      return UciValue{};
    case T::Combo:
    case T::String:
      break;
    }
    return text;
  }

  void OptionRegistry::record(const std::string &name, const UciValue &v)
  {
    const UciOption *opt = find(name);
    if (opt && opt->type == UciOption::Type::Button)
      return;
    m_current[name] = v;
  }

} // namespace ucibridge::engine
