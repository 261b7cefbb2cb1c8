////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include "lhl/utils/environment_vars.hpp"

#include "lhl/utils/Error.hpp"

#include <stdlib.h>

#include <algorithm>
#include <iterator>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace
{

struct Setting
{
  char const* name;
  char const* default_value;
  char const* about;
};

// Every LHL_ variable the library reads.
constexpr Setting settings[] = {
  {"LOG_LEVEL",
   "warn",
   "Initial level of the lhl logger "
   "(trace, debug, info, warn, err, critical, off)"},
  {"DEBUG_BACKTRACE",
   "false",
   "Record a backtrace in every exception, not only in fatal ones"},
};

Setting const& find_setting(std::string const& name)
{
  auto const it = std::find_if(
    std::begin(settings), std::end(settings), [&name](Setting const& s) {
      return name == s.name;
    });
  LHL_ASSERT(it != std::end(settings),
             LHLNonfatalException,
             "Environment variable LHL_",
             name,
             " is not registered");
  return *it;
}

char const* raw_getenv(char const* name)
{
#ifdef _GNU_SOURCE
  return secure_getenv(name);
#else
  return getenv(name);
#endif
}

// What the environment held for each setting when it was first read.
// An empty optional means the variable was not set.
class SettingCache
{
public:
  std::optional<std::string> lookup(Setting const& setting)
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_values.find(setting.name);
    if (it == m_values.end())
    {
      char const* env =
        raw_getenv((std::string("LHL_") + setting.name).c_str());
      it = m_values
             .emplace(setting.name,
                      env == nullptr ? std::nullopt
                                     : std::optional<std::string>(env))
             .first;
    }
    return it->second;
  }

  void clear()
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_values.clear();
  }

private:
  std::mutex m_mutex;
  std::unordered_map<std::string, std::optional<std::string>> m_values;
};

SettingCache& setting_cache()
{
  // Function-local so it is ready before any static logger or
  // exception needs it.
  static SettingCache cache;
  return cache;
}

} // namespace

namespace lhl
{

namespace env
{

bool exists(std::string const& name)
{
  return setting_cache().lookup(find_setting(name)).has_value();
}

std::string get_raw(std::string const& name)
{
  Setting const& setting = find_setting(name);
  return setting_cache().lookup(setting).value_or(setting.default_value);
}

std::string get_default(std::string const& name)
{
  return find_setting(name).default_value;
}

std::string about(std::string const& name)
{
  return find_setting(name).about;
}

std::vector<std::string> registered()
{
  std::vector<std::string> names;
  names.reserve(std::size(settings));
  for (auto const& setting : settings)
  {
    names.emplace_back(setting.name);
  }
  return names;
}

void reload()
{
  setting_cache().clear();
}

namespace raw
{

bool exists(std::string const& name)
{
  return raw_getenv(name.c_str()) != nullptr;
}

std::string get_raw(std::string const& name)
{
  char const* env = raw_getenv(name.c_str());
  return env == nullptr ? std::string{} : std::string{env};
}

} // namespace raw

} // namespace env

} // namespace lhl
