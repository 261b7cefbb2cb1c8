////////////////////////////////////////////////////////////////////////////////
// Copyright 2019-2024 Lawrence Livermore National Security, LLC and other
// LHList Project Developers. See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: Apache-2.0
////////////////////////////////////////////////////////////////////////////////

#include "lhl/utils/Logger.hpp"

#include "lhl/utils/Error.hpp"
#include "lhl/utils/environment_vars.hpp"
#include "lhl/utils/strings.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>

#include <spdlog/cfg/env.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#if __has_include(<unistd.h>)
#define LHL_LOGGER_HAS_UNISTD_H
#include <unistd.h>
#endif

namespace
{

#ifdef LHL_LOGGER_HAS_UNISTD_H
std::string get_hostname_raw()
{
  char buf[1024];
  if (gethostname(buf, 1024) != 0)
    throw std::runtime_error("gethostname failed.");
  auto end = std::find(buf, buf + 1024, '\0');
  return std::string{buf, end};
}

std::string const& get_hostname()
{
  static std::string const hostname = get_hostname_raw();
  return hostname;
}
#else
std::string const& get_hostname()
{
  static std::string const hostname = "<unknown>";
  return hostname;
}
#endif // LHL_LOGGER_HAS_UNISTD_H

class HostnameFlag final : public spdlog::custom_flag_formatter
{
public:
  void format(spdlog::details::log_msg const&,
              std::tm const&,
              spdlog::memory_buf_t& dest) final
  {
    auto const& hostname = get_hostname();
    dest.append(hostname.data(), hostname.data() + hostname.length());
  }

  std::unique_ptr<spdlog::custom_flag_formatter> clone() const final
  {
    return std::make_unique<HostnameFlag>();
  }
}; // class HostnameFlag

std::shared_ptr<spdlog::logger> make_logger()
{
  spdlog::sink_ptr console_sink =
    std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console_sink->set_level(spdlog::level::trace);

  auto formatter = std::make_unique<spdlog::pattern_formatter>();
  formatter->add_flag<HostnameFlag>('h').set_pattern("[%h:%P] [%n:%^%l%$] %v");
  console_sink->set_formatter(std::move(formatter));

  auto logger = std::make_shared<spdlog::logger>(
    std::string{"lhl"}, spdlog::sinks_init_list{console_sink});
  logger->set_level(
    lhl::internal::get_log_level(lhl::env::get_raw("LOG_LEVEL")));
  logger->flush_on(spdlog::level::err);
  spdlog::register_logger(logger);
  // SPDLOG_LEVEL=lhl=trace overrides LHL_LOG_LEVEL.
  spdlog::cfg::load_env_levels();

  return logger;
}

} // namespace

namespace lhl
{

spdlog::logger& logger()
{
  static auto logger = make_logger();
  return *logger;
}

namespace internal
{

spdlog::level::level_enum get_log_level(std::string const& level)
{
  std::string const name = str_toupper(str_trim(level));
  if (name == "TRACE")
    return spdlog::level::trace;
  if (name == "DEBUG")
    return spdlog::level::debug;
  if (name == "INFO")
    return spdlog::level::info;
  if (name == "WARN" || name == "WARNING")
    return spdlog::level::warn;
  if (name == "ERR" || name == "ERROR")
    return spdlog::level::err;
  if (name == "CRITICAL")
    return spdlog::level::critical;
  if (name == "OFF")
    return spdlog::level::off;
  throw LHLNonfatalException("Invalid log level: ", name);
}

std::string get_log_level_string(spdlog::level::level_enum level)
{
  switch (level)
  {
  case spdlog::level::trace: return "TRACE";
  case spdlog::level::debug: return "DEBUG";
  case spdlog::level::info: return "INFO";
  case spdlog::level::warn: return "WARN";
  case spdlog::level::err: return "ERROR";
  case spdlog::level::critical: return "CRITICAL";
  case spdlog::level::off: return "OFF";
  default:
    throw LHLNonfatalException("Invalid log level: ",
                               static_cast<int>(level));
  }
}

} // namespace internal

} // namespace lhl
